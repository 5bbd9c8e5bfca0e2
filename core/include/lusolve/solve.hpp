#pragma once

#include "lusolve/arena.hpp"
#include "lusolve/error.hpp"
#include "lusolve/lu.hpp"
#include "lusolve/matrix.hpp"

namespace lusolve {

// A x = b for square nonsingular A:
//   P A = L U,  b' = P b,  L z = b',  U x = z
//
// Singular when the pivoted factorization finds an exactly zero pivot.
// scratch holds the factors and is rewound on return
Error solve(In MatrixView a, In VectorView b, InOut Arena& scratch, Out VectorMutView x) noexcept;

// re-solve with factors from factorize_lu_pivoted(), O(n^2) instead of O(n^3)
Error solve_factored(In const PivotedLuView& f, In VectorView b, InOut Arena& scratch, Out VectorMutView x) noexcept;

// A^{-1} one column at a time: factor once, then solve_factored() against each
// unit vector e_j. O(n^3)
Error invert(In MatrixView a, InOut Arena& scratch, Out MatrixMutView out) noexcept;

struct SolveReport {
		double condition = 0.0;   // kappa(A), NaN when the analyzer is compiled out
		double error_bound = 0.0; // kappa(A) * eps, predicted ||x - x~|| / ||x||
		double residual = 0.0;    // ||A x - b|| / ||b||
		bool ill_conditioned = false;
};

// solve() plus the trust assessment:
// - malformed input (shape errors) is rejected before any work
// - exactly singular input returns Singular and leaves x untouched
// - otherwise x is written and report says how far it can be trusted.
//   ill-conditioned input is not an error
Error solve_checked(In MatrixView a, In VectorView b, InOut Arena& scratch, Out VectorMutView x, Out SolveReport* report) noexcept;

} // namespace lusolve
