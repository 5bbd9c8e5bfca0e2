#pragma once

#include "lusolve/arena.hpp"
#include "lusolve/error.hpp"
#include "lusolve/matrix.hpp"
#include "lusolve/permutation.hpp"

namespace lusolve {

// L unit lower triangular, U upper triangular, L U = A
struct LuFactors {
		MatrixMutView l;
		MatrixMutView u;
};

struct PivotedLuView {
		MatrixView l;
		MatrixView u;
		PermutationView p;
};

// L unit lower triangular, U upper triangular, L U = P A with P built from p
struct PivotedLuFactors {
		MatrixMutView l;
		MatrixMutView u;
		PermutationMutView p;

		PivotedLuView view() const noexcept { return {l.view(), u.view(), p.view()}; }
};

ErrorCode lu_factors_alloc(InOut Arena& arena, In Index n, Out LuFactors* out) noexcept;
ErrorCode pivoted_lu_factors_alloc(InOut Arena& arena, In Index n, Out PivotedLuFactors* out) noexcept;

// outer product elimination without pivoting. for k = 0..n-2 and i > k:
//   L_ik = U_ik / U_kk,  U_ij -= L_ik U_kj  (j = k..n-1)
// starting from U = A. O(n^3) time, O(n^2) space
//
// a zero pivot U_kk is NOT detected. the multipliers become Inf/NaN and poison
// the rest of the factors, check matrix_is_finite() on both outputs or use
// factorize_lu_pivoted(). entries of U below the diagonal are left as the
// elimination produced them (zero up to rounding) and are never read by the
// triangular solvers
Error factorize_lu(In MatrixView a, Out LuFactors out) noexcept;

// same elimination stopped after nstep outer steps (k < nstep). L_{n-1,n-1} is
// only set once nstep >= n, matching the complete factorization. nstep == 0
// returns U = A and L = 0
Error factorize_lu_steps(In MatrixView a, In Index nstep, Out LuFactors out) noexcept;

// row pivoted LU. at step k the pivot row p[k] is the row with the largest
// |A_ik| in column k of the working copy, searched over all rows with ties
// going to the lowest index. rows are not swapped in place: each pivot row is
// copied into U and eliminated to zero, L is reordered by p at the end
//
// every multiplier of a row not yet used as pivot satisfies |L_ik| <= 1,
// multipliers of used rows are exactly 0
//
// returns Singular (err.i = step) when the largest candidate is exactly zero
Error factorize_lu_pivoted(In MatrixView a, InOut Arena& scratch, Out PivotedLuFactors out) noexcept;

// out = L U reading only the lower triangle of L and the upper triangle of U
ErrorCode lu_reconstruct(In MatrixView l, In MatrixView u, Out MatrixMutView out) noexcept;

} // namespace lusolve
