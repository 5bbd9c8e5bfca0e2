#pragma once

#include <cstddef>

#include "lusolve/error.hpp"
#include "lusolve/matrix.hpp"
#include "lusolve/permutation.hpp"

// internal helpers shared by the factorizers and the step explanations

namespace lusolve::detail {

struct PivotStep {
		Index step = 0;
		Index pivot_row = 0;
		double pivot = 0.0;
};

// tracks pivot steps, stops the elimination after `target` steps (1 based)
struct PivotObserver {
		std::size_t target = static_cast<std::size_t>(-1);
		std::size_t count = 0;
		PivotStep last{};

		bool on_step(const PivotStep& s) noexcept {
				count++;
				last = s;
				return count != target;
		}
};

// row with the largest |m_ik| over all rows, lowest index on ties
Index argmax_abs_column(In MatrixView m, In Index col) noexcept;

// runs the unpivoted elimination on u in place for k < nstep, writing
// multipliers into l. l must be zeroed by the caller
void lu_eliminate(InOut MatrixMutView l, InOut MatrixMutView u, In Index nstep) noexcept;

// runs the pivoted elimination on the working copy ak. l_raw keeps the rows in
// the original order of A (not yet reordered by p). u and l_raw must be zeroed
// by the caller. when obs stops early the outputs hold the partial state
//
// returns Singular with err.i = step on an exactly zero pivot
Error lu_pivoted_eliminate(InOut MatrixMutView ak,
        Out MatrixMutView l_raw,
        Out MatrixMutView u,
        Out PermutationMutView p,
        InOut PivotObserver* obs) noexcept;

} // namespace lusolve::detail
