#pragma once

#include "lusolve/error.hpp"
#include "lusolve/matrix.hpp"

namespace lusolve {

// solves L x = b for lower triangular L (n x n), walking i = 0..n-1:
//   x_i = (b_i - sum_{j<i} L_ij x_j) / L_ii
//
// only the lower triangle (diagonal included) of L is read. a zero on the
// diagonal is not reported: the division yields Inf/NaN which propagates into
// x, callers check vector_is_finite(). x may alias b
//
// cost O(n^2). x_i depends on every earlier x_j so the outer loop is strictly
// sequential
ErrorCode forward_substitute(In MatrixView l, In VectorView b, Out VectorMutView x) noexcept;

// solves U x = b for upper triangular U, walking i = n-1 down to 0:
//   x_i = (b_i - sum_{j>i} U_ij x_j) / U_ii
//
// reads only the upper triangle. same non-finite policy as forward_substitute
ErrorCode backward_substitute(In MatrixView u, In VectorView b, Out VectorMutView x) noexcept;

} // namespace lusolve
