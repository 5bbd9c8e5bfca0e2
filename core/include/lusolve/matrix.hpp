#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>

#include "lusolve/arena.hpp"
#include "lusolve/config.hpp"
#include "lusolve/error.hpp"

namespace lusolve {
// row major, stride >= cols
struct MatrixView {
		Index rows = 0;
		Index cols = 0;
		Index stride = 0;
		const double* data = nullptr;

		constexpr Dim dim() const noexcept { return {rows, cols}; }
		constexpr bool square() const noexcept { return rows == cols; }

		double at(Index r, Index c) const noexcept {
				assert(data);
				assert(r < rows);
				assert(c < cols);
				return data[static_cast<std::size_t>(r) * stride + static_cast<std::size_t>(c)];
		}
};

struct MatrixMutView {
		Index rows = 0;
		Index cols = 0;
		Index stride = 0;
		double* data = nullptr;

		MatrixView view() const noexcept { return {rows, cols, stride, data}; }

		constexpr Dim dim() const noexcept { return {rows, cols}; }
		constexpr bool square() const noexcept { return rows == cols; }

		double at(Index r, Index c) const noexcept {
				assert(data);
				assert(r < rows);
				assert(c < cols);
				return data[static_cast<std::size_t>(r) * stride + static_cast<std::size_t>(c)];
		}

		double& at_mut(Index r, Index c) noexcept {
				assert(data);
				assert(r < rows);
				assert(c < cols);
				return data[static_cast<std::size_t>(r) * stride + static_cast<std::size_t>(c)];
		}
};

struct VectorView {
		Index size = 0;
		const double* data = nullptr;

		double at(Index i) const noexcept {
				assert(data);
				assert(i < size);
				return data[i];
		}
};

struct VectorMutView {
		Index size = 0;
		double* data = nullptr;

		VectorView view() const noexcept { return {size, data}; }

		double at(Index i) const noexcept {
				assert(data);
				assert(i < size);
				return data[i];
		}

		double& at_mut(Index i) noexcept {
				assert(data);
				assert(i < size);
				return data[i];
		}
};

// dense row major view over caller storage of rows*cols doubles
constexpr MatrixView matrix_view(const double* data, Index rows, Index cols) noexcept {
		return {rows, cols, cols, data};
}
constexpr MatrixMutView matrix_mut_view(double* data, Index rows, Index cols) noexcept {
		return {rows, cols, cols, data};
}

ErrorCode matrix_alloc(InOut Arena& arena, In Index rows, In Index cols, Out MatrixMutView* out) noexcept;
ErrorCode matrix_clone(InOut Arena& arena, In MatrixView src, Out MatrixMutView* out) noexcept;
ErrorCode matrix_copy(In MatrixView src, Out MatrixMutView dst) noexcept;
void matrix_fill_zero(Out MatrixMutView m) noexcept;
ErrorCode matrix_set_identity(Out MatrixMutView m) noexcept;

ErrorCode vector_alloc(InOut Arena& arena, In Index size, Out VectorMutView* out) noexcept;
ErrorCode vector_clone(InOut Arena& arena, In VectorView src, Out VectorMutView* out) noexcept;
ErrorCode vector_copy(In VectorView src, Out VectorMutView dst) noexcept;

// the products and the transpose read their inputs while writing out, so out
// must not share storage with them. Internal when it does

// C = A B, O(n^3) for square operands
ErrorCode matrix_mul(In MatrixView a, In MatrixView b, Out MatrixMutView out) noexcept;
ErrorCode matrix_transpose(In MatrixView a, Out MatrixMutView out) noexcept;

// y = A x, O(n^2)
ErrorCode matrix_vector_mul(In MatrixView a, In VectorView x, Out VectorMutView out) noexcept;

// out = a - b
ErrorCode vector_sub(In VectorView a, In VectorView b, Out VectorMutView out) noexcept;

// scalar product u^T v, O(n)
ErrorCode vector_dot(In VectorView u, In VectorView v, Out double* out) noexcept;

// euclidean norm, scaled so huge or tiny entries do not over/underflow.
// NaN when any entry is NaN, +Inf for an Inf entry
double vector_norm2(In VectorView v) noexcept;

// max_ij |a_ij - b_ij|
ErrorCode matrix_max_abs_diff(In MatrixView a, In MatrixView b, Out double* out) noexcept;

bool matrix_is_finite(In MatrixView m) noexcept;
bool vector_is_finite(In VectorView v) noexcept;

// |a_ij - a_ji| <= tol for all i, j. false for non-square input
bool matrix_is_symmetric(In MatrixView m, In double tol) noexcept;

} // namespace lusolve
