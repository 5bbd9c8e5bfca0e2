#include "lusolve/matrix.hpp"

#include <cmath>
#include <functional>

namespace lusolve {
namespace {
constexpr bool valid_dim(Index rows, Index cols) noexcept {
		return rows >= 1 && rows <= kMaxDim && cols >= 1 && cols <= kMaxDim;
}

// [first, last) of the doubles a view reaches, empty for empty views
struct Span {
		const double* first = nullptr;
		const double* last = nullptr;
};

Span span_of(MatrixView m) noexcept {
		if (!m.data || m.rows == 0 || m.cols == 0)
				return {};
		return {m.data, m.data + static_cast<std::size_t>(m.rows - 1) * m.stride + m.cols};
}

Span span_of(VectorView v) noexcept {
		if (!v.data || v.size == 0)
				return {};
		return {v.data, v.data + v.size};
}

bool overlaps(Span a, Span b) noexcept {
		if (!a.first || !b.first)
				return false;
		const std::less<const double*> before;
		return before(a.first, b.last) && before(b.first, a.last);
}
} // namespace

ErrorCode matrix_alloc(Arena& arena, Index rows, Index cols, MatrixMutView* out) noexcept {
		if (!out)
				return ErrorCode::Internal;
		if (!valid_dim(rows, cols))
				return ErrorCode::InvalidDimension;

		const std::size_t count = static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols);
		double* data = arena.allocate_array<double>(count);
		if (!data)
				return ErrorCode::Overflow;

		out->rows = rows;
		out->cols = cols;
		out->stride = cols;
		out->data = data;
		return ErrorCode::Ok;
}

ErrorCode matrix_clone(Arena& arena, MatrixView src, MatrixMutView* out) noexcept {
		if (!out)
				return ErrorCode::Internal;
		MatrixMutView dst;
		ErrorCode ec = matrix_alloc(arena, src.rows, src.cols, &dst);
		if (!is_ok(ec))
				return ec;
		ec = matrix_copy(src, dst);
		if (!is_ok(ec))
				return ec;
		*out = dst;
		return ErrorCode::Ok;
}

ErrorCode matrix_copy(MatrixView src, MatrixMutView dst) noexcept {
		if (!src.data || !dst.data)
				return ErrorCode::Internal;
		if (src.rows != dst.rows || src.cols != dst.cols)
				return ErrorCode::DimensionMismatch;

		for (Index row = 0; row < src.rows; row++) {
				for (Index col = 0; col < src.cols; col++)
						dst.at_mut(row, col) = src.at(row, col);
		}
		return ErrorCode::Ok;
}

void matrix_fill_zero(MatrixMutView m) noexcept {
		if (!m.data)
				return;
		for (Index row = 0; row < m.rows; row++) {
				for (Index col = 0; col < m.cols; col++)
						m.at_mut(row, col) = 0.0;
		}
}

ErrorCode matrix_set_identity(MatrixMutView m) noexcept {
		if (!m.data)
				return ErrorCode::Internal;
		if (!m.square())
				return ErrorCode::NotSquare;
		matrix_fill_zero(m);
		for (Index k = 0; k < m.rows; k++)
				m.at_mut(k, k) = 1.0;
		return ErrorCode::Ok;
}

ErrorCode vector_alloc(Arena& arena, Index size, VectorMutView* out) noexcept {
		if (!out)
				return ErrorCode::Internal;
		if (size < 1 || size > kMaxDim)
				return ErrorCode::InvalidDimension;

		double* data = arena.allocate_array<double>(size);
		if (!data)
				return ErrorCode::Overflow;

		out->size = size;
		out->data = data;
		return ErrorCode::Ok;
}

ErrorCode vector_clone(Arena& arena, VectorView src, VectorMutView* out) noexcept {
		if (!out)
				return ErrorCode::Internal;
		VectorMutView dst;
		ErrorCode ec = vector_alloc(arena, src.size, &dst);
		if (!is_ok(ec))
				return ec;
		ec = vector_copy(src, dst);
		if (!is_ok(ec))
				return ec;
		*out = dst;
		return ErrorCode::Ok;
}

ErrorCode vector_copy(VectorView src, VectorMutView dst) noexcept {
		if (!src.data || !dst.data)
				return ErrorCode::Internal;
		if (src.size != dst.size)
				return ErrorCode::DimensionMismatch;
		for (Index i = 0; i < src.size; i++)
				dst.at_mut(i) = src.at(i);
		return ErrorCode::Ok;
}

ErrorCode matrix_mul(MatrixView a, MatrixView b, MatrixMutView out) noexcept {
		const Span dst = span_of(out.view());
		if (overlaps(dst, span_of(a)) || overlaps(dst, span_of(b)))
				return ErrorCode::Internal;
		if (a.cols != b.rows)
				return ErrorCode::DimensionMismatch;
		if (out.rows != a.rows || out.cols != b.cols)
				return ErrorCode::DimensionMismatch;

		for (Index i = 0; i < out.rows; i++) {
				for (Index j = 0; j < out.cols; j++) {
						double sum = 0.0;
						for (Index k = 0; k < a.cols; k++)
								sum += a.at(i, k) * b.at(k, j);
						out.at_mut(i, j) = sum;
				}
		}
		return ErrorCode::Ok;
}

ErrorCode matrix_transpose(MatrixView a, MatrixMutView out) noexcept {
		if (overlaps(span_of(out.view()), span_of(a)))
				return ErrorCode::Internal;
		if (out.rows != a.cols || out.cols != a.rows)
				return ErrorCode::DimensionMismatch;

		for (Index row = 0; row < a.rows; row++) {
				for (Index col = 0; col < a.cols; col++)
						out.at_mut(col, row) = a.at(row, col);
		}
		return ErrorCode::Ok;
}

ErrorCode matrix_vector_mul(MatrixView a, VectorView x, VectorMutView out) noexcept {
		const Span dst = span_of(out.view());
		if (overlaps(dst, span_of(a)) || overlaps(dst, span_of(x)))
				return ErrorCode::Internal;
		if (a.cols != x.size || out.size != a.rows)
				return ErrorCode::DimensionMismatch;

		for (Index i = 0; i < a.rows; i++) {
				double sum = 0.0;
				for (Index j = 0; j < a.cols; j++)
						sum += a.at(i, j) * x.at(j);
				out.at_mut(i) = sum;
		}
		return ErrorCode::Ok;
}

ErrorCode vector_sub(VectorView a, VectorView b, VectorMutView out) noexcept {
		if (a.size != b.size || out.size != a.size)
				return ErrorCode::DimensionMismatch;
		for (Index i = 0; i < a.size; i++)
				out.at_mut(i) = a.at(i) - b.at(i);
		return ErrorCode::Ok;
}

ErrorCode vector_dot(VectorView u, VectorView v, double* out) noexcept {
		if (!out)
				return ErrorCode::Internal;
		if (u.size != v.size)
				return ErrorCode::DimensionMismatch;

		double sum = 0.0;
		for (Index i = 0; i < u.size; i++)
				sum += u.at(i) * v.at(i);
		*out = sum;
		return ErrorCode::Ok;
}

double vector_norm2(VectorView v) noexcept {
		double scale = 0.0;
		for (Index i = 0; i < v.size; i++) {
				const double mag = std::fabs(v.at(i));
				if (std::isnan(mag))
						return mag;
				if (mag > scale)
						scale = mag;
		}
		if (scale == 0.0 || !std::isfinite(scale))
				return scale;

		double sum = 0.0;
		for (Index i = 0; i < v.size; i++) {
				const double t = v.at(i) / scale;
				sum += t * t;
		}
		return scale * std::sqrt(sum);
}

ErrorCode matrix_max_abs_diff(MatrixView a, MatrixView b, double* out) noexcept {
		if (!out)
				return ErrorCode::Internal;
		if (a.rows != b.rows || a.cols != b.cols)
				return ErrorCode::DimensionMismatch;

		double worst = 0.0;
		for (Index row = 0; row < a.rows; row++) {
				for (Index col = 0; col < a.cols; col++) {
						const double d = std::fabs(a.at(row, col) - b.at(row, col));
						// a NaN entry makes the whole difference NaN
						if (std::isnan(d)) {
								*out = d;
								return ErrorCode::Ok;
						}
						if (d > worst)
								worst = d;
				}
		}
		*out = worst;
		return ErrorCode::Ok;
}

bool matrix_is_finite(MatrixView m) noexcept {
		for (Index row = 0; row < m.rows; row++) {
				for (Index col = 0; col < m.cols; col++) {
						if (!std::isfinite(m.at(row, col)))
								return false;
				}
		}
		return true;
}

bool vector_is_finite(VectorView v) noexcept {
		for (Index i = 0; i < v.size; i++) {
				if (!std::isfinite(v.at(i)))
						return false;
		}
		return true;
}

bool matrix_is_symmetric(MatrixView m, double tol) noexcept {
		if (!m.square())
				return false;
		for (Index row = 0; row < m.rows; row++) {
				for (Index col = static_cast<Index>(row + 1); col < m.cols; col++) {
						if (!(std::fabs(m.at(row, col) - m.at(col, row)) <= tol))
								return false;
				}
		}
		return true;
}

} // namespace lusolve
