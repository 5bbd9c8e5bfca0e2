#include "lusolve/triangular.hpp"

namespace lusolve {
namespace {
ErrorCode check_shapes(MatrixView m, VectorView b, VectorMutView x) noexcept {
		if (!m.data || !b.data || !x.data)
				return ErrorCode::Internal;
		if (!m.square())
				return ErrorCode::NotSquare;
		if (b.size != m.rows || x.size != m.rows)
				return ErrorCode::DimensionMismatch;
		return ErrorCode::Ok;
}
} // namespace

ErrorCode forward_substitute(MatrixView l, VectorView b, VectorMutView x) noexcept {
		ErrorCode ec = check_shapes(l, b, x);
		if (!is_ok(ec))
				return ec;

		const Index n = l.rows;
		for (Index i = 0; i < n; i++) {
				double row_sum = 0.0;
				for (Index j = 0; j < i; j++)
						row_sum += l.at(i, j) * x.at(j);
				x.at_mut(i) = (b.at(i) - row_sum) / l.at(i, i);
		}
		return ErrorCode::Ok;
}

ErrorCode backward_substitute(MatrixView u, VectorView b, VectorMutView x) noexcept {
		ErrorCode ec = check_shapes(u, b, x);
		if (!is_ok(ec))
				return ec;

		const Index n = u.rows;
		for (Index step = 0; step < n; step++) {
				const Index i = static_cast<Index>(n - 1 - step);
				double row_sum = 0.0;
				for (Index j = static_cast<Index>(i + 1); j < n; j++)
						row_sum += u.at(i, j) * x.at(j);
				x.at_mut(i) = (b.at(i) - row_sum) / u.at(i, i);
		}
		return ErrorCode::Ok;
}

} // namespace lusolve
