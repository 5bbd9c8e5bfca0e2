#include "lusolve/lu.hpp"

#include "lusolve/lu_detail.hpp"

namespace lusolve {
namespace detail {

void lu_eliminate(MatrixMutView l, MatrixMutView u, Index nstep) noexcept {
		const Index n = u.rows;
		for (Index k = 0; k + 1 < n; k++) {
				if (k >= nstep)
						break;

				l.at_mut(k, k) = 1.0;
				const double pivot = u.at(k, k);
				// rows below k are independent rank-1 updates with the single
				// multiplier L_ik. columns left of k are already zero in rows > k
				for (Index i = static_cast<Index>(k + 1); i < n; i++) {
						const double lik = u.at(i, k) / pivot;
						l.at_mut(i, k) = lik;
						for (Index j = k; j < n; j++)
								u.at_mut(i, j) -= lik * u.at(k, j);
				}
		}
		if (nstep >= n)
				l.at_mut(static_cast<Index>(n - 1), static_cast<Index>(n - 1)) = 1.0;
}

} // namespace detail

namespace {
Error check_factor_shapes(MatrixView a, MatrixMutView l, MatrixMutView u) noexcept {
		if (!a.data || !l.data || !u.data)
				return {ErrorCode::Internal};
		if (!a.square())
				return err_not_square(a.dim());
		if (a.rows < 1 || a.rows > kMaxDim)
				return err_invalid_dim(a.dim());
		if (l.rows != a.rows || l.cols != a.cols)
				return err_dim_mismatch(a.dim(), l.dim());
		if (u.rows != a.rows || u.cols != a.cols)
				return err_dim_mismatch(a.dim(), u.dim());
		return {};
}
} // namespace

ErrorCode lu_factors_alloc(Arena& arena, Index n, LuFactors* out) noexcept {
		if (!out)
				return ErrorCode::Internal;
		ErrorCode ec = matrix_alloc(arena, n, n, &out->l);
		if (!is_ok(ec))
				return ec;
		return matrix_alloc(arena, n, n, &out->u);
}

ErrorCode pivoted_lu_factors_alloc(Arena& arena, Index n, PivotedLuFactors* out) noexcept {
		if (!out)
				return ErrorCode::Internal;
		ErrorCode ec = matrix_alloc(arena, n, n, &out->l);
		if (!is_ok(ec))
				return ec;
		ec = matrix_alloc(arena, n, n, &out->u);
		if (!is_ok(ec))
				return ec;
		return permutation_alloc(arena, n, &out->p);
}

Error factorize_lu(MatrixView a, LuFactors out) noexcept {
		return factorize_lu_steps(a, a.rows, out);
}

Error factorize_lu_steps(MatrixView a, Index nstep, LuFactors out) noexcept {
		Error err = check_factor_shapes(a, out.l, out.u);
		if (!is_ok(err))
				return err;

		matrix_fill_zero(out.l);
		ErrorCode ec = matrix_copy(a, out.u);
		if (!is_ok(ec))
				return err_from(ec, a.dim());

		detail::lu_eliminate(out.l, out.u, nstep);
		return err;
}

ErrorCode lu_reconstruct(MatrixView l, MatrixView u, MatrixMutView out) noexcept {
		if (!l.data || !u.data || !out.data)
				return ErrorCode::Internal;
		if (!l.square() || !u.square())
				return ErrorCode::NotSquare;
		if (l.rows != u.rows || out.rows != l.rows || out.cols != l.cols)
				return ErrorCode::DimensionMismatch;

		const Index n = l.rows;
		for (Index i = 0; i < n; i++) {
				for (Index j = 0; j < n; j++) {
						const Index kmax = (i < j) ? i : j;
						double sum = 0.0;
						for (Index k = 0; k <= kmax; k++)
								sum += l.at(i, k) * u.at(k, j);
						out.at_mut(i, j) = sum;
				}
		}
		return ErrorCode::Ok;
}

} // namespace lusolve
