#include "lusolve/lu.hpp"

#include "lusolve/lu_detail.hpp"

#include <cmath>

namespace lusolve {
namespace detail {

Index argmax_abs_column(MatrixView m, Index col) noexcept {
		Index best = 0;
		double best_mag = std::fabs(m.at(0, col));
		for (Index row = 1; row < m.rows; row++) {
				const double mag = std::fabs(m.at(row, col));
				if (mag > best_mag) {
						best = row;
						best_mag = mag;
				}
		}
		return best;
}

Error lu_pivoted_eliminate(MatrixMutView ak, MatrixMutView l_raw, MatrixMutView u, PermutationMutView p, PivotObserver* obs) noexcept {
		Error err;
		const Index n = ak.rows;

		for (Index k = 0; k + 1 < n; k++) {
				const Index pr = argmax_abs_column(ak.view(), k);
				const double pivot = ak.at(pr, k);
				if (pivot == 0.0)
						return err_singular(ak.dim(), k);
				p.at_mut(k) = pr;

				// columns left of k only hold rounding residue, U keeps them zero
				for (Index j = k; j < n; j++)
						u.at_mut(k, j) = ak.at(pr, j);

				// full row range: rows already used as pivots are zero in column k
				// and get a zero multiplier, the pivot row itself gets 1 and is
				// eliminated to exactly zero
				for (Index i = 0; i < n; i++) {
						const double lik = ak.at(i, k) / pivot;
						l_raw.at_mut(i, k) = lik;
						if (lik == 0.0)
								continue;
						for (Index j = k; j < n; j++)
								ak.at_mut(i, j) -= lik * u.at(k, j);
				}

				if (obs && !obs->on_step({k, pr, pivot}))
						return err;
		}

		const Index last = static_cast<Index>(n - 1);
		const Index pr = argmax_abs_column(ak.view(), last);
		const double pivot = ak.at(pr, last);
		if (pivot == 0.0)
				return err_singular(ak.dim(), last);
		p.at_mut(last) = pr;
		u.at_mut(last, last) = pivot;
		for (Index i = 0; i < n; i++)
				l_raw.at_mut(i, last) = ak.at(i, last) / pivot;

		if (obs)
				(void)obs->on_step({last, pr, pivot});
		return err;
}

} // namespace detail

Error factorize_lu_pivoted(MatrixView a, Arena& scratch, PivotedLuFactors out) noexcept {
		if (!a.data || !out.l.data || !out.u.data || !out.p.rows)
				return {ErrorCode::Internal};
		if (!a.square())
				return err_not_square(a.dim());
		if (a.rows < 1 || a.rows > kMaxDim)
				return err_invalid_dim(a.dim());
		if (out.l.rows != a.rows || out.l.cols != a.cols)
				return err_dim_mismatch(a.dim(), out.l.dim());
		if (out.u.rows != a.rows || out.u.cols != a.cols)
				return err_dim_mismatch(a.dim(), out.u.dim());
		if (out.p.size != a.rows)
				return err_dim_mismatch(a.dim(), {out.p.size, 1});

		ArenaScope scratch_scope(scratch);
		MatrixMutView ak;
		ErrorCode ec = matrix_clone(scratch, a, &ak);
		if (!is_ok(ec))
				return err_from(ec, a.dim());
		MatrixMutView l_raw;
		ec = matrix_alloc(scratch, a.rows, a.cols, &l_raw);
		if (!is_ok(ec))
				return err_from(ec, a.dim());

		matrix_fill_zero(out.u);
		Error err = detail::lu_pivoted_eliminate(ak, l_raw, out.u, out.p, nullptr);
		if (!is_ok(err))
				return err;

		// L = L_raw[p, :] turns the multipliers into unit lower triangular form
		ec = apply_permutation_rows(out.p.view(), l_raw.view(), out.l);
		if (!is_ok(ec))
				return err_from(ec, a.dim());
		return err;
}

} // namespace lusolve
