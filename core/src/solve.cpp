#include "lusolve/solve.hpp"

#include "lusolve/condition.hpp"
#include "lusolve/permutation.hpp"
#include "lusolve/triangular.hpp"

#include <limits>

namespace lusolve {
namespace {
Error check_system(MatrixView a, VectorView b, VectorMutView x) noexcept {
		if (!a.data || !b.data || !x.data)
				return {ErrorCode::Internal};
		if (a.rows < 1 || a.rows > kMaxDim || a.cols < 1 || a.cols > kMaxDim)
				return err_invalid_dim(a.dim());
		if (!a.square())
				return err_not_square(a.dim());
		if (b.size != a.rows)
				return err_dim_mismatch(a.dim(), {b.size, 1});
		if (x.size != a.rows)
				return err_dim_mismatch(a.dim(), {x.size, 1});
		return {};
}
} // namespace

Error solve_factored(const PivotedLuView& f, VectorView b, Arena& scratch, VectorMutView x) noexcept {
		if (!f.l.data || !f.u.data || !f.p.rows)
				return {ErrorCode::Internal};
		Error err = check_system(f.u, b, x);
		if (!is_ok(err))
				return err;
		if (f.l.rows != f.u.rows || f.l.cols != f.u.cols)
				return err_dim_mismatch(f.l.dim(), f.u.dim());
		if (f.p.size != f.u.rows)
				return err_dim_mismatch(f.u.dim(), {f.p.size, 1});

		ArenaScope scratch_scope(scratch);
		VectorMutView pb;
		ErrorCode ec = vector_alloc(scratch, b.size, &pb);
		if (!is_ok(ec))
				return err_from(ec, f.u.dim());

		ec = apply_permutation(f.p, b, pb);
		if (!is_ok(ec))
				return err_from(ec, f.u.dim());
		// z overwrites P b in place
		ec = forward_substitute(f.l, pb.view(), pb);
		if (!is_ok(ec))
				return err_from(ec, f.l.dim());
		ec = backward_substitute(f.u, pb.view(), x);
		if (!is_ok(ec))
				return err_from(ec, f.u.dim());
		return err;
}

Error solve(MatrixView a, VectorView b, Arena& scratch, VectorMutView x) noexcept {
		Error err = check_system(a, b, x);
		if (!is_ok(err))
				return err;

		ArenaScope scratch_scope(scratch);
		PivotedLuFactors f;
		ErrorCode ec = pivoted_lu_factors_alloc(scratch, a.rows, &f);
		if (!is_ok(ec))
				return err_from(ec, a.dim());

		err = factorize_lu_pivoted(a, scratch, f);
		if (!is_ok(err))
				return err;
		return solve_factored(f.view(), b, scratch, x);
}

Error invert(MatrixView a, Arena& scratch, MatrixMutView out) noexcept {
		if (!a.data || !out.data)
				return {ErrorCode::Internal};
		if (!a.square())
				return err_not_square(a.dim());
		if (out.rows != a.rows || out.cols != a.cols)
				return err_dim_mismatch(a.dim(), out.dim());

		ArenaScope scratch_scope(scratch);
		PivotedLuFactors f;
		ErrorCode ec = pivoted_lu_factors_alloc(scratch, a.rows, &f);
		if (!is_ok(ec))
				return err_from(ec, a.dim());
		Error err = factorize_lu_pivoted(a, scratch, f);
		if (!is_ok(err))
				return err;

		VectorMutView e;
		VectorMutView col;
		ec = vector_alloc(scratch, a.rows, &e);
		if (is_ok(ec))
				ec = vector_alloc(scratch, a.rows, &col);
		if (!is_ok(ec))
				return err_from(ec, a.dim());

		for (Index j = 0; j < a.cols; j++) {
				for (Index i = 0; i < a.rows; i++)
						e.at_mut(i) = (i == j) ? 1.0 : 0.0;
				err = solve_factored(f.view(), e.view(), scratch, col);
				if (!is_ok(err))
						return err;
				for (Index i = 0; i < a.rows; i++)
						out.at_mut(i, j) = col.at(i);
		}
		return err;
}

Error solve_checked(MatrixView a, VectorView b, Arena& scratch, VectorMutView x, SolveReport* report) noexcept {
		if (!report)
				return {ErrorCode::Internal};
		Error err = check_system(a, b, x);
		if (!is_ok(err))
				return err;

		ArenaScope scratch_scope(scratch);
		VectorMutView xs;
		ErrorCode ec = vector_alloc(scratch, a.rows, &xs);
		if (!is_ok(ec))
				return err_from(ec, a.dim());

		err = solve(a, b, scratch, xs);
		if (!is_ok(err))
				return err;

		SolveReport r;
		double kappa = 0.0;
		const Error cerr = condition_number(a, scratch, &kappa);
		if (is_ok(cerr)) {
				r.condition = kappa;
				r.error_bound = relative_error_bound(kappa, kMachineEpsilon);
				r.ill_conditioned = !(kappa <= kIllConditioned);
		} else if (cerr.code == ErrorCode::FeatureDisabled) {
				r.condition = std::numeric_limits<double>::quiet_NaN();
				r.error_bound = std::numeric_limits<double>::quiet_NaN();
		} else {
				return cerr;
		}

		VectorMutView ax;
		ec = vector_alloc(scratch, a.rows, &ax);
		if (!is_ok(ec))
				return err_from(ec, a.dim());
		ec = matrix_vector_mul(a, xs.view(), ax);
		if (!is_ok(ec))
				return err_from(ec, a.dim());
		ec = vector_sub(ax.view(), b, ax);
		if (!is_ok(ec))
				return err_from(ec, a.dim());
		const double bnorm = vector_norm2(b);
		const double rnorm = vector_norm2(ax.view());
		r.residual = (bnorm > 0.0) ? rnorm / bnorm : rnorm;

		ec = vector_copy(xs.view(), x);
		if (!is_ok(ec))
				return err_from(ec, a.dim());
		*report = r;
		return err;
}

} // namespace lusolve
