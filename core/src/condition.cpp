#include "lusolve/condition.hpp"

#include <cmath>
#include <limits>
#include <new>

#if LUSOLVE_ENABLE_CONDITION
#include "lusolve/solve.hpp"

#include <Eigen/Dense>

namespace lusolve {
namespace {
using RowMajorMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using ConstMap = Eigen::Map<const RowMajorMatrix, Eigen::Unaligned, Eigen::OuterStride<>>;

constexpr double kInf = std::numeric_limits<double>::infinity();

ConstMap as_eigen(MatrixView m) noexcept {
		return ConstMap(m.data, m.rows, m.cols, Eigen::OuterStride<>(m.stride));
}

Error check_square(MatrixView a, const double* out) noexcept {
		if (!out || !a.data)
				return {ErrorCode::Internal};
		if (a.rows < 1 || a.cols < 1)
				return err_invalid_dim(a.dim());
		if (!a.square())
				return err_not_square(a.dim());
		if (!matrix_is_finite(a))
				return err_from(ErrorCode::NonFinite, a.dim());
		return {};
}

// Eigen temporaries live on the heap. the only exception they throw is
// std::bad_alloc, reported like an exhausted arena
template <typename Fn> Error eigen_guarded(Dim dim, Fn&& fn) noexcept {
		try {
				return fn();
		} catch (const std::bad_alloc&) {
				return err_from(ErrorCode::Overflow, dim);
		}
}

// ascending eigenvalues of a symmetric matrix
Error symmetric_eigenvalues(const Eigen::MatrixXd& s, Dim dim, Eigen::VectorXd* out) {
		Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> es(s, Eigen::EigenvaluesOnly);
		if (es.info() != Eigen::Success)
				return err_from(ErrorCode::Internal, dim);
		*out = es.eigenvalues();
		return {};
}

double ratio_or_inf(double num, double den) noexcept {
		if (!(den > 0.0))
				return kInf;
		const double r = num / den;
		return r < 1.0 ? 1.0 : r;
}

double symmetry_tol(const Eigen::MatrixXd& m) {
		return 8.0 * kMachineEpsilon * m.cwiseAbs().maxCoeff();
}
} // namespace

Error matrix_norm2(MatrixView m, double* out) noexcept {
		if (!out || !m.data)
				return {ErrorCode::Internal};
		if (m.rows < 1 || m.cols < 1)
				return err_invalid_dim(m.dim());
		if (!matrix_is_finite(m))
				return err_from(ErrorCode::NonFinite, m.dim());

		return eigen_guarded(m.dim(), [&] {
				const Eigen::MatrixXd mtm = as_eigen(m).transpose() * as_eigen(m);
				Eigen::VectorXd lambda;
				Error err = symmetric_eigenvalues(mtm, m.dim(), &lambda);
				if (!is_ok(err))
						return err;

				// M^T M is positive semidefinite, rounding may push lambda slightly below 0
				const double lmax = lambda(lambda.size() - 1);
				*out = lmax > 0.0 ? std::sqrt(lmax) : 0.0;
				return err;
		});
}

Error condition_number(MatrixView a, Arena& scratch, double* out, ConditionMethod method) noexcept {
		Error err = check_square(a, out);
		if (!is_ok(err))
				return err;

		switch (method) {
		case ConditionMethod::NormInverse: {
				ArenaScope scratch_scope(scratch);
				MatrixMutView inv;
				ErrorCode ec = matrix_alloc(scratch, a.rows, a.cols, &inv);
				if (!is_ok(ec))
						return err_from(ec, a.dim());
				err = invert(a, scratch, inv);
				if (err.code == ErrorCode::Singular) {
						*out = kInf;
						return {};
				}
				if (!is_ok(err))
						return err;
				// a pivot of ~1e-300 can overflow the inverse
				if (!matrix_is_finite(inv.view())) {
						*out = kInf;
						return {};
				}

				double norm_a = 0.0;
				double norm_inv = 0.0;
				err = matrix_norm2(a, &norm_a);
				if (!is_ok(err))
						return err;
				err = matrix_norm2(inv.view(), &norm_inv);
				if (!is_ok(err))
						return err;
				const double kappa = norm_a * norm_inv;
				*out = kappa < 1.0 ? 1.0 : kappa;
				return err;
		}
		case ConditionMethod::SingularValues:
				return eigen_guarded(a.dim(), [&] {
						const Eigen::MatrixXd m = as_eigen(a);
						Eigen::JacobiSVD<Eigen::MatrixXd> svd(m);
						const Eigen::VectorXd& sigma = svd.singularValues();
						*out = ratio_or_inf(sigma(0), sigma(sigma.size() - 1));
						return err;
				});
		case ConditionMethod::NormalEquations:
				return eigen_guarded(a.dim(), [&] {
						const Eigen::MatrixXd ata = as_eigen(a).transpose() * as_eigen(a);
						Eigen::VectorXd lambda;
						Error eerr = symmetric_eigenvalues(ata, a.dim(), &lambda);
						if (!is_ok(eerr))
								return eerr;
						const double lmin = lambda(0);
						const double lmax = lambda(lambda.size() - 1);
						*out = (lmin > 0.0) ? ratio_or_inf(std::sqrt(lmax), std::sqrt(lmin)) : kInf;
						return eerr;
				});
		}
		return {ErrorCode::Internal};
}

Error condition_number_symmetric(MatrixView a, double* out) noexcept {
		Error err = check_square(a, out);
		if (!is_ok(err))
				return err;

		return eigen_guarded(a.dim(), [&] {
				const Eigen::MatrixXd m = as_eigen(a);
				if (!matrix_is_symmetric(a, symmetry_tol(m)))
						return err_from(ErrorCode::NotSymmetric, a.dim());

				Eigen::VectorXd lambda;
				Error eerr = symmetric_eigenvalues(m, a.dim(), &lambda);
				if (!is_ok(eerr))
						return eerr;
				const Eigen::VectorXd mag = lambda.cwiseAbs();
				*out = ratio_or_inf(mag.maxCoeff(), mag.minCoeff());
				return eerr;
		});
}

Error condition_number_spd(MatrixView a, double* out) noexcept {
		Error err = check_square(a, out);
		if (!is_ok(err))
				return err;

		return eigen_guarded(a.dim(), [&] {
				const Eigen::MatrixXd m = as_eigen(a);
				if (!matrix_is_symmetric(a, symmetry_tol(m)))
						return err_from(ErrorCode::NotSymmetric, a.dim());

				Eigen::VectorXd lambda;
				Error eerr = symmetric_eigenvalues(m, a.dim(), &lambda);
				if (!is_ok(eerr))
						return eerr;
				const double lmin = lambda(0);
				if (!(lmin > 0.0))
						return err_from(ErrorCode::NotPositiveDefinite, a.dim());
				*out = ratio_or_inf(lambda(lambda.size() - 1), lmin);
				return eerr;
		});
}

} // namespace lusolve
#endif // LUSOLVE_ENABLE_CONDITION

namespace lusolve {

ErrorCode relative_error(VectorView x, VectorView x_tilde, double* out) noexcept {
		if (!out || !x.data || !x_tilde.data)
				return ErrorCode::Internal;
		if (x.size != x_tilde.size)
				return ErrorCode::DimensionMismatch;

		// scaled two pass norm of x - x~, no scratch needed
		double scale = 0.0;
		for (Index i = 0; i < x.size; i++) {
				const double d = std::fabs(x.at(i) - x_tilde.at(i));
				if (std::isnan(d)) {
						*out = d;
						return ErrorCode::Ok;
				}
				if (d > scale)
						scale = d;
		}
		double diff = scale;
		if (scale > 0.0 && std::isfinite(scale)) {
				double sum = 0.0;
				for (Index i = 0; i < x.size; i++) {
						const double t = (x.at(i) - x_tilde.at(i)) / scale;
						sum += t * t;
				}
				diff = scale * std::sqrt(sum);
		}

		const double xnorm = vector_norm2(x);
		if (xnorm == 0.0) {
				*out = (diff == 0.0) ? 0.0 : std::numeric_limits<double>::infinity();
				return ErrorCode::Ok;
		}
		*out = diff / xnorm;
		return ErrorCode::Ok;
}

} // namespace lusolve
