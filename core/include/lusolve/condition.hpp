#pragma once

#include "lusolve/arena.hpp"
#include "lusolve/config.hpp"
#include "lusolve/error.hpp"
#include "lusolve/matrix.hpp"

namespace lusolve {

// stability of A x = b against a relative perturbation eps of every b_i:
//
//   ||x - x~|| / ||x|| <= kappa(A) eps
//
// with kappa(A) = ||A|| ||A^{-1}|| in the spectral norm. in double precision
// eps ~ 1e-16, so kappa ~ 1e16 means no correct digit is left and anything
// above ~1e8 deserves a warning. large kappa is reported, never an error
//
// the eigenvalue and singular value routines come from Eigen. unlike the
// rest of the library they work on heap temporaries; an allocation failure
// there comes back as Overflow, like an exhausted scratch arena

enum class ConditionMethod : std::uint8_t {
		// ||A|| ||A^{-1}||, the inverse from the pivoted LU and both norms
		// from lambda_max only. lambda_max is always computed to full
		// relative accuracy so this holds up to kappa ~ 1 / eps
		NormInverse,
		// sigma_max / sigma_min from a Jacobi SVD of A. sigma_min carries an
		// absolute error of ~eps sigma_max
		SingularValues,
		// sqrt(lambda_max(A^T A) / lambda_min(A^T A)). forming A^T A squares
		// kappa, so lambda_min drowns in rounding once kappa passes ~1e8
		NormalEquations,
};

// ||M|| = sqrt(lambda_max(M^T M)), M may be rectangular
Error matrix_norm2(In MatrixView m, Out double* out) noexcept;

// kappa(A) >= 1, +Inf for singular A. NonFinite when A holds Inf/NaN
Error condition_number(In MatrixView a,
        InOut Arena& scratch,
        Out double* out,
        In ConditionMethod method = ConditionMethod::NormInverse) noexcept;

// symmetric A: kappa = max |lambda_i| / min |lambda_i|. NotSymmetric when
// |a_ij - a_ji| exceeds a few ulps of max |a_ij|
Error condition_number_symmetric(In MatrixView a, Out double* out) noexcept;

// symmetric positive definite A: kappa = lambda_max / lambda_min.
// NotPositiveDefinite when some lambda_i <= 0
Error condition_number_spd(In MatrixView a, Out double* out) noexcept;

// kappa eps, the bound on the relative error of the solution
constexpr double relative_error_bound(double kappa, double eps = kMachineEpsilon) noexcept {
		return kappa * eps;
}

// ||x - x~|| / ||x||, +Inf when x = 0 and x~ != x
ErrorCode relative_error(In VectorView x, In VectorView x_tilde, Out double* out) noexcept;

} // namespace lusolve
