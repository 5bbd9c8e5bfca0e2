#include "lusolve/lusolve.hpp"

#include "test_dbg.hpp"

#include <cassert>
#include <cmath>
#include <cstdint>
#include <limits>
#include <random>

using lusolve::Arena;
using lusolve::ConditionMethod;
using lusolve::ErrorCode;
using lusolve::Index;
using lusolve::MatrixMutView;
using lusolve::MatrixView;
using lusolve::Slab;

static bool close_rel(double a, double b, double tol) {
		return std::fabs(a - b) <= tol * std::fmax(std::fabs(a), std::fabs(b));
}

int main() {
		lusolve_test::init_logging("test_condition");

		Slab slab;
		assert(slab.init(1024 * 1024) == ErrorCode::Ok);
		Arena persist(slab.data(), slab.size() / 2);
		Arena scratch(slab.data() + (slab.size() / 2), slab.size() - (slab.size() / 2));

		// relative_error is always available
		{
				const double x[] = {3, 4};
				const double xt[] = {3, 4.5};
				double rel = 0.0;
				assert(lusolve::relative_error({2, x}, {2, xt}, &rel) == ErrorCode::Ok);
				assert(close_rel(rel, 0.1, 1e-15));

				const double zero[] = {0, 0};
				assert(lusolve::relative_error({2, zero}, {2, zero}, &rel) == ErrorCode::Ok);
				assert(rel == 0.0);
				assert(lusolve::relative_error({2, zero}, {2, x}, &rel) == ErrorCode::Ok);
				assert(std::isinf(rel));
				assert(lusolve::relative_error({2, zero}, {1, x}, &rel) == ErrorCode::DimensionMismatch);
		}

#if LUSOLVE_ENABLE_CONDITION
		// ill conditioned 2x2: kappa ~ 2e16, a one ulp change of b_0 moves x_1 from
		// 0 to ~2.2 and the observed error stays within kappa eps
		{
				const double a[] = {1, 1e-16, 1, 0};
				const MatrixView av = lusolve::matrix_view(a, 2, 2);
				double kappa = 0.0;
				assert(lusolve::is_ok(lusolve::condition_number(av, scratch, &kappa)));
				lusolve_test::print_double("kappa", kappa);
				assert(kappa >= 1.9e16 && kappa <= 2.1e16);
				assert(scratch.used() == 0);

				const double b[] = {1, 1};
				const double bt[] = {std::nextafter(1.0, 2.0), 1};
				double x[2] = {};
				double xt[2] = {};
				assert(lusolve::is_ok(lusolve::solve(av, {2, b}, scratch, {2, x})));
				assert(lusolve::is_ok(lusolve::solve(av, {2, bt}, scratch, {2, xt})));
				assert(x[0] == 1.0 && x[1] == 0.0);
				assert(std::fabs(xt[0] - 1.0) < 1e-12);
				assert(xt[1] > 2.0 && xt[1] < 2.5);

				double rel = 0.0;
				assert(lusolve::relative_error({2, x}, {2, xt}, &rel) == ErrorCode::Ok);
				lusolve_test::print_double("relative error", rel);
				assert(rel > 1.0);
				assert(rel <= lusolve::relative_error_bound(kappa));
		}

		// the three methods agree on well conditioned SPD matrices, and with the
		// eigenvalue ratio
		{
				std::mt19937 rng(4242u);
				std::uniform_real_distribution<double> dist(-1.0, 1.0);
				const Index sizes[] = {2, 3, 6, 12};
				for (Index n : sizes) {
						lusolve::ArenaScope scope(persist);
						MatrixMutView m;
						MatrixMutView mt;
						MatrixMutView a;
						assert(lusolve::matrix_alloc(persist, n, n, &m) == ErrorCode::Ok);
						assert(lusolve::matrix_alloc(persist, n, n, &mt) == ErrorCode::Ok);
						assert(lusolve::matrix_alloc(persist, n, n, &a) == ErrorCode::Ok);
						for (Index i = 0; i < n; i++) {
								for (Index j = 0; j < n; j++)
										m.at_mut(i, j) = dist(rng);
						}
						// A = M^T M + I, symmetrized so the tolerance check is exact
						assert(lusolve::matrix_transpose(m.view(), mt) == ErrorCode::Ok);
						assert(lusolve::matrix_mul(mt.view(), m.view(), a) == ErrorCode::Ok);
						for (Index i = 0; i < n; i++) {
								a.at_mut(i, i) += 1.0;
								for (Index j = 0; j < i; j++)
										a.at_mut(i, j) = a.at(j, i);
						}

						double k_inv = 0.0;
						double k_svd = 0.0;
						double k_ne = 0.0;
						double k_sym = 0.0;
						double k_spd = 0.0;
						assert(lusolve::is_ok(lusolve::condition_number(a.view(), scratch, &k_inv, ConditionMethod::NormInverse)));
						assert(lusolve::is_ok(lusolve::condition_number(a.view(), scratch, &k_svd, ConditionMethod::SingularValues)));
						assert(lusolve::is_ok(lusolve::condition_number(a.view(), scratch, &k_ne, ConditionMethod::NormalEquations)));
						assert(lusolve::is_ok(lusolve::condition_number_symmetric(a.view(), &k_sym)));
						assert(lusolve::is_ok(lusolve::condition_number_spd(a.view(), &k_spd)));
						assert(k_inv >= 1.0);
						assert(close_rel(k_inv, k_svd, 1e-8));
						assert(close_rel(k_inv, k_ne, 1e-6));
						assert(close_rel(k_inv, k_sym, 1e-8));
						assert(close_rel(k_inv, k_spd, 1e-8));
				}
		}

		// spectral norm
		{
				const double d[] = {3, 0, 0, -4};
				double norm = 0.0;
				assert(lusolve::is_ok(lusolve::matrix_norm2(lusolve::matrix_view(d, 2, 2), &norm)));
				assert(close_rel(norm, 4.0, 1e-14));

				const double row[] = {1, 2, 2};
				assert(lusolve::is_ok(lusolve::matrix_norm2(lusolve::matrix_view(row, 1, 3), &norm)));
				assert(close_rel(norm, 3.0, 1e-14));
		}

		// diagonal matrices: kappa is the ratio of the extreme |d_i|
		{
				const double d[] = {2, 0, 0, 0, -8, 0, 0, 0, 0.5};
				const MatrixView dv = lusolve::matrix_view(d, 3, 3);
				double kappa = 0.0;
				assert(lusolve::is_ok(lusolve::condition_number(dv, scratch, &kappa)));
				assert(close_rel(kappa, 16.0, 1e-12));
				assert(lusolve::is_ok(lusolve::condition_number_symmetric(dv, &kappa)));
				assert(close_rel(kappa, 16.0, 1e-12));
				assert(lusolve::condition_number_spd(dv, &kappa).code == ErrorCode::NotPositiveDefinite);
		}

		// symmetric variants reject non-symmetric input
		{
				const double a[] = {1, 2, 3, 4};
				double kappa = 0.0;
				assert(lusolve::condition_number_symmetric(lusolve::matrix_view(a, 2, 2), &kappa).code == ErrorCode::NotSymmetric);
				assert(lusolve::condition_number_spd(lusolve::matrix_view(a, 2, 2), &kappa).code == ErrorCode::NotSymmetric);
		}

		// singular input has infinite condition, malformed input is an error
		{
				const double s[] = {1, 2, 2, 4};
				double kappa = 0.0;
				assert(lusolve::is_ok(lusolve::condition_number(lusolve::matrix_view(s, 2, 2), scratch, &kappa)));
				assert(std::isinf(kappa));

				const double r[] = {1, 2, 3, 4, 5, 6};
				assert(lusolve::condition_number(lusolve::matrix_view(r, 2, 3), scratch, &kappa).code == ErrorCode::NotSquare);

				const double n[] = {1, std::numeric_limits<double>::quiet_NaN(), 0, 1};
				assert(lusolve::condition_number(lusolve::matrix_view(n, 2, 2), scratch, &kappa).code == ErrorCode::NonFinite);
		}

		// running out of memory is an Overflow status, kappa is left alone
		{
				const double a[] = {4, 1, 1, 3};
				alignas(double) std::uint8_t tiny[16];
				Arena exhausted(tiny, sizeof(tiny));
				double kappa = -1.0;
				const auto err = lusolve::condition_number(lusolve::matrix_view(a, 2, 2), exhausted, &kappa);
				assert(err.code == ErrorCode::Overflow);
				assert(err.a.rows == 2 && err.a.cols == 2);
				assert(kappa == -1.0);
				assert(exhausted.used() == 0);

				// the Eigen methods keep their temporaries off the arena
				assert(lusolve::is_ok(lusolve::condition_number(lusolve::matrix_view(a, 2, 2), exhausted, &kappa, ConditionMethod::SingularValues)));
				assert(kappa > 1.0 && std::isfinite(kappa));
				assert(exhausted.peak() == 0);
		}
#else
		{
				const double a[] = {1, 0, 0, 1};
				double kappa = 0.0;
				assert(lusolve::condition_number(lusolve::matrix_view(a, 2, 2), scratch, &kappa).code == ErrorCode::FeatureDisabled);
		}
#endif

		return 0;
}
