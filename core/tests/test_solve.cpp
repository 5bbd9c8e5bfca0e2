#include "lusolve/lusolve.hpp"

#include "test_dbg.hpp"

#include <cassert>
#include <cmath>
#include <random>

using lusolve::Arena;
using lusolve::ErrorCode;
using lusolve::Index;
using lusolve::MatrixMutView;
using lusolve::MatrixView;
using lusolve::PivotedLuFactors;
using lusolve::Slab;
using lusolve::SolveReport;
using lusolve::VectorMutView;
using lusolve::VectorView;

static double residual_norm(MatrixView a, VectorView x, VectorView b, Arena& scratch) {
		lusolve::ArenaScope scope(scratch);
		VectorMutView r;
		assert(lusolve::vector_alloc(scratch, b.size, &r) == ErrorCode::Ok);
		assert(lusolve::matrix_vector_mul(a, x, r) == ErrorCode::Ok);
		assert(lusolve::vector_sub(r.view(), b, r) == ErrorCode::Ok);
		return lusolve::vector_norm2(r.view());
}

int main() {
		lusolve_test::init_logging("test_solve");

		Slab slab;
		assert(slab.init(2 * 1024 * 1024) == ErrorCode::Ok);
		Arena persist(slab.data(), slab.size() / 2);
		Arena scratch(slab.data() + (slab.size() / 2), slab.size() - (slab.size() / 2));

		// 3x3 worked example: x = (1, 2, 0)
		{
				const double a[] = {2, 1, 0, -4, 3, -1, 4, -3, 4};
				const double b[] = {4, 2, -2};
				double x[3] = {};
				const MatrixView av = lusolve::matrix_view(a, 3, 3);
				assert(lusolve::is_ok(lusolve::solve(av, {3, b}, scratch, {3, x})));
				assert(scratch.used() == 0);
				assert(std::fabs(x[0] - 1.0) < 1e-12);
				assert(std::fabs(x[1] - 2.0) < 1e-12);
				assert(std::fabs(x[2]) < 1e-12);
				assert(residual_norm(av, {3, x}, {3, b}, scratch) < 1e-10 * lusolve::vector_norm2({3, b}));
		}

		// the matrix that needs pivoting solves cleanly
		{
				const double a[] = {1, 2, 3, 2, 4, 5, 7, 8, 9};
				const double b[] = {6, 11, 24};
				double x[3] = {};
				const MatrixView av = lusolve::matrix_view(a, 3, 3);
				assert(lusolve::is_ok(lusolve::solve(av, {3, b}, scratch, {3, x})));
				assert(lusolve::vector_is_finite({3, x}));
				assert(residual_norm(av, {3, x}, {3, b}, scratch) < 1e-10 * lusolve::vector_norm2({3, b}));
		}

		// random systems
		{
				std::mt19937 rng(777u);
				std::uniform_real_distribution<double> dist(-1.0, 1.0);
				const Index sizes[] = {1, 2, 4, 10, 40};
				for (Index n : sizes) {
						lusolve::ArenaScope scope(persist);
						MatrixMutView a;
						VectorMutView b;
						VectorMutView x;
						assert(lusolve::matrix_alloc(persist, n, n, &a) == ErrorCode::Ok);
						assert(lusolve::vector_alloc(persist, n, &b) == ErrorCode::Ok);
						assert(lusolve::vector_alloc(persist, n, &x) == ErrorCode::Ok);
						for (Index i = 0; i < n; i++) {
								// diagonal shift keeps the draws well away from singular
								for (Index j = 0; j < n; j++)
										a.at_mut(i, j) = dist(rng) + (i == j ? static_cast<double>(n) : 0.0);
								b.at_mut(i) = dist(rng);
						}
						assert(lusolve::is_ok(lusolve::solve(a.view(), b.view(), scratch, x)));
						assert(residual_norm(a.view(), x.view(), b.view(), scratch) < 1e-10 * lusolve::vector_norm2(b.view()));
				}
		}

		// factors are reusable: same b twice gives the same x, a second b its own x
		{
				lusolve::ArenaScope scope(persist);
				const double a[] = {4, -2, 1, 3, 6, -4, 2, 1, 8};
				const MatrixView av = lusolve::matrix_view(a, 3, 3);
				PivotedLuFactors f;
				assert(lusolve::pivoted_lu_factors_alloc(persist, 3, &f) == ErrorCode::Ok);
				assert(lusolve::is_ok(lusolve::factorize_lu_pivoted(av, scratch, f)));

				const double b1[] = {1, 2, 3};
				const double b2[] = {-5, 0, 7};
				double x1[3] = {};
				double x1_again[3] = {};
				double x2[3] = {};
				double x2_direct[3] = {};
				assert(lusolve::is_ok(lusolve::solve_factored(f.view(), {3, b1}, scratch, {3, x1})));
				assert(lusolve::is_ok(lusolve::solve_factored(f.view(), {3, b2}, scratch, {3, x2})));
				assert(lusolve::is_ok(lusolve::solve_factored(f.view(), {3, b1}, scratch, {3, x1_again})));
				assert(lusolve::is_ok(lusolve::solve(av, {3, b2}, scratch, {3, x2_direct})));
				for (int i = 0; i < 3; i++) {
						assert(x1[i] == x1_again[i]);
						assert(x2[i] == x2_direct[i]);
				}
				assert(residual_norm(av, {3, x2}, {3, b2}, scratch) < 1e-10 * lusolve::vector_norm2({3, b2}));
		}

		// inverse: A A^{-1} = I
		{
				lusolve::ArenaScope scope(persist);
				const double a[] = {4, -2, 1, 3, 6, -4, 2, 1, 8};
				const MatrixView av = lusolve::matrix_view(a, 3, 3);
				MatrixMutView inv;
				MatrixMutView prod;
				MatrixMutView eye;
				assert(lusolve::matrix_alloc(persist, 3, 3, &inv) == ErrorCode::Ok);
				assert(lusolve::matrix_alloc(persist, 3, 3, &prod) == ErrorCode::Ok);
				assert(lusolve::matrix_alloc(persist, 3, 3, &eye) == ErrorCode::Ok);
				assert(lusolve::is_ok(lusolve::invert(av, scratch, inv)));
				assert(lusolve::matrix_mul(av, inv.view(), prod) == ErrorCode::Ok);
				assert(lusolve::matrix_set_identity(eye) == ErrorCode::Ok);
				double diff = 1.0;
				assert(lusolve::matrix_max_abs_diff(prod.view(), eye.view(), &diff) == ErrorCode::Ok);
				assert(diff < 1e-13);

				const double s[] = {1, 2, 2, 4};
				MatrixMutView sinv;
				assert(lusolve::matrix_alloc(persist, 2, 2, &sinv) == ErrorCode::Ok);
				assert(lusolve::invert(lusolve::matrix_view(s, 2, 2), scratch, sinv).code == ErrorCode::Singular);
		}

		// solve_checked: malformed input is rejected, x is not touched
		{
				const double a[] = {1, 2, 3, 4, 5, 6};
				const double b[] = {1, 2};
				double x[2] = {42, 42};
				SolveReport report;
				auto err = lusolve::solve_checked(lusolve::matrix_view(a, 2, 3), {2, b}, scratch, {2, x}, &report);
				assert(err.code == ErrorCode::NotSquare);
				err = lusolve::solve_checked(lusolve::matrix_view(a, 2, 2), {1, b}, scratch, {2, x}, &report);
				assert(err.code == ErrorCode::DimensionMismatch);
				assert(x[0] == 42 && x[1] == 42);
		}

		// solve_checked: exactly singular input, x is not touched
		{
				const double a[] = {1, 2, 3, 2, 4, 6, 1, 1, 1};
				const double b[] = {1, 2, 3};
				double x[3] = {42, 42, 42};
				SolveReport report;
				const auto err = lusolve::solve_checked(lusolve::matrix_view(a, 3, 3), {3, b}, scratch, {3, x}, &report);
				assert(err.code == ErrorCode::Singular);
				assert(err.i == 2);
				assert(x[0] == 42 && x[1] == 42 && x[2] == 42);
		}

		// solve_checked: well conditioned
		{
				const double a[] = {2, 1, 0, -4, 3, -1, 4, -3, 4};
				const double b[] = {4, 2, -2};
				double x[3] = {};
				SolveReport report;
				assert(lusolve::is_ok(lusolve::solve_checked(lusolve::matrix_view(a, 3, 3), {3, b}, scratch, {3, x}, &report)));
				assert(std::fabs(x[1] - 2.0) < 1e-12);
				assert(report.residual < 1e-12);
				assert(!report.ill_conditioned);
#if LUSOLVE_ENABLE_CONDITION
				assert(report.condition >= 1.0 && report.condition < 100.0);
				assert(report.error_bound == report.condition * lusolve::kMachineEpsilon);
#else
				assert(std::isnan(report.condition));
#endif
		}

		// solve_checked: ill conditioned input is solved and flagged, not rejected
		{
				const double a[] = {1, 1e-16, 1, 0};
				const double b[] = {1, 1};
				double x[2] = {};
				SolveReport report;
				assert(lusolve::is_ok(lusolve::solve_checked(lusolve::matrix_view(a, 2, 2), {2, b}, scratch, {2, x}, &report)));
				assert(x[0] == 1.0 && x[1] == 0.0);
				assert(report.residual == 0.0);
#if LUSOLVE_ENABLE_CONDITION
				assert(report.ill_conditioned);
				assert(report.condition > 1e15);
				assert(report.error_bound > 1.0);
#endif
		}

		return 0;
}
