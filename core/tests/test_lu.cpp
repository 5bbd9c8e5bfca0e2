#include "lusolve/lusolve.hpp"

#include "test_dbg.hpp"

#include <cassert>
#include <cmath>

using lusolve::Arena;
using lusolve::ErrorCode;
using lusolve::Index;
using lusolve::LuFactors;
using lusolve::MatrixMutView;
using lusolve::MatrixView;
using lusolve::Slab;

static bool upper_equals(MatrixView u, const double* expected, Index n) {
		for (Index i = 0; i < n; i++) {
				for (Index j = i; j < n; j++) {
						if (u.at(i, j) != expected[i * n + j])
								return false;
				}
		}
		return true;
}

static bool lower_equals(MatrixView l, const double* expected, Index n) {
		for (Index i = 0; i < n; i++) {
				for (Index j = 0; j <= i; j++) {
						if (l.at(i, j) != expected[i * n + j])
								return false;
				}
		}
		return true;
}

int main() {
		lusolve_test::init_logging("test_lu");

		Slab slab;
		assert(slab.init(256 * 1024) == ErrorCode::Ok);
		Arena arena(slab.data(), slab.size());

		// 3x3 worked example, every step is exact in double
		{
				lusolve::ArenaScope scope(arena);
				const double a[] = {2, 1, 0, -4, 3, -1, 4, -3, 4};
				const MatrixView av = lusolve::matrix_view(a, 3, 3);
				LuFactors f;
				assert(lusolve::lu_factors_alloc(arena, 3, &f) == ErrorCode::Ok);
				assert(lusolve::is_ok(lusolve::factorize_lu(av, f)));
				lusolve_test::print_matrix("L", f.l.view());
				lusolve_test::print_matrix("U", f.u.view());

				const double l[] = {1, 0, 0, -2, 1, 0, 2, -1, 1};
				const double u[] = {2, 1, 0, 0, 5, -1, 0, 0, 3};
				assert(lower_equals(f.l.view(), l, 3));
				assert(upper_equals(f.u.view(), u, 3));
				// strictly upper part of L is zero
				assert(f.l.at(0, 1) == 0.0 && f.l.at(0, 2) == 0.0 && f.l.at(1, 2) == 0.0);

				MatrixMutView lu;
				assert(lusolve::matrix_alloc(arena, 3, 3, &lu) == ErrorCode::Ok);
				assert(lusolve::lu_reconstruct(f.l.view(), f.u.view(), lu) == ErrorCode::Ok);
				double diff = 1.0;
				assert(lusolve::matrix_max_abs_diff(lu.view(), av, &diff) == ErrorCode::Ok);
				assert(diff == 0.0);

				// forward then backward substitution on the factors: x = (1, 2, 0)
				const double b[] = {4, 2, -2};
				double z[3] = {};
				double x[3] = {};
				assert(lusolve::forward_substitute(f.l.view(), {3, b}, {3, z}) == ErrorCode::Ok);
				assert(lusolve::backward_substitute(f.u.view(), {3, z}, {3, x}) == ErrorCode::Ok);
				assert(x[0] == 1.0 && x[1] == 2.0 && x[2] == 0.0);
		}

		// partial elimination snapshots
		{
				lusolve::ArenaScope scope(arena);
				const double a[] = {2, 1, 0, -4, 3, -1, 4, -3, 4};
				const MatrixView av = lusolve::matrix_view(a, 3, 3);
				LuFactors f;
				assert(lusolve::lu_factors_alloc(arena, 3, &f) == ErrorCode::Ok);

				assert(lusolve::is_ok(lusolve::factorize_lu_steps(av, 0, f)));
				double diff = 1.0;
				assert(lusolve::matrix_max_abs_diff(f.u.view(), av, &diff) == ErrorCode::Ok);
				assert(diff == 0.0);
				for (Index i = 0; i < 3; i++) {
						for (Index j = 0; j < 3; j++)
								assert(f.l.at(i, j) == 0.0);
				}

				assert(lusolve::is_ok(lusolve::factorize_lu_steps(av, 1, f)));
				assert(f.l.at(0, 0) == 1.0 && f.l.at(1, 0) == -2.0 && f.l.at(2, 0) == 2.0);
				assert(f.l.at(1, 1) == 0.0 && f.l.at(2, 2) == 0.0);
				assert(f.u.at(1, 1) == 5.0 && f.u.at(1, 2) == -1.0);
				assert(f.u.at(2, 1) == -5.0 && f.u.at(2, 2) == 4.0);

				// n - 1 outer steps leave L_nn unset, nstep >= n completes it
				assert(lusolve::is_ok(lusolve::factorize_lu_steps(av, 2, f)));
				assert(f.l.at(2, 1) == -1.0 && f.l.at(2, 2) == 0.0);
				assert(f.u.at(2, 2) == 3.0);
				assert(lusolve::is_ok(lusolve::factorize_lu_steps(av, 3, f)));
				assert(f.l.at(2, 2) == 1.0);
		}

		// a zero pivot is not detected, it poisons the factors
		{
				lusolve::ArenaScope scope(arena);
				const double a[] = {1, 2, 3, 2, 4, 5, 7, 8, 9};
				LuFactors f;
				assert(lusolve::lu_factors_alloc(arena, 3, &f) == ErrorCode::Ok);
				assert(lusolve::is_ok(lusolve::factorize_lu(lusolve::matrix_view(a, 3, 3), f)));
				assert(!lusolve::matrix_is_finite(f.l.view()) || !lusolve::matrix_is_finite(f.u.view()));
		}

		// 1x1
		{
				lusolve::ArenaScope scope(arena);
				const double a[] = {-3.5};
				LuFactors f;
				assert(lusolve::lu_factors_alloc(arena, 1, &f) == ErrorCode::Ok);
				assert(lusolve::is_ok(lusolve::factorize_lu(lusolve::matrix_view(a, 1, 1), f)));
				assert(f.l.at(0, 0) == 1.0);
				assert(f.u.at(0, 0) == -3.5);
		}

		// shape errors
		{
				lusolve::ArenaScope scope(arena);
				const double a[] = {1, 2, 3, 4, 5, 6};
				LuFactors f;
				assert(lusolve::lu_factors_alloc(arena, 2, &f) == ErrorCode::Ok);
				auto err = lusolve::factorize_lu(lusolve::matrix_view(a, 2, 3), f);
				assert(err.code == ErrorCode::NotSquare);
				assert(err.a.rows == 2 && err.a.cols == 3);

				const double b[] = {1, 2, 3, 4, 5, 6, 7, 8, 9};
				err = lusolve::factorize_lu(lusolve::matrix_view(b, 3, 3), f);
				assert(err.code == ErrorCode::DimensionMismatch);

				// empty system, factors of the same empty shape
				double l0[1] = {7.0};
				double u0[1] = {7.0};
				const LuFactors empty{lusolve::matrix_mut_view(l0, 0, 0), lusolve::matrix_mut_view(u0, 0, 0)};
				err = lusolve::factorize_lu(lusolve::matrix_view(b, 0, 0), empty);
				assert(err.code == ErrorCode::InvalidDimension);
				err = lusolve::factorize_lu_steps(lusolve::matrix_view(b, 0, 0), 0, empty);
				assert(err.code == ErrorCode::InvalidDimension);
				assert(l0[0] == 7.0 && u0[0] == 7.0);
		}

		return 0;
}
