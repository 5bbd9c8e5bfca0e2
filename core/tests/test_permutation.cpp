#include "lusolve/lusolve.hpp"

#include "test_dbg.hpp"

#include <cassert>

using lusolve::Arena;
using lusolve::ErrorCode;
using lusolve::Index;
using lusolve::MatrixMutView;
using lusolve::PermutationMutView;
using lusolve::PermutationView;
using lusolve::Slab;

int main() {
		lusolve_test::init_logging("test_permutation");

		Slab slab;
		assert(slab.init(64 * 1024) == ErrorCode::Ok);
		Arena scratch(slab.data(), slab.size());

		// alloc gives the identity
		{
				lusolve::ArenaScope scope(scratch);
				PermutationMutView p;
				assert(lusolve::permutation_alloc(scratch, 4, &p) == ErrorCode::Ok);
				for (Index k = 0; k < 4; k++)
						assert(p.at(k) == k);
				assert(lusolve::is_ok(lusolve::permutation_validate(p.view(), scratch)));
		}

		// validate reports the first repeated or out of range entry
		{
				const Index dup[] = {2, 0, 2};
				const auto err = lusolve::permutation_validate({3, dup}, scratch);
				assert(err.code == ErrorCode::InvalidPermutation);
				assert(err.i == 2);

				const Index range[] = {0, 3, 1};
				const auto err2 = lusolve::permutation_validate({3, range}, scratch);
				assert(err2.code == ErrorCode::InvalidPermutation);
				assert(err2.i == 1);
				assert(scratch.used() == 0);
		}

		// p = (2, 0, 1): row k of P is e_{p[k]}
		const Index rows[] = {2, 0, 1};
		const PermutationView p{3, rows};
		{
				lusolve::ArenaScope scope(scratch);
				MatrixMutView pm;
				assert(lusolve::matrix_alloc(scratch, 3, 3, &pm) == ErrorCode::Ok);
				assert(lusolve::permutation_vector_to_matrix(p, pm) == ErrorCode::Ok);
				const double expected[] = {0, 0, 1, 1, 0, 0, 0, 1, 0};
				double diff = 1.0;
				assert(lusolve::matrix_max_abs_diff(pm.view(), lusolve::matrix_view(expected, 3, 3), &diff) == ErrorCode::Ok);
				assert(diff == 0.0);

				// P v equals apply_permutation
				const double v[] = {10, 20, 30};
				double pv[3] = {};
				double mv[3] = {};
				assert(lusolve::apply_permutation(p, {3, v}, {3, pv}) == ErrorCode::Ok);
				assert(lusolve::matrix_vector_mul(pm.view(), {3, v}, {3, mv}) == ErrorCode::Ok);
				assert(pv[0] == 30 && pv[1] == 10 && pv[2] == 20);
				for (int i = 0; i < 3; i++)
						assert(pv[i] == mv[i]);

				// P A moves whole rows
				const double a[] = {1, 2, 3, 4, 5, 6};
				MatrixMutView pa;
				assert(lusolve::matrix_alloc(scratch, 3, 2, &pa) == ErrorCode::Ok);
				assert(lusolve::apply_permutation_rows(p, lusolve::matrix_view(a, 3, 2), pa) == ErrorCode::Ok);
				assert(pa.at(0, 0) == 5 && pa.at(0, 1) == 6);
				assert(pa.at(1, 0) == 1 && pa.at(1, 1) == 2);
				assert(pa.at(2, 0) == 3 && pa.at(2, 1) == 4);
		}

		// the inverse undoes the permutation and matches P^T
		{
				lusolve::ArenaScope scope(scratch);
				PermutationMutView q;
				assert(lusolve::permutation_alloc(scratch, 3, &q) == ErrorCode::Ok);
				assert(lusolve::permutation_inverse(p, q) == ErrorCode::Ok);
				assert(q.at(0) == 1 && q.at(1) == 2 && q.at(2) == 0);

				const double v[] = {10, 20, 30};
				double pv[3] = {};
				double back[3] = {};
				assert(lusolve::apply_permutation(p, {3, v}, {3, pv}) == ErrorCode::Ok);
				assert(lusolve::apply_permutation(q.view(), {3, pv}, {3, back}) == ErrorCode::Ok);
				for (int i = 0; i < 3; i++)
						assert(back[i] == v[i]);

				MatrixMutView pm;
				MatrixMutView pt;
				MatrixMutView qm;
				assert(lusolve::matrix_alloc(scratch, 3, 3, &pm) == ErrorCode::Ok);
				assert(lusolve::matrix_alloc(scratch, 3, 3, &pt) == ErrorCode::Ok);
				assert(lusolve::matrix_alloc(scratch, 3, 3, &qm) == ErrorCode::Ok);
				assert(lusolve::permutation_vector_to_matrix(p, pm) == ErrorCode::Ok);
				assert(lusolve::matrix_transpose(pm.view(), pt) == ErrorCode::Ok);
				assert(lusolve::permutation_vector_to_matrix(q.view(), qm) == ErrorCode::Ok);
				double diff = 1.0;
				assert(lusolve::matrix_max_abs_diff(pt.view(), qm.view(), &diff) == ErrorCode::Ok);
				assert(diff == 0.0);
		}

		// shape errors
		{
				const double v[] = {1, 2};
				double out[2] = {};
				assert(lusolve::apply_permutation(p, {2, v}, {2, out}) == ErrorCode::DimensionMismatch);
		}

		return 0;
}
