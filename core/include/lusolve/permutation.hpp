#pragma once

#include "lusolve/arena.hpp"
#include "lusolve/error.hpp"
#include "lusolve/matrix.hpp"

namespace lusolve {

// row permutation in vector form: rows[k] is the index of the original row
// that ends up in position k (for LU: the k-th pivot row). the n x n matrix
// form P has row k equal to e_{rows[k]}^T, so (P A)_k = A_{rows[k]}
//
// the matrix form is only ever derived from this vector, see
// permutation_vector_to_matrix()
struct PermutationView {
		Index size = 0;
		const Index* rows = nullptr;

		Index at(Index k) const noexcept {
				assert(rows);
				assert(k < size);
				return rows[k];
		}
};

struct PermutationMutView {
		Index size = 0;
		Index* rows = nullptr;

		PermutationView view() const noexcept { return {size, rows}; }

		Index at(Index k) const noexcept {
				assert(rows);
				assert(k < size);
				return rows[k];
		}

		Index& at_mut(Index k) noexcept {
				assert(rows);
				assert(k < size);
				return rows[k];
		}
};

// allocates the identity permutation of length n
ErrorCode permutation_alloc(InOut Arena& arena, In Index n, Out PermutationMutView* out) noexcept;

// Ok iff p is a bijection on {0..n-1}. on failure err.i names the first
// offending position
Error permutation_validate(In PermutationView p, InOut Arena& scratch) noexcept;

// P with P_{k, p[k]} = 1, everything else 0
ErrorCode permutation_vector_to_matrix(In PermutationView p, Out MatrixMutView out) noexcept;

// q with q[p[k]] = k, i.e. P^T
ErrorCode permutation_inverse(In PermutationView p, Out PermutationMutView out) noexcept;

// out = P v, i.e. out_k = v_{p[k]}. out must not alias v
ErrorCode apply_permutation(In PermutationView p, In VectorView v, Out VectorMutView out) noexcept;

// out = P A, i.e. row k of out is row p[k] of A. out must not alias a
ErrorCode apply_permutation_rows(In PermutationView p, In MatrixView a, Out MatrixMutView out) noexcept;

} // namespace lusolve
