#include "lusolve/permutation.hpp"

namespace lusolve {

ErrorCode permutation_alloc(Arena& arena, Index n, PermutationMutView* out) noexcept {
		if (!out)
				return ErrorCode::Internal;
		if (n < 1 || n > kMaxDim)
				return ErrorCode::InvalidDimension;

		Index* rows = arena.allocate_array<Index>(n);
		if (!rows)
				return ErrorCode::Overflow;
		for (Index k = 0; k < n; k++)
				rows[k] = k;

		out->size = n;
		out->rows = rows;
		return ErrorCode::Ok;
}

Error permutation_validate(PermutationView p, Arena& scratch) noexcept {
		Error err;
		if (!p.rows || p.size < 1 || p.size > kMaxDim)
				return err_invalid_dim({p.size, 1});

		ArenaScope scratch_scope(scratch);
		bool* seen = scratch.allocate_array<bool>(p.size);
		if (!seen)
				return err_overflow();

		for (Index k = 0; k < p.size; k++) {
				const Index row = p.at(k);
				if (row >= p.size || seen[row]) {
						err.code = ErrorCode::InvalidPermutation;
						err.a = {p.size, 1};
						err.i = k;
						return err;
				}
				seen[row] = true;
		}
		return err;
}

ErrorCode permutation_vector_to_matrix(PermutationView p, MatrixMutView out) noexcept {
		if (!p.rows || !out.data)
				return ErrorCode::Internal;
		if (out.rows != p.size || out.cols != p.size)
				return ErrorCode::DimensionMismatch;

		matrix_fill_zero(out);
		for (Index k = 0; k < p.size; k++) {
				const Index row = p.at(k);
				if (row >= p.size)
						return ErrorCode::InvalidPermutation;
				out.at_mut(k, row) = 1.0;
		}
		return ErrorCode::Ok;
}

ErrorCode permutation_inverse(PermutationView p, PermutationMutView out) noexcept {
		if (!p.rows || !out.rows)
				return ErrorCode::Internal;
		if (out.size != p.size)
				return ErrorCode::DimensionMismatch;

		for (Index k = 0; k < p.size; k++) {
				const Index row = p.at(k);
				if (row >= p.size)
						return ErrorCode::InvalidPermutation;
				out.at_mut(row) = k;
		}
		return ErrorCode::Ok;
}

ErrorCode apply_permutation(PermutationView p, VectorView v, VectorMutView out) noexcept {
		if (!p.rows || !v.data || !out.data)
				return ErrorCode::Internal;
		if (v.size != p.size || out.size != p.size)
				return ErrorCode::DimensionMismatch;

		for (Index k = 0; k < p.size; k++) {
				const Index row = p.at(k);
				if (row >= p.size)
						return ErrorCode::InvalidPermutation;
				out.at_mut(k) = v.at(row);
		}
		return ErrorCode::Ok;
}

ErrorCode apply_permutation_rows(PermutationView p, MatrixView a, MatrixMutView out) noexcept {
		if (!p.rows || !a.data || !out.data)
				return ErrorCode::Internal;
		if (a.rows != p.size || out.rows != a.rows || out.cols != a.cols)
				return ErrorCode::DimensionMismatch;

		for (Index k = 0; k < p.size; k++) {
				const Index row = p.at(k);
				if (row >= p.size)
						return ErrorCode::InvalidPermutation;
				for (Index col = 0; col < a.cols; col++)
						out.at_mut(k, col) = a.at(row, col);
		}
		return ErrorCode::Ok;
}

} // namespace lusolve
