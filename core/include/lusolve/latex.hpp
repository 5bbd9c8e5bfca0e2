#pragma once

#include <cstddef>
#include <cstdint>

#include "lusolve/error.hpp"
#include "lusolve/matrix.hpp"
#include "lusolve/permutation.hpp"

namespace lusolve::latex {
struct Buffer {
		char* data = nullptr;
		std::size_t cap = 0;
};

enum class MatrixBrackets : std::uint8_t {
		BMatrix,
		PMatrix,
};

// which half of a factor is meaningful. the other half is printed as 0
// whatever is stored there
enum class Triangle : std::uint8_t {
		Full,
		Lower, // unit lower L
		Upper, // U, masks below diagonal entries in columns < mask_cols only
};

struct MatrixStyle {
		MatrixBrackets brackets = MatrixBrackets::BMatrix;
		Triangle triangle = Triangle::Full;
		Index mask_cols = kMaxDim;
};

ErrorCode write_matrix(In MatrixView m, In MatrixStyle style, Out Buffer out) noexcept;
ErrorCode write_matrix_display(In MatrixView m, In MatrixStyle style, Out Buffer out) noexcept;

// column vector, optionally prefixed with "name = "
ErrorCode write_vector_display(In const char* name, In VectorView v, Out Buffer out) noexcept;

// writes the system [A | b] using the latex array environment
//
// example:
//   \\left[\\begin{array}{rr|r} ... \\end{array}\\right]
ErrorCode write_augmented_display(In MatrixView left, In VectorView right, Out Buffer out) noexcept;

// $$L = ..., \quad U = ...$$ with both factors masked to their triangle.
// u_mask_cols limits the masking of U for partially eliminated snapshots
ErrorCode write_lu_display(In MatrixView l, In MatrixView u, In Index u_mask_cols, Out Buffer out) noexcept;

// as write_lu_display plus "p = (p_1, ..., p_n)" with 1 based rows
ErrorCode write_pivoted_lu_display(In MatrixView l, In MatrixView u, In PermutationView p, Out Buffer out) noexcept;
} // namespace lusolve::latex
