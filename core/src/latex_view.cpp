#include "lusolve/latex.hpp"
#include "lusolve/writer.hpp"

#include <cassert>
#include <cstdint>

namespace lusolve::latex {
namespace {

const char* begin_env(MatrixBrackets b) noexcept {
		switch (b) {
		case MatrixBrackets::BMatrix:
				return "\\begin{bmatrix}";
		case MatrixBrackets::PMatrix:
				return "\\begin{pmatrix}";
		}
		assert(false && "invalid MatrixBrackets");
		return nullptr;
}

const char* end_env(MatrixBrackets b) noexcept {
		switch (b) {
		case MatrixBrackets::BMatrix:
				return "\\end{bmatrix}";
		case MatrixBrackets::PMatrix:
				return "\\end{pmatrix}";
		}
		assert(false && "invalid MatrixBrackets");
		return nullptr;
}

bool masked(const MatrixStyle& style, Index row, Index col) noexcept {
		switch (style.triangle) {
		case Triangle::Full:
				return false;
		case Triangle::Lower:
				return col > row;
		case Triangle::Upper:
				return row > col && col < style.mask_cols;
		}
		return false;
}

ErrorCode write_matrix_inner(MatrixView m, const MatrixStyle& style, Writer& w) noexcept {
		if (!m.data)
				return ErrorCode::Internal;

		const char* begin = begin_env(style.brackets);
		const char* end = end_env(style.brackets);
		if (!begin || !end)
				return ErrorCode::Internal;

		ErrorCode ec = w.append(begin);
		if (!is_ok(ec))
				return ec;

		for (Index row = 0; row < m.rows; row++) {
				for (Index col = 0; col < m.cols; col++) {
						if (col != 0) {
								ec = w.append(" & ");
								if (!is_ok(ec))
										return ec;
						}

						ec = masked(style, row, col) ? w.put('0') : w.append_double_latex(m.at(row, col));
						if (!is_ok(ec))
								return ec;
				}

				if (row + 1 < m.rows) {
						ec = w.append(" \\\\ ");
						if (!is_ok(ec))
								return ec;
				}
		}

		return w.append(end);
}

ErrorCode write_vector_inner(VectorView v, Writer& w) noexcept {
		if (!v.data)
				return ErrorCode::Internal;

		ErrorCode ec = w.append("\\begin{bmatrix}");
		if (!is_ok(ec))
				return ec;
		for (Index i = 0; i < v.size; i++) {
				ec = w.append_double_latex(v.at(i));
				if (!is_ok(ec))
						return ec;
				if (i + 1 < v.size) {
						ec = w.append(" \\\\ ");
						if (!is_ok(ec))
								return ec;
				}
		}
		return w.append("\\end{bmatrix}");
}

ErrorCode write_lu_inner(MatrixView l, MatrixView u, Index u_mask_cols, Writer& w) noexcept {
		ErrorCode ec = w.append("L = ");
		if (!is_ok(ec))
				return ec;
		ec = write_matrix_inner(l, {MatrixBrackets::BMatrix, Triangle::Lower, kMaxDim}, w);
		if (!is_ok(ec))
				return ec;
		ec = w.append(", \\quad U = ");
		if (!is_ok(ec))
				return ec;
		return write_matrix_inner(u, {MatrixBrackets::BMatrix, Triangle::Upper, u_mask_cols}, w);
}

Writer begin_output(Buffer out) noexcept {
		Writer w{out.data, out.cap, 0};
		if (w.data && w.cap)
				w.data[0] = '\0';
		return w;
}

} // namespace

ErrorCode write_matrix(MatrixView m, MatrixStyle style, Buffer out) noexcept {
		Writer w = begin_output(out);
		return write_matrix_inner(m, style, w);
}

ErrorCode write_matrix_display(MatrixView m, MatrixStyle style, Buffer out) noexcept {
		Writer w = begin_output(out);
		ErrorCode ec = w.append("$$");
		if (!is_ok(ec))
				return ec;
		ec = write_matrix_inner(m, style, w);
		if (!is_ok(ec))
				return ec;
		return w.append("$$");
}

ErrorCode write_vector_display(const char* name, VectorView v, Buffer out) noexcept {
		Writer w = begin_output(out);
		ErrorCode ec = w.append("$$");
		if (!is_ok(ec))
				return ec;
		if (name) {
				ec = w.append(name);
				if (!is_ok(ec))
						return ec;
				ec = w.append(" = ");
				if (!is_ok(ec))
						return ec;
		}
		ec = write_vector_inner(v, w);
		if (!is_ok(ec))
				return ec;
		return w.append("$$");
}

ErrorCode write_augmented_display(MatrixView left, VectorView right, Buffer out) noexcept {
		Writer w = begin_output(out);
		if (!left.data || !right.data)
				return ErrorCode::Internal;
		if (left.rows != right.size)
				return ErrorCode::DimensionMismatch;

		ErrorCode ec = w.append("$$\\left[\\begin{array}{");
		if (!is_ok(ec))
				return ec;
		for (Index i = 0; i < left.cols; i++) {
				ec = w.put('r');
				if (!is_ok(ec))
						return ec;
		}
		ec = w.append("|r}");
		if (!is_ok(ec))
				return ec;

		for (Index row = 0; row < left.rows; row++) {
				for (Index col = 0; col < left.cols; col++) {
						ec = w.append_double_latex(left.at(row, col));
						if (!is_ok(ec))
								return ec;
						ec = w.append(" & ");
						if (!is_ok(ec))
								return ec;
				}
				ec = w.append_double_latex(right.at(row));
				if (!is_ok(ec))
						return ec;

				if (row + 1 < left.rows) {
						ec = w.append(" \\\\ ");
						if (!is_ok(ec))
								return ec;
				}
		}

		return w.append("\\end{array}\\right]$$");
}

ErrorCode write_lu_display(MatrixView l, MatrixView u, Index u_mask_cols, Buffer out) noexcept {
		Writer w = begin_output(out);
		ErrorCode ec = w.append("$$");
		if (!is_ok(ec))
				return ec;
		ec = write_lu_inner(l, u, u_mask_cols, w);
		if (!is_ok(ec))
				return ec;
		return w.append("$$");
}

ErrorCode write_pivoted_lu_display(MatrixView l, MatrixView u, PermutationView p, Buffer out) noexcept {
		Writer w = begin_output(out);
		if (!p.rows)
				return ErrorCode::Internal;

		ErrorCode ec = w.append("$$");
		if (!is_ok(ec))
				return ec;
		ec = write_lu_inner(l, u, kMaxDim, w);
		if (!is_ok(ec))
				return ec;
		ec = w.append(", \\quad p = (");
		if (!is_ok(ec))
				return ec;
		for (Index k = 0; k < p.size; k++) {
				if (k != 0) {
						ec = w.append(", ");
						if (!is_ok(ec))
								return ec;
				}
				ec = w.append_index1(p.at(k));
				if (!is_ok(ec))
						return ec;
		}
		return w.append(")$$");
}

} // namespace lusolve::latex
