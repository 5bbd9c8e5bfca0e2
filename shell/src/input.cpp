#include "lusolve_shell/input.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>

namespace lusolve_shell {
namespace {

constexpr bool is_blank(char c) noexcept {
		return c == ' ' || c == '\t' || c == ',' || c == '\n' || c == '\r';
}

// walks the tokens of `text`, calling fn(row, col, begin, end) for each entry.
// a trailing ';' does not open a new row
template <typename Fn> ParseStatus for_each_entry(const char* text, Fn&& fn) noexcept {
		if (!text)
				return ParseStatus::Empty;

		std::size_t row = 0;
		std::size_t col = 0;
		const char* p = text;
		while (*p != '\0') {
				if (is_blank(*p)) {
						p++;
						continue;
				}
				if (*p == ';') {
						if (col == 0)
								return ParseStatus::Empty;
						row++;
						col = 0;
						p++;
						continue;
				}

				const char* begin = p;
				while (*p != '\0' && *p != ';' && !is_blank(*p))
						p++;
				const ParseStatus s = fn(row, col, begin, p);
				if (s != ParseStatus::Ok)
						return s;
				col++;
		}
		return ParseStatus::Ok;
}

} // namespace

const char* parse_status_name(ParseStatus s) noexcept {
		switch (s) {
		case ParseStatus::Ok:
				return "ok";
		case ParseStatus::Empty:
				return "empty row or input";
		case ParseStatus::BadNumber:
				return "not a finite number";
		case ParseStatus::Ragged:
				return "rows differ in length";
		case ParseStatus::TooLarge:
				return "too many rows or columns";
		case ParseStatus::OutOfMemory:
				return "out of memory";
		}
		return "unknown";
}

bool parse_double(const char* begin, const char* end, double* out) noexcept {
		if (!out || !begin || begin == end)
				return false;

		char buf[64];
		const std::size_t len = static_cast<std::size_t>(end - begin);
		if (len >= sizeof(buf))
				return false;
		std::memcpy(buf, begin, len);
		buf[len] = '\0';

		char* parse_end = nullptr;
		errno = 0;
		const double v = std::strtod(buf, &parse_end);
		if (errno != 0)
				return false;
		if (parse_end != buf + len)
				return false;
		if (!std::isfinite(v))
				return false;
		*out = v;
		return true;
}

ParseStatus parse_matrix(const char* text, lusolve::Arena& arena, lusolve::MatrixMutView* out) noexcept {
		if (!out)
				return ParseStatus::Empty;

		// first pass: shape and number syntax
		std::size_t rows = 0;
		std::size_t cols = 0;
		ParseStatus s = for_each_entry(text, [&](std::size_t row, std::size_t col, const char* b, const char* e) {
				double v = 0.0;
				if (!parse_double(b, e, &v))
						return ParseStatus::BadNumber;
				if (row >= lusolve::kMaxDim || col >= lusolve::kMaxDim)
						return ParseStatus::TooLarge;
				if (row == 0 && col + 1 > cols)
						cols = col + 1;
				if (row > 0 && col >= cols)
						return ParseStatus::Ragged;
				if (row + 1 > rows)
						rows = row + 1;
				return ParseStatus::Ok;
		});
		if (s != ParseStatus::Ok)
				return s;
		if (rows == 0 || cols == 0)
				return ParseStatus::Empty;

		const auto r = static_cast<lusolve::Index>(rows);
		const auto c = static_cast<lusolve::Index>(cols);
		lusolve::MatrixMutView m;
		if (!lusolve::is_ok(lusolve::matrix_alloc(arena, r, c, &m)))
				return ParseStatus::OutOfMemory;

		// second pass: fill, counting entries per row to catch short rows
		std::size_t filled_row = 0;
		std::size_t filled_cols = 0;
		s = for_each_entry(text, [&](std::size_t row, std::size_t col, const char* b, const char* e) {
				if (row != filled_row) {
						if (filled_cols != cols)
								return ParseStatus::Ragged;
						filled_row = row;
				}
				filled_cols = col + 1;
				double v = 0.0;
				if (!parse_double(b, e, &v))
						return ParseStatus::BadNumber;
				m.at_mut(static_cast<lusolve::Index>(row), static_cast<lusolve::Index>(col)) = v;
				return ParseStatus::Ok;
		});
		if (s != ParseStatus::Ok)
				return s;
		if (filled_cols != cols)
				return ParseStatus::Ragged;

		*out = m;
		return ParseStatus::Ok;
}

ParseStatus parse_vector(const char* text, lusolve::Arena& arena, lusolve::VectorMutView* out) noexcept {
		if (!out)
				return ParseStatus::Empty;
		lusolve::MatrixMutView m;
		const ParseStatus s = parse_matrix(text, arena, &m);
		if (s != ParseStatus::Ok)
				return s;

		// a single row or a single column
		if (m.rows != 1 && m.cols != 1)
				return ParseStatus::Ragged;
		out->size = static_cast<lusolve::Index>(m.rows * m.cols);
		out->data = m.data;
		return ParseStatus::Ok;
}

} // namespace lusolve_shell
