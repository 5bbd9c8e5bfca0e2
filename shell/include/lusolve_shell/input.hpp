#pragma once

#include <cstdint>

#include "lusolve/arena.hpp"
#include "lusolve/matrix.hpp"

namespace lusolve_shell {

enum class ParseStatus : std::uint8_t {
		Ok,
		Empty,
		BadNumber,
		Ragged, // rows of different length
		TooLarge,
		OutOfMemory,
};

const char* parse_status_name(ParseStatus s) noexcept;

// one finite double, the whole of [begin, end) must be consumed
bool parse_double(const char* begin, const char* end, double* out) noexcept;

// "1 2 3; 4 5 6" -> 2x3. entries are separated by blanks or commas, rows by ';'
ParseStatus parse_matrix(const char* text, lusolve::Arena& arena, lusolve::MatrixMutView* out) noexcept;

// "1 2 3" or "1, 2, 3"
ParseStatus parse_vector(const char* text, lusolve::Arena& arena, lusolve::VectorMutView* out) noexcept;

} // namespace lusolve_shell
