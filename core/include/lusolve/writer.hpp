#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include "lusolve/error.hpp"

namespace lusolve {

// string builder helper that writes to a fixed capacity buffer
// all operations are noexcept and return ErrorCode on overflow
struct Writer {
		char* data = nullptr;
		std::size_t cap = 0;
		std::size_t len = 0;

		ErrorCode put(char ch) noexcept {
				if (!data || cap == 0)
						return ErrorCode::BufferTooSmall;
				if (len + 1 >= cap)
						return ErrorCode::BufferTooSmall;
				data[len++] = ch;
				data[len] = '\0';
				return ErrorCode::Ok;
		}

		ErrorCode append(const char* s) noexcept {
				if (!s)
						return ErrorCode::Internal;
				for (std::size_t i = 0; s[i] != '\0'; i++) {
						ErrorCode ec = put(s[i]);
						if (!is_ok(ec))
								return ec;
				}
				return ErrorCode::Ok;
		}

		ErrorCode append_u64(std::uint64_t v) noexcept {
				char buf[32];
				std::size_t n = 0;
				do {
						buf[n++] = static_cast<char>('0' + (v % 10u));
						v /= 10u;
				} while (v != 0u);

				for (std::size_t i = 0; i < n; i++) {
						ErrorCode ec = put(buf[n - 1 - i]);
						if (!is_ok(ec))
								return ec;
				}
				return ErrorCode::Ok;
		}

		// append a 1 based index (v+1) as decimal
		ErrorCode append_index1(Index v) noexcept { return append_u64(static_cast<std::uint64_t>(v) + 1u); }

		// append a double as LaTeX, up to `digits` significant digits. exponents
		// come out as 10^{e}, non-finite values as \infty / \mathrm{NaN}
		ErrorCode append_double_latex(double v, int digits = 6) noexcept {
				if (std::isnan(v))
						return append("\\mathrm{NaN}");
				if (std::isinf(v))
						return append(v < 0 ? "-\\infty" : "\\infty");
				if (v == 0.0)
						return put('0');

				char buf[48];
				const int n = std::snprintf(buf, sizeof(buf), "%.*g", digits, v);
				if (n < 0 || static_cast<std::size_t>(n) >= sizeof(buf))
						return ErrorCode::Internal;

				for (int i = 0; i < n; i++) {
						if (buf[i] != 'e') {
								ErrorCode ec = put(buf[i]);
								if (!is_ok(ec))
										return ec;
								continue;
						}
						// 1e-16 -> 1 \cdot 10^{-16}
						const long exp = std::strtol(buf + i + 1, nullptr, 10);
						ErrorCode ec = append(" \\cdot 10^{");
						if (!is_ok(ec))
								return ec;
						if (exp < 0) {
								ec = put('-');
								if (!is_ok(ec))
										return ec;
						}
						ec = append_u64(static_cast<std::uint64_t>(exp < 0 ? -exp : exp));
						if (!is_ok(ec))
								return ec;
						return put('}');
				}
				return ErrorCode::Ok;
		}
};

} // namespace lusolve
