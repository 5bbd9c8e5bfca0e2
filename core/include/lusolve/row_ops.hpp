#pragma once

#include <cstddef>
#include <cstdint>

#include "lusolve/error.hpp"

namespace lusolve {
enum class RowOpKind : std::uint8_t {
		Eliminate, // R_i <- R_i - L_ik R_k for every i > k
		Pivot,     // pick row r for step k, then eliminate it from every other row
};

// one outer elimination step of an LU factorization
struct RowOp {
		RowOpKind kind = RowOpKind::Eliminate;
		Index step = 0;      // k
		Index pivot_row = 0; // row of A chosen as pivot, Pivot only
		double pivot = 0.0;  // U_kk
};

// human readable caption for a RowOp (1 based row indices)
ErrorCode row_op_caption(In const RowOp& op, Out char* out, In std::size_t cap) noexcept;

} // namespace lusolve
