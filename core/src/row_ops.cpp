#include "lusolve/row_ops.hpp"

#include "lusolve/writer.hpp"

namespace lusolve {

ErrorCode row_op_caption(const RowOp& op, char* out, std::size_t cap) noexcept {
		if (!out || cap == 0)
				return ErrorCode::BufferTooSmall;
		out[0] = '\0';

		Writer w{out, cap, 0};

		switch (op.kind) {
		case RowOpKind::Eliminate: {
				ErrorCode ec = w.append("$R_{i} \\leftarrow R_{i} - L_{i,");
				if (!is_ok(ec))
						return ec;
				ec = w.append_index1(op.step);
				if (!is_ok(ec))
						return ec;
				ec = w.append("} R_{");
				if (!is_ok(ec))
						return ec;
				ec = w.append_index1(op.step);
				if (!is_ok(ec))
						return ec;
				ec = w.append("}, \\; i > ");
				if (!is_ok(ec))
						return ec;
				ec = w.append_index1(op.step);
				if (!is_ok(ec))
						return ec;
				ec = w.append(", \\quad U_{");
				if (!is_ok(ec))
						return ec;
				ec = w.append_index1(op.step);
				if (!is_ok(ec))
						return ec;
				ec = w.put(',');
				if (!is_ok(ec))
						return ec;
				ec = w.append_index1(op.step);
				if (!is_ok(ec))
						return ec;
				ec = w.append("} = ");
				if (!is_ok(ec))
						return ec;
				ec = w.append_double_latex(op.pivot);
				if (!is_ok(ec))
						return ec;
				return w.put('$');
		}
		case RowOpKind::Pivot: {
				ErrorCode ec = w.append("$p_{");
				if (!is_ok(ec))
						return ec;
				ec = w.append_index1(op.step);
				if (!is_ok(ec))
						return ec;
				ec = w.append("} = ");
				if (!is_ok(ec))
						return ec;
				ec = w.append_index1(op.pivot_row);
				if (!is_ok(ec))
						return ec;
				ec = w.append(", \\quad U_{");
				if (!is_ok(ec))
						return ec;
				ec = w.append_index1(op.step);
				if (!is_ok(ec))
						return ec;
				ec = w.put(',');
				if (!is_ok(ec))
						return ec;
				ec = w.append_index1(op.step);
				if (!is_ok(ec))
						return ec;
				ec = w.append("} = ");
				if (!is_ok(ec))
						return ec;
				ec = w.append_double_latex(op.pivot);
				if (!is_ok(ec))
						return ec;
				return w.put('$');
		}
		}
		__builtin_unreachable();
}

} // namespace lusolve
