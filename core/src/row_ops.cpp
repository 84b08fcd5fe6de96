#include "linsolve/row_ops.hpp"

#include "linsolve/writer.hpp"

namespace linsolve {

ErrorCode row_op_caption(const RowOp& op, char* out, std::size_t cap) noexcept {
		Writer w(out, cap);
		w.ch('$').row(op.row);
		switch (op.kind) {
		case RowOp::Kind::Swap:
				w.text(" \\leftrightarrow ").row(op.other);
				break;
		case RowOp::Kind::Divide:
				// parenthesized so negative scalars read unambiguously
				w.text(" \\leftarrow ").row(op.row).text(" / (").number(op.k).ch(')');
				break;
		case RowOp::Kind::SubMul:
				w.text(" \\leftarrow ").row(op.row).text(" - (").number(op.k).text(") ").row(op.other);
				break;
		default:
				return ErrorCode::Internal;
		}
		return w.ch('$').status();
}

} // namespace linsolve
