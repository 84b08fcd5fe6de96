#include "linsolve/row_reduction.hpp"

#include "linsolve/numeric.hpp"
#include "linsolve/pivot.hpp"

#include <utility>

namespace linsolve {
namespace {
ErrorCode check_augmented(MatrixMutView m) noexcept {
		if (!m.data)
				return ErrorCode::Internal;
		if (m.rows == 0 || m.cols != m.rows + 1)
				return ErrorCode::DimensionMismatch;
		return ErrorCode::Ok;
}

// false when the trace asks the pass to stop
bool perform(MatrixMutView m, const RowOp& op, OpTrace* trace) noexcept {
		apply_row_op(m, op);
		return !trace || trace->record(op);
}
} // namespace

void apply_row_op(MatrixMutView m, const RowOp& op) noexcept {
		switch (op.kind) {
		case RowOp::Kind::Swap:
				if (op.row != op.other) {
						for (std::uint8_t col = 0; col < m.cols; col++)
								std::swap(m.at(op.row, col), m.at(op.other, col));
				}
				break;
		case RowOp::Kind::Divide:
				for (std::uint8_t col = 0; col < m.cols; col++)
						m.at(op.row, col) /= op.k;
				break;
		case RowOp::Kind::SubMul:
				for (std::uint8_t col = 0; col < m.cols; col++)
						m.at(op.row, col) -= op.k * m.at(op.other, col);
				break;
		}
}

ErrorCode echelon_apply(MatrixMutView m, OpTrace* trace) noexcept {
		const ErrorCode ec = check_augmented(m);
		if (!is_ok(ec))
				return ec;

		for (std::uint8_t p = 0; p < m.rows; p++) {
				if (approx_zero(m.at(p, p))) {
						const int below = first_nonzero_in_column(m.view(), p, static_cast<std::uint8_t>(p + 1));
						if (below == kNotFound)
								continue;
						if (!perform(m, RowOp::swap(p, static_cast<std::uint8_t>(below)), trace))
								return ErrorCode::Ok;
				}

				const double pivot = m.at(p, p);
				if (pivot != 1.0 && !perform(m, RowOp::divide(p, pivot), trace))
						return ErrorCode::Ok;

				for (std::uint8_t r = static_cast<std::uint8_t>(p + 1); r < m.rows; r++) {
						const double factor = m.at(r, p);
						if (factor != 0.0 && !perform(m, RowOp::submul(r, p, factor), trace))
								return ErrorCode::Ok;
				}
		}
		return ErrorCode::Ok;
}

ErrorCode back_substitute_apply(MatrixMutView m, OpTrace* trace) noexcept {
		const ErrorCode ec = check_augmented(m);
		if (!is_ok(ec))
				return ec;

		for (std::uint8_t p = m.rows; p-- > 0;) {
				const int col = first_nonzero_in_row(m.view(), p, true);
				if (col == kNotFound)
						continue;

				for (std::uint8_t r = 0; r < p; r++) {
						const double factor = m.at(r, static_cast<std::uint8_t>(col));
						if (factor != 0.0 && !perform(m, RowOp::submul(r, p, factor), trace))
								return ErrorCode::Ok;
				}
		}
		return ErrorCode::Ok;
}

} // namespace linsolve
