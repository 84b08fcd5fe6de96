#pragma once

#include <cstddef>
#include <cstdint>

#include "linsolve/error.hpp"
#include "linsolve/matrix.hpp"
#include "linsolve/row_ops.hpp"

// in place reduction passes. callers hand these working buffers they
// allocated themselves; public operations never mutate their inputs
namespace linsolve {

void apply_row_op(InOut MatrixMutView m, In const RowOp& op) noexcept;

// counts the row ops a pass performs. constructed with stop_after = k, the
// pass halts right after its k-th op, which is how step k is replayed
class OpTrace {
	  public:
		OpTrace() noexcept = default;
		explicit OpTrace(std::size_t stop_after) noexcept : stop_after_(stop_after) {}

		// false once the pass should stop
		bool record(const RowOp& op) noexcept {
				last_ = op;
				return ++count_ != stop_after_;
		}

		std::size_t count() const noexcept { return count_; }
		// nullptr until the first op was recorded
		const RowOp* last() const noexcept { return count_ ? &last_ : nullptr; }

	  private:
		std::size_t stop_after_ = 0; // 0: run to completion
		std::size_t count_ = 0;
		RowOp last_{};
};

// forward elimination of an n x (n+1) augmented matrix. a zero pivot is
// replaced by the first usable row below it; a row with none is skipped.
// pivots are divided to 1 and the entries under them eliminated
ErrorCode echelon_apply(InOut MatrixMutView m, InOut OpTrace* trace) noexcept;

// upward elimination of an echelon n x (n+1) matrix: every pivot column is
// cleared above its pivot, leaving the solution in the constants column
ErrorCode back_substitute_apply(InOut MatrixMutView m, InOut OpTrace* trace) noexcept;

} // namespace linsolve
