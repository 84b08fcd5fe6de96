#pragma once

#include <cstddef>
#include <cstdint>

#include "linsolve/error.hpp"

namespace linsolve {
// one elementary row operation as recorded by the reducers
struct RowOp {
		enum class Kind : std::uint8_t {
				Swap,   // R_row <-> R_other
				Divide, // R_row <- R_row / k
				SubMul, // R_row <- R_row - k R_other
		};

		Kind kind = Kind::Swap;
		std::uint8_t row = 0;
		std::uint8_t other = 0;
		double k = 0.0;

		static constexpr RowOp swap(std::uint8_t row, std::uint8_t other) noexcept { return {Kind::Swap, row, other, 0.0}; }
		static constexpr RowOp divide(std::uint8_t row, double k) noexcept { return {Kind::Divide, row, row, k}; }
		static constexpr RowOp submul(std::uint8_t row, std::uint8_t other, double k) noexcept {
				return {Kind::SubMul, row, other, k};
		}
};

// LaTeX caption such as "$R_{2} \leftarrow R_{2} - (3) R_{1}$", rows 1 based
ErrorCode row_op_caption(In const RowOp& op, Out char* out, In std::size_t cap) noexcept;

} // namespace linsolve
