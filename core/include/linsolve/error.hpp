#pragma once

#include <cstdint>

// parameter direction annotations
#define In
#define Out
#define InOut

namespace linsolve {
struct Dim {
		std::uint8_t rows = 0;
		std::uint8_t cols = 0;
};

// a singular system is not an error; it is reported through the result status
enum class ErrorCode : std::uint8_t {
		Ok = 0,
		FeatureDisabled, // explanation requested with LINSOLVE_ENABLE_STEPS=0
		InvalidDimension,
		DimensionMismatch,
		NotSquare,
		Overflow, // arena exhausted
		BufferTooSmall,
		IndexOutOfRange,
		StepOutOfRange,
		Internal, // null argument or missing arena
};

// `a` is the coefficient matrix (or the only operand), `b` the constants or
// the second operand. i and j carry offending row indices
struct Error {
		ErrorCode code = ErrorCode::Ok;
		Dim a{};
		Dim b{};
		std::uint8_t i = 0;
		std::uint8_t j = 0;
};

constexpr bool is_ok(ErrorCode code) noexcept {
		return code == ErrorCode::Ok;
}
constexpr bool is_ok(const Error& err) noexcept {
		return is_ok(err.code);
}

// lifts a low level ErrorCode into an Error tagged with the operand shapes
constexpr Error fail(ErrorCode code, Dim a = {}, Dim b = {}) noexcept {
		return {code, a, b};
}

constexpr Error err_not_square(Dim a) noexcept {
		return fail(ErrorCode::NotSquare, a);
}
// A and B (or M and its expected shape) disagree
constexpr Error err_shape(Dim a, Dim b) noexcept {
		return fail(ErrorCode::DimensionMismatch, a, b);
}
constexpr Error err_empty(Dim a) noexcept {
		return fail(ErrorCode::InvalidDimension, a);
}
constexpr Error err_row_index(Dim a, std::uint8_t i, std::uint8_t j) noexcept {
		return {ErrorCode::IndexOutOfRange, a, {}, i, j};
}
constexpr Error err_steps_disabled() noexcept {
		return fail(ErrorCode::FeatureDisabled);
}

// short stable name for diagnostics ("not_square", "overflow", ...)
const char* error_name(ErrorCode code) noexcept;
} // namespace linsolve
