#pragma once

#include <cstdint>

#include "linsolve/matrix.hpp"

namespace linsolve {
// returned by the scans below when every inspected entry is (approximately) zero
constexpr int kNotFound = -1;

// first row r >= starting_row with m[r][column] non-zero, scanning downward.
// kNotFound when the tail of the column is zero or starting_row/column lie
// outside the matrix
int first_nonzero_in_column(In MatrixView m, In std::uint8_t column, In std::uint8_t starting_row) noexcept;

// first column c with m[row][c] non-zero, scanning left to right. with
// augmented=true the last (constants) column is not inspected
int first_nonzero_in_row(In MatrixView m, In std::uint8_t row, In bool augmented) noexcept;

} // namespace linsolve
