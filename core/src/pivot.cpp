#include "linsolve/pivot.hpp"

#include "linsolve/numeric.hpp"

namespace linsolve {

int first_nonzero_in_column(MatrixView m, std::uint8_t column, std::uint8_t starting_row) noexcept {
		if (!m.data || column >= m.cols)
				return kNotFound;

		for (std::uint8_t row = starting_row; row < m.rows; row++) {
				if (!approx_zero(m.at(row, column)))
						return row;
		}
		return kNotFound;
}

int first_nonzero_in_row(MatrixView m, std::uint8_t row, bool augmented) noexcept {
		if (!m.data || row >= m.rows)
				return kNotFound;

		const std::uint8_t end = augmented ? static_cast<std::uint8_t>(m.cols - 1) : m.cols;
		for (std::uint8_t col = 0; col < end; col++) {
				if (!approx_zero(m.at(row, col)))
						return col;
		}
		return kNotFound;
}

} // namespace linsolve
