#include "linsolve/det_detail.hpp"

#include "linsolve/row_reduction.hpp"

#include <cmath>

namespace linsolve::detail {
namespace {
// row at or below `col` whose entry in `col` has the largest magnitude
std::uint8_t largest_below(MatrixMutView m, std::uint8_t col) noexcept {
		std::uint8_t best = col;
		for (std::uint8_t r = static_cast<std::uint8_t>(col + 1); r < m.rows; r++) {
				if (std::fabs(m.at(r, col)) > std::fabs(m.at(best, col)))
						best = r;
		}
		return best;
}
} // namespace

ErrorCode det_elim(MatrixMutView m, double* det_out) noexcept {
		if (!det_out || !m.data)
				return ErrorCode::Internal;
		if (m.rows != m.cols)
				return ErrorCode::NotSquare;

		// product of the pivots, sign flipped once per row exchange
		double det = 1.0;
		for (std::uint8_t col = 0; col < m.rows; col++) {
				const std::uint8_t p = largest_below(m, col);
				if (m.at(p, col) == 0.0) {
						*det_out = 0.0;
						return ErrorCode::Ok;
				}
				if (p != col) {
						apply_row_op(m, RowOp::swap(col, p));
						det = -det;
				}

				const double pivot = m.at(col, col);
				det *= pivot;
				for (std::uint8_t r = static_cast<std::uint8_t>(col + 1); r < m.rows; r++) {
						if (m.at(r, col) != 0.0)
								apply_row_op(m, RowOp::submul(r, col, m.at(r, col) / pivot));
				}
		}
		*det_out = det;
		return ErrorCode::Ok;
}

} // namespace linsolve::detail
