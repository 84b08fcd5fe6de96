#include "linsolve/ops.hpp"

#include "linsolve/row_reduction.hpp"
#include "linsolve/solve_detail.hpp"

#include <cmath>

namespace linsolve {

Error op_swap_rows(MatrixView m, std::uint8_t i, std::uint8_t j, Arena& arena, MatrixMutView* out) noexcept {
		if (!out || !m.data)
				return fail(ErrorCode::Internal);
		if (i >= m.rows || j >= m.rows)
				return err_row_index(m.dim(), i, j);

		MatrixMutView copy;
		const ErrorCode ec = matrix_clone(arena, m, &copy);
		if (!is_ok(ec))
				return fail(ec, m.dim());

		apply_row_op(copy, RowOp::swap(i, j));
		*out = copy;
		return {};
}

Error op_augment(MatrixView a, MatrixView b, Arena& arena, MatrixMutView* out) noexcept {
		if (!out || !a.data || !b.data)
				return fail(ErrorCode::Internal);
		if (a.rows != b.rows)
				return err_shape(a.dim(), b.dim());

		const ErrorCode ec = detail::build_augmented(a, b, arena, out);
		return is_ok(ec) ? Error{} : fail(ec, a.dim(), b.dim());
}

Error op_det(MatrixView a, Arena& scratch, double* out) noexcept {
		if (!out || !a.data)
				return fail(ErrorCode::Internal);
		if (a.rows != a.cols)
				return err_not_square(a.dim());

		scratch.clear();
		const ErrorCode ec = detail::det_of(a, scratch, out);
		return is_ok(ec) ? Error{} : fail(ec, a.dim());
}

Error op_residual(MatrixView a, VectorView x, MatrixView b, Arena& scratch, double* out) noexcept {
		if (!out || !x.data)
				return fail(ErrorCode::Internal);
		Error err = detail::check_system(a, b);
		if (!is_ok(err))
				return err;
		if (x.size != a.cols)
				return err_shape(a.dim(), {x.size, 1});

		scratch.clear();
		MatrixMutView ax;
		ErrorCode ec = matrix_alloc(scratch, a.rows, 1, &ax);
		if (is_ok(ec))
				ec = matrix_mul(a, x.as_column(), ax);
		if (!is_ok(ec))
				return fail(ec, a.dim());

		double worst = 0.0;
		for (std::uint8_t r = 0; r < a.rows; r++)
				worst = std::fmax(worst, std::fabs(ax.at(r, 0) - b.at(r, 0)));
		*out = worst;
		return {};
}

} // namespace linsolve
