#include "linsolve/solve_detail.hpp"

#include "linsolve/det_detail.hpp"
#include "linsolve/latex.hpp"
#include "linsolve/numeric.hpp"
#include "linsolve/pivot.hpp"

namespace linsolve::detail {

Error check_system(MatrixView a, MatrixView b) noexcept {
		if (!a.data || !b.data)
				return fail(ErrorCode::Internal);
		if (a.rows == 0 || a.cols == 0)
				return err_empty(a.dim());
		if (a.rows != a.cols)
				return err_not_square(a.dim());
		if (b.rows != a.rows || b.cols != 1)
				return err_shape(a.dim(), b.dim());
		return {};
}

Error check_explain(const ExplainOptions& opts, const Explanation* expl) noexcept {
		if (!opts.enable)
				return {};
		if (!LINSOLVE_ENABLE_STEPS)
				return err_steps_disabled();
		if (!opts.persist || !expl)
				return fail(ErrorCode::Internal);
		return {};
}

ErrorCode det_of(MatrixView a, Arena& arena, double* out) noexcept {
		if (!out)
				return ErrorCode::Internal;

		ArenaScope scope(arena);
		MatrixMutView work;
		const ErrorCode ec = matrix_clone(arena, a, &work);
		return is_ok(ec) ? det_elim(work, out) : ec;
}

bool is_singular(double det) noexcept {
		return approx_zero(det, kSingularTolerance);
}

ErrorCode build_augmented(MatrixView a, MatrixView b, Arena& arena, MatrixMutView* out) noexcept {
		if (!out || !a.data || !b.data)
				return ErrorCode::Internal;
		if (a.rows != b.rows)
				return ErrorCode::DimensionMismatch;
		if (a.cols + b.cols > kMaxCols)
				return ErrorCode::InvalidDimension;

		ArenaScope scope(arena);
		MatrixMutView aug;
		ErrorCode ec = matrix_alloc(arena, a.rows, static_cast<std::uint8_t>(a.cols + b.cols), &aug);
		// both blocks are copied through views into the combined storage
		if (is_ok(ec))
				ec = matrix_copy(a, MatrixMutView{a.rows, a.cols, aug.stride, aug.data});
		if (is_ok(ec))
				ec = matrix_copy(b, MatrixMutView{b.rows, b.cols, aug.stride, aug.data + a.cols});
		if (!is_ok(ec))
				return ec;

		scope.commit();
		*out = aug;
		return ErrorCode::Ok;
}

void read_solution(MatrixView reduced, VectorMutView x) noexcept {
		if (!reduced.data || !x.data)
				return;

		const auto last = static_cast<std::uint8_t>(reduced.cols - 1);
		for (std::uint8_t r = 0; r < reduced.rows; r++) {
				int unknown = first_nonzero_in_row(reduced, r, true);
				if (unknown == kNotFound)
						unknown = r;
				if (unknown < x.size)
						x.at(static_cast<std::uint8_t>(unknown)) = reduced.at(r, last);
		}
}

MatrixView coefficient_block(MatrixView m) noexcept {
		return {m.rows, static_cast<std::uint8_t>(m.cols - 1), m.stride, m.data};
}

MatrixView constants_block(MatrixView m) noexcept {
		return {m.rows, 1, m.stride, m.data + (m.cols - 1)};
}

ErrorCode render_system_step(const RowOp* op, MatrixView m, const StepRenderBuffers& out) noexcept {
		if (op && out.caption) {
				const ErrorCode ec = row_op_caption(*op, out.caption, out.caption_cap);
				if (!is_ok(ec))
						return ec;
		}
		return latex::write_augmented_matrix_display(coefficient_block(m), constants_block(m), {out.latex, out.latex_cap});
}

} // namespace linsolve::detail
