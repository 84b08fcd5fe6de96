#include "linsolve/ops.hpp"

#include "linsolve/row_reduction.hpp"
#include "linsolve/solve_detail.hpp"

namespace linsolve {

Error op_back_substitution(MatrixView m, Arena& arena, VectorMutView* out) noexcept {
		if (!out || !m.data)
				return fail(ErrorCode::Internal);
		if (m.rows == 0 || m.cols != m.rows + 1)
				return err_shape(m.dim(), {m.rows, static_cast<std::uint8_t>(m.rows + 1)});

		ArenaScope tx(arena);
		VectorMutView x;
		ErrorCode ec = vector_alloc(arena, m.rows, &x);
		if (!is_ok(ec))
				return fail(ec, m.dim());

		{
				// the working copy is dropped once the solution is read
				ArenaScope work_scope(arena);
				MatrixMutView work;
				ec = matrix_clone(arena, m, &work);
				if (is_ok(ec))
						ec = back_substitute_apply(work, nullptr);
				if (!is_ok(ec))
						return fail(ec, m.dim());
				detail::read_solution(work.view(), x);
		}

		*out = x;
		tx.commit();
		return {};
}

} // namespace linsolve
