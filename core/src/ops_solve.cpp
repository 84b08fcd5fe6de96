#include "linsolve/ops.hpp"

#include "linsolve/latex.hpp"
#include "linsolve/row_reduction.hpp"
#include "linsolve/solve_detail.hpp"
#include "linsolve/writer.hpp"

namespace linsolve {
namespace {

#if LINSOLVE_ENABLE_STEPS
// regular system: 0 is [A | B], then one step per forward op, one per
// backward op, and finally x. singular system: a single det(A) step
struct SolveSteps {
		MatrixView a;
		MatrixView b;
		double det = 0.0;
		bool singular = false;
		std::size_t forward_ops = 0;
		std::size_t backward_ops = 0;
};

std::size_t solve_step_count(const void* vctx) noexcept {
		const auto* ctx = static_cast<const SolveSteps*>(vctx);
		return ctx->singular ? 1 : ctx->forward_ops + ctx->backward_ops + 2;
}

ErrorCode render_singular(const SolveSteps& ctx, const StepRenderBuffers& out) noexcept {
		if (out.caption) {
				const ErrorCode ec = Writer(out.caption, out.caption_cap).text("no unique solution").status();
				if (!is_ok(ec))
						return ec;
		}
		return latex::write_named_number_display("\\det(A)", ctx.det, {out.latex, out.latex_cap});
}

ErrorCode render_solution(MatrixView reduced, std::uint8_t unknowns, const StepRenderBuffers& out) noexcept {
		VectorMutView x;
		const ErrorCode ec = vector_alloc(*out.scratch, unknowns, &x);
		if (!is_ok(ec))
				return ec;
		detail::read_solution(reduced, x);
		return latex::write_named_vector_display("x", x.view(), {out.latex, out.latex_cap});
}

ErrorCode solve_render(const void* vctx, std::size_t index, const StepRenderBuffers& out) noexcept {
		const auto& ctx = *static_cast<const SolveSteps*>(vctx);
		if (ctx.singular)
				return render_singular(ctx, out);

		MatrixMutView work;
		ErrorCode ec = detail::build_augmented(ctx.a, ctx.b, *out.scratch, &work);
		if (!is_ok(ec))
				return ec;
		if (index == 0)
				return detail::render_system_step(nullptr, work.view(), out);

		if (index <= ctx.forward_ops) {
				OpTrace trace(index);
				ec = echelon_apply(work, &trace);
				return is_ok(ec) ? detail::render_system_step(trace.last(), work.view(), out) : ec;
		}

		ec = echelon_apply(work, nullptr);
		if (!is_ok(ec))
				return ec;

		const std::size_t solution_step = ctx.forward_ops + ctx.backward_ops + 1;
		OpTrace trace(index < solution_step ? index - ctx.forward_ops : 0);
		ec = back_substitute_apply(work, &trace);
		if (!is_ok(ec))
				return ec;
		if (index == solution_step)
				return render_solution(work.view(), ctx.a.cols, out);
		return detail::render_system_step(trace.last(), work.view(), out);
}

constexpr StepReplay kSolveReplay = {
        .count = &solve_step_count,
        .render = &solve_render,
};

// how many ops each pass applies, from a throwaway run in `arena`
ErrorCode count_ops(MatrixView a, MatrixView b, Arena& arena, SolveSteps* steps) noexcept {
		ArenaScope scope(arena);
		MatrixMutView work;
		ErrorCode ec = detail::build_augmented(a, b, arena, &work);
		OpTrace forward;
		OpTrace backward;
		if (is_ok(ec))
				ec = echelon_apply(work, &forward);
		if (is_ok(ec))
				ec = back_substitute_apply(work, &backward);
		steps->forward_ops = forward.count();
		steps->backward_ops = backward.count();
		return ec;
}

ErrorCode attach_steps(MatrixView a, MatrixView b, const EchelonResult& reduced, Arena& arena, Arena& persist, Explanation* expl) noexcept {
		SolveSteps steps{a, b, reduced.det, !reduced.reduced()};
		if (!steps.singular) {
				const ErrorCode ec = count_ops(a, b, arena, &steps);
				if (!is_ok(ec))
						return ec;
		}

		auto* stored = persist.create<SolveSteps>();
		if (!stored)
				return ErrorCode::Overflow;
		*stored = steps;
		*expl = Explanation(stored, &kSolveReplay);
		return ErrorCode::Ok;
}
#endif // LINSOLVE_ENABLE_STEPS

} // namespace

Error op_gaussian_elimination(
        MatrixView a, MatrixView b, Arena& arena, SolveResult* out, Explanation* expl, const ExplainOptions& opts) noexcept {
		if (!out)
				return fail(ErrorCode::Internal);
		Error err = detail::check_system(a, b);
		if (is_ok(err))
				err = detail::check_explain(opts, expl);
		if (!is_ok(err))
				return err;

		ArenaScope tx(arena);
		SolveResult result;
		EchelonResult reduced;
		{
				// kept only for a solved system
				ArenaScope solution_scope(arena);
				VectorMutView x;
				ErrorCode ec = vector_alloc(arena, a.cols, &x);
				if (!is_ok(ec))
						return fail(ec, a.dim());

				{
						// the reduced matrix only lives until the solution is read
						ArenaScope work_scope(arena);
						err = op_row_echelon(a, b, arena, &reduced, nullptr, ExplainOptions{});
						if (!is_ok(err))
								return err;
						if (reduced.reduced()) {
								ec = back_substitute_apply(reduced.matrix, nullptr);
								if (!is_ok(ec))
										return fail(ec, a.dim(), b.dim());
								detail::read_solution(reduced.matrix.view(), x);
						}
				}

				if (reduced.reduced()) {
						solution_scope.commit();
						result.status = SolveStatus::Solved;
						result.solution = x;
				} else {
						result.status = SolveStatus::Singular;
				}
		}

#if LINSOLVE_ENABLE_STEPS
		if (opts.enable) {
				const ErrorCode ec = attach_steps(a, b, reduced, arena, *opts.persist, expl);
				if (!is_ok(ec))
						return fail(ec, a.dim(), b.dim());
		}
#endif

		*out = result;
		tx.commit();
		return {};
}

} // namespace linsolve
