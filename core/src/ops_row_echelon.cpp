#include "linsolve/ops.hpp"

#include "linsolve/row_reduction.hpp"
#include "linsolve/solve_detail.hpp"

namespace linsolve {
namespace {

#if LINSOLVE_ENABLE_STEPS
// step 0 is [A | B] as given, step k the state after the k-th forward op
struct EchelonSteps {
		MatrixView a;
		MatrixView b;
		std::size_t ops = 0;
};

std::size_t echelon_step_count(const void* ctx) noexcept {
		return static_cast<const EchelonSteps*>(ctx)->ops + 1;
}

ErrorCode echelon_render(const void* vctx, std::size_t index, const StepRenderBuffers& out) noexcept {
		const auto* ctx = static_cast<const EchelonSteps*>(vctx);
		MatrixMutView work;
		ErrorCode ec = detail::build_augmented(ctx->a, ctx->b, *out.scratch, &work);
		if (!is_ok(ec) || index == 0)
				return is_ok(ec) ? detail::render_system_step(nullptr, work.view(), out) : ec;

		OpTrace trace(index);
		ec = echelon_apply(work, &trace);
		if (!is_ok(ec))
				return ec;
		if (trace.count() != index)
				return ErrorCode::StepOutOfRange;
		return detail::render_system_step(trace.last(), work.view(), out);
}

constexpr StepReplay kEchelonReplay = {
        .count = &echelon_step_count,
        .render = &echelon_render,
};
#endif // LINSOLVE_ENABLE_STEPS

} // namespace

Error op_row_echelon(MatrixView a, MatrixView b, Arena& arena, EchelonResult* out, Explanation* expl, const ExplainOptions& opts) noexcept {
		if (!out)
				return fail(ErrorCode::Internal);
		Error err = detail::check_system(a, b);
		if (is_ok(err))
				err = detail::check_explain(opts, expl);
		if (!is_ok(err))
				return err;

		EchelonResult result;
		ErrorCode ec = detail::det_of(a, arena, &result.det);
		if (!is_ok(ec))
				return fail(ec, a.dim());

		// nothing is allocated for a singular system
		if (detail::is_singular(result.det)) {
				result.status = EchelonStatus::Singular;
				*out = result;
				return {};
		}

		ArenaScope tx(arena);
		ec = detail::build_augmented(a, b, arena, &result.matrix);
		OpTrace trace;
		if (is_ok(ec))
				ec = echelon_apply(result.matrix, &trace);
		if (!is_ok(ec))
				return fail(ec, a.dim(), b.dim());

#if LINSOLVE_ENABLE_STEPS
		if (opts.enable) {
				auto* steps = opts.persist->create<EchelonSteps>();
				if (!steps)
						return fail(ErrorCode::Overflow, a.dim(), b.dim());
				*steps = EchelonSteps{a, b, trace.count()};
				*expl = Explanation(steps, &kEchelonReplay);
		}
#endif

		result.status = EchelonStatus::Reduced;
		*out = result;
		tx.commit();
		return {};
}

} // namespace linsolve
