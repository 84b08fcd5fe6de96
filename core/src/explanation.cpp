#include "linsolve/explanation.hpp"

namespace linsolve {

std::size_t Explanation::step_count() const noexcept {
		return available() ? replay_->count(ctx_) : 0;
}

ErrorCode Explanation::render_step(std::size_t index, const StepRenderBuffers& out) const noexcept {
		if (out.caption && out.caption_cap)
				out.caption[0] = '\0';
		if (out.latex && out.latex_cap)
				out.latex[0] = '\0';

		if (!available() || !out.scratch)
				return ErrorCode::Internal;
		if (index >= replay_->count(ctx_))
				return ErrorCode::StepOutOfRange;

		out.scratch->clear();
		return replay_->render(ctx_, index, out);
}

} // namespace linsolve
