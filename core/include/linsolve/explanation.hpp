#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>

#include "linsolve/arena.hpp"
#include "linsolve/error.hpp"

namespace linsolve {
// caller owned output of one rendered step. caption and latex are optional;
// scratch is mandatory and is cleared before each render
struct StepRenderBuffers {
		char* caption = nullptr;
		std::size_t caption_cap = 0;
		char* latex = nullptr;
		std::size_t latex_cap = 0;
		Arena* scratch = nullptr;
};

// how an operation replays its own steps from the context it stored
struct StepReplay {
		std::size_t (*count)(In const void* ctx) noexcept;
		ErrorCode (*render)(In const void* ctx, In std::size_t index, In const StepRenderBuffers& out) noexcept;
};

// handle to the intermediate states of one call. the context lives in the
// persist arena given to that call and must outlive the handle, as must the
// input matrices it refers to. steps are recomputed on every render
class Explanation {
	  public:
		Explanation() noexcept = default;
		Explanation(const void* ctx, const StepReplay* replay) noexcept : ctx_(ctx), replay_(replay) {}

		Explanation(const Explanation&) = delete;
		Explanation& operator=(const Explanation&) = delete;

		Explanation(Explanation&& other) noexcept
		    : ctx_(std::exchange(other.ctx_, nullptr)), replay_(std::exchange(other.replay_, nullptr)) {}
		Explanation& operator=(Explanation&& other) noexcept {
				if (this != &other) {
						ctx_ = std::exchange(other.ctx_, nullptr);
						replay_ = std::exchange(other.replay_, nullptr);
				}
				return *this;
		}

		bool available() const noexcept { return ctx_ && replay_; }

		std::size_t step_count() const noexcept;
		ErrorCode render_step(In std::size_t index, In const StepRenderBuffers& out) const noexcept;

	  private:
		const void* ctx_ = nullptr;
		const StepReplay* replay_ = nullptr;
};

} // namespace linsolve
