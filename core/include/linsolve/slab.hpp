#pragma once

#include <cstddef>
#include <memory>
#include <new>

#include "linsolve/arena.hpp"
#include "linsolve/error.hpp"

namespace linsolve {
// owns the heap block behind a persist / scratch arena pair
class Slab {
	  public:
		ErrorCode init(std::size_t bytes) noexcept {
				block_.reset();
				bytes_ = 0;
				if (bytes == 0)
						return ErrorCode::InvalidDimension;
				block_.reset(new (std::nothrow) std::byte[bytes]);
				if (!block_)
						return ErrorCode::Overflow;
				bytes_ = bytes;
				return ErrorCode::Ok;
		}

		std::size_t size() const noexcept { return bytes_; }

		// lower half backs results that outlive a call, upper half backs per
		// call working copies. either target may be null
		void split(Out Arena* persist, Out Arena* scratch) const noexcept {
				const std::size_t lower = bytes_ / 2;
				if (persist)
						persist->reset(block_.get(), lower);
				if (scratch)
						scratch->reset(block_ ? block_.get() + lower : nullptr, bytes_ - lower);
		}

	  private:
		std::unique_ptr<std::byte[]> block_;
		std::size_t bytes_ = 0;
};
} // namespace linsolve
