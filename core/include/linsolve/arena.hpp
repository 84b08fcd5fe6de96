#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <new>

namespace linsolve {
// bump allocator over a caller owned buffer. matrices, vectors and explanation
// contexts are carved out of it; nothing is released individually
class Arena {
	  public:
		Arena() noexcept = default;
		Arena(void* buffer, std::size_t capacity) noexcept { reset(buffer, capacity); }

		void reset(void* buffer, std::size_t capacity) noexcept {
				begin_ = static_cast<std::byte*>(buffer);
				end_ = begin_ ? begin_ + capacity : nullptr;
				top_ = begin_;
		}

		void clear() noexcept { top_ = begin_; }

		std::size_t capacity() const noexcept { return static_cast<std::size_t>(end_ - begin_); }
		std::size_t used() const noexcept { return static_cast<std::size_t>(top_ - begin_); }
		std::size_t remaining() const noexcept { return static_cast<std::size_t>(end_ - top_); }

		// uninitialized storage for `count` trivially constructible T, nullptr
		// when the arena cannot hold them
		template <typename T> T* allocate_array(std::size_t count) noexcept {
				if (count == 0 || count > remaining() / sizeof(T))
						return nullptr;
				void* p = top_;
				std::size_t space = remaining();
				if (!std::align(alignof(T), sizeof(T) * count, p, space))
						return nullptr;
				top_ = static_cast<std::byte*>(p) + sizeof(T) * count;
				return static_cast<T*>(p);
		}

		// value initialized T; its destructor is never run
		template <typename T> T* create() noexcept {
				T* slot = allocate_array<T>(1);
				return slot ? new (slot) T{} : nullptr;
		}

	  private:
		friend class ArenaScope;

		std::byte* begin_ = nullptr;
		std::byte* end_ = nullptr;
		std::byte* top_ = nullptr;
};

// everything allocated from the arena while the scope is open is dropped
// again on exit, unless commit() was called
class ArenaScope final {
	  public:
		explicit ArenaScope(Arena& arena) noexcept : arena_(&arena), saved_top_(arena.top_) {}

		ArenaScope(const ArenaScope&) = delete;
		ArenaScope& operator=(const ArenaScope&) = delete;

		~ArenaScope() noexcept {
				if (!arena_)
						return;
				// scopes must close innermost first
				assert(arena_->top_ >= saved_top_);
				arena_->top_ = saved_top_;
		}

		void commit() noexcept { arena_ = nullptr; }

	  private:
		Arena* arena_;
		std::byte* saved_top_;
};
} // namespace linsolve
