#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>

#include "linsolve/error.hpp"
#include "linsolve/numeric.hpp"

namespace linsolve {

// appends text and numbers to a fixed, always NUL terminated buffer. the
// first failure is sticky: later calls do nothing and status() returns it,
// so callers chain appends and check once at the end
class Writer {
	  public:
		Writer(char* data, std::size_t cap) noexcept : data_(data), cap_(cap) {
				if (!data_ || cap_ == 0)
						status_ = ErrorCode::BufferTooSmall;
				else
						data_[0] = '\0';
		}

		ErrorCode status() const noexcept { return status_; }

		Writer& ch(char c) noexcept {
				if (!is_ok(status_))
						return *this;
				if (len_ + 1 >= cap_) {
						status_ = ErrorCode::BufferTooSmall;
						return *this;
				}
				data_[len_++] = c;
				data_[len_] = '\0';
				return *this;
		}

		Writer& text(const char* s) noexcept {
				if (!s && is_ok(status_))
						status_ = ErrorCode::Internal;
				for (; is_ok(status_) && *s != '\0'; s++)
						ch(*s);
				return *this;
		}

		// six significant digits. rounding residue within kZeroTolerance,
		// including -0, prints as "0"
		Writer& number(double v) noexcept {
				if (approx_zero(v))
						return ch('0');
				char digits[32];
				const int n = std::snprintf(digits, sizeof(digits), "%.6g", v);
				if (n < 0 || static_cast<std::size_t>(n) >= sizeof(digits)) {
						if (is_ok(status_))
								status_ = ErrorCode::Internal;
						return *this;
				}
				return text(digits);
		}

		// R_{k} with k the 1 based row number
		Writer& row(std::uint8_t r) noexcept {
				char digits[8];
				std::snprintf(digits, sizeof(digits), "%u", static_cast<unsigned>(r) + 1u);
				return text("R_{").text(digits).ch('}');
		}

	  private:
		char* data_ = nullptr;
		std::size_t cap_ = 0;
		std::size_t len_ = 0;
		ErrorCode status_ = ErrorCode::Ok;
};

} // namespace linsolve
