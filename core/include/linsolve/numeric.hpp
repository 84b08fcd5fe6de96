#pragma once

#include <cmath>

#include "linsolve/config.hpp"

namespace linsolve {
// |v| <= tol counts as zero. exact comparison against 0.0 is never used for
// pivot or singularity decisions
inline bool approx_zero(double v, double tol = kZeroTolerance) noexcept {
		return std::fabs(v) <= tol;
}
} // namespace linsolve
