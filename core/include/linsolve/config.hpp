#pragma once

#include <cstddef>
#include <cstdint>

namespace linsolve {
constexpr std::uint8_t kMaxRows = 64;
// augmented matrices [A | B] need more columns than a square A
constexpr std::uint8_t kMaxCols = 128;
constexpr std::size_t kMaxEntries = static_cast<std::size_t>(kMaxRows) * static_cast<std::size_t>(kMaxCols);

// entrywise zero test used by pivot scans and elimination
constexpr double kZeroTolerance = 1e-5;
// whole matrix singularity test applied to det(A). kept apart from
// kZeroTolerance, the two guard different decisions
constexpr double kSingularTolerance = 1e-5;
} // namespace linsolve

#ifndef LINSOLVE_ENABLE_STEPS
#define LINSOLVE_ENABLE_STEPS 1
#endif
