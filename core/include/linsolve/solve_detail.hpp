#pragma once

#include "linsolve/arena.hpp"
#include "linsolve/error.hpp"
#include "linsolve/explanation.hpp"
#include "linsolve/matrix.hpp"
#include "linsolve/ops.hpp"
#include "linsolve/row_ops.hpp"

namespace linsolve::detail {
// square non-empty A and an n x 1 B
Error check_system(In MatrixView a, In MatrixView b) noexcept;

// Internal when steps are requested without somewhere to put them,
// FeatureDisabled when they are compiled out
Error check_explain(In const ExplainOptions& opts, In const Explanation* expl) noexcept;

// det(A) computed on a copy taken from `arena`; the copy is released again
// before returning
ErrorCode det_of(In MatrixView a, InOut Arena& arena, Out double* out) noexcept;

// the upfront singularity test of the reducer
bool is_singular(In double det) noexcept;

// [A | B] without shape checks beyond matching row counts
ErrorCode build_augmented(In MatrixView a, In MatrixView b, InOut Arena& arena, Out MatrixMutView* out) noexcept;

// x[i] = constants column of the row whose pivot sits in column i. a row the
// reducer skipped (no pivot at all) hands its constant to x[row]
void read_solution(In MatrixView reduced, Out VectorMutView x) noexcept;

// left n x n block and right n x 1 block of an n x (n+1) matrix
MatrixView coefficient_block(In MatrixView m) noexcept;
MatrixView constants_block(In MatrixView m) noexcept;

// caption of `op` (when a caption buffer is given) and m as a display [A | B]
ErrorCode render_system_step(In const RowOp* op, In MatrixView m, In const StepRenderBuffers& out) noexcept;
} // namespace linsolve::detail
