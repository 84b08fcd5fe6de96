#pragma once

#include "linsolve/error.hpp"
#include "linsolve/matrix.hpp"

namespace linsolve::detail {
// determinant via largest magnitude partial pivoting (triangularize + multiply
// diagonal). destroys m
ErrorCode det_elim(InOut MatrixMutView m, Out double* det_out) noexcept;
} // namespace linsolve::detail
