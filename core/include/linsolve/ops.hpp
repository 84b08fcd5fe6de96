#pragma once

#include <cstddef>
#include <cstdint>

#include "linsolve/arena.hpp"
#include "linsolve/config.hpp"
#include "linsolve/error.hpp"
#include "linsolve/explanation.hpp"
#include "linsolve/matrix.hpp"
#include "linsolve/row_ops.hpp"

namespace linsolve {
struct ExplainOptions {
		bool enable = false;
		Arena* persist = nullptr; // holds the step context, required with enable
};

// row and column indices are 0 based, as in m.at(r, c).
//
// every op reads its inputs and never writes them. what it returns is
// allocated in the arena it was handed: results only, working copies are
// released before returning, and a failing op leaves the arena untouched.
// explanations point at the caller's matrices and at a context in
// opts.persist; both must outlive the Explanation

// copy of m with rows i and j exchanged (i == j yields a plain copy)
Error op_swap_rows(In MatrixView m, In std::uint8_t i, In std::uint8_t j, InOut Arena& arena, Out MatrixMutView* out) noexcept;

// [A | B]: A's columns followed by B's, row by row. A and B need the same row
// count; B may have any number of columns
Error op_augment(In MatrixView a, In MatrixView b, InOut Arena& arena, Out MatrixMutView* out) noexcept;

Error op_det(In MatrixView a, InOut Arena& scratch, Out double* out) noexcept;

enum class EchelonStatus : std::uint8_t {
		Reduced,
		Singular, // |det(A)| <= kSingularTolerance, no matrix produced
};

struct EchelonResult {
		EchelonStatus status = EchelonStatus::Singular;
		MatrixMutView matrix{}; // n x (n+1), only set when status == Reduced
		double det = 0.0;       // det(A) as used by the singularity test

		bool reduced() const noexcept { return status == EchelonStatus::Reduced; }
};

// row echelon form of [A | B] for square A and n x 1 B
//
// the singularity test on det(A) runs first; a singular system is reported
// through out->status, not through the returned Error. a zero pivot that
// cannot be replaced from below is skipped without failing
//
// when opts.enable==true, explanation steps render the augmented matrix
// before and after each row operation
Error op_row_echelon(In MatrixView a,
        In MatrixView b,
        InOut Arena& arena,
        Out EchelonResult* out,
        Out Explanation* expl,
        In const ExplainOptions& opts) noexcept;

// solution of an n x (n+1) matrix already in row echelon form. the echelon
// shape is not validated
Error op_back_substitution(In MatrixView m, InOut Arena& arena, Out VectorMutView* out) noexcept;

enum class SolveStatus : std::uint8_t {
		Solved,
		Singular,
};

struct SolveResult {
		SolveStatus status = SolveStatus::Singular;
		VectorMutView solution{}; // one entry per column of A, only set when Solved

		bool solved() const noexcept { return status == SolveStatus::Solved; }
};

// gaussian elimination: row echelon reduction followed by back substitution.
// a solved system leaves exactly the solution vector in `arena`, a singular
// one leaves nothing
//
// when opts.enable==true, explanation steps cover the forward row ops, the
// backward row ops and finally the solution vector. for a singular system the
// explanation holds one step showing det(A)
Error op_gaussian_elimination(In MatrixView a,
        In MatrixView b,
        InOut Arena& arena,
        Out SolveResult* out,
        Out Explanation* expl,
        In const ExplainOptions& opts) noexcept;

// max_i |(A x)_i - b_i| for square A, x of size n and n x 1 b
Error op_residual(In MatrixView a, In VectorView x, In MatrixView b, InOut Arena& scratch, Out double* out) noexcept;

} // namespace linsolve
