#pragma once

#include <cstddef>
#include <cstdint>

#include "linsolve/error.hpp"
#include "linsolve/matrix.hpp"

// LaTeX fragments for explanation steps. every writer NUL terminates its
// buffer, also when it fails with BufferTooSmall halfway
namespace linsolve::latex {
struct Buffer {
		char* data = nullptr;
		std::size_t cap = 0;
};

ErrorCode write_number(In double v, Out Buffer out) noexcept;

enum class MatrixBrackets : std::uint8_t {
		BMatrix, // [ ]
		PMatrix, // ( )
		VMatrix, // | |, determinants
};

ErrorCode write_matrix(In MatrixView m, In MatrixBrackets brackets, Out Buffer out) noexcept;
ErrorCode write_matrix_display(In MatrixView m, In MatrixBrackets brackets, Out Buffer out) noexcept;

// [L | R] as \left[\begin{array}{rr|r} ... \end{array}\right]
ErrorCode write_augmented_matrix(In MatrixView left, In MatrixView right, Out Buffer out) noexcept;
ErrorCode write_augmented_matrix_display(In MatrixView left, In MatrixView right, Out Buffer out) noexcept;

// $$name = \begin{bmatrix} v_0 \\ ... \end{bmatrix}$$
ErrorCode write_named_vector_display(In const char* name, In VectorView v, Out Buffer out) noexcept;

// $$label = value$$
ErrorCode write_named_number_display(In const char* label, In double v, Out Buffer out) noexcept;
} // namespace linsolve::latex
