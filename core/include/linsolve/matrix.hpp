#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>

#include "linsolve/arena.hpp"
#include "linsolve/config.hpp"
#include "linsolve/error.hpp"

namespace linsolve {
// non owning row major window. T is `const double` for read only views and
// `double` for views an operation may write through
template <typename T> struct BasicMatrixView {
		std::uint8_t rows = 0;
		std::uint8_t cols = 0;
		std::uint8_t stride = 0; // elements between the starts of two rows
		T* data = nullptr;

		constexpr Dim dim() const noexcept { return {rows, cols}; }

		T& at(std::uint8_t r, std::uint8_t c) const noexcept {
				assert(data && r < rows && c < cols);
				return data[static_cast<std::size_t>(r) * stride + c];
		}

		BasicMatrixView<const double> view() const noexcept { return {rows, cols, stride, data}; }
};

using MatrixView = BasicMatrixView<const double>;
using MatrixMutView = BasicMatrixView<double>;

// solution vectors: one entry per unknown
template <typename T> struct BasicVectorView {
		std::uint8_t size = 0;
		T* data = nullptr;

		T& at(std::uint8_t i) const noexcept {
				assert(data && i < size);
				return data[i];
		}

		BasicVectorView<const double> view() const noexcept { return {size, data}; }

		// the same storage seen as a size x 1 column
		MatrixView as_column() const noexcept { return {size, 1, 1, data}; }
};

using VectorView = BasicVectorView<const double>;
using VectorMutView = BasicVectorView<double>;

// zero filled rows x cols matrix; InvalidDimension outside 1..kMaxRows x 1..kMaxCols
ErrorCode matrix_alloc(InOut Arena& arena, In std::uint8_t rows, In std::uint8_t cols, Out MatrixMutView* out) noexcept;
ErrorCode matrix_clone(InOut Arena& arena, In MatrixView src, Out MatrixMutView* out) noexcept;
ErrorCode matrix_copy(In MatrixView src, Out MatrixMutView dst) noexcept;

// row major initialization from a flat array of rows*cols values
ErrorCode matrix_from_values(
        InOut Arena& arena, In std::uint8_t rows, In std::uint8_t cols, In const double* values, Out MatrixMutView* out) noexcept;

// exact comparison, for tests of pure data movement
bool matrix_equal(In MatrixView a, In MatrixView b) noexcept;

// out = a * b, out must already have a.rows x b.cols
ErrorCode matrix_mul(In MatrixView a, In MatrixView b, Out MatrixMutView out) noexcept;

ErrorCode vector_alloc(InOut Arena& arena, In std::uint8_t size, Out VectorMutView* out) noexcept;

} // namespace linsolve
