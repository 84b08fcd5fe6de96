#include "linsolve/matrix.hpp"

#include <algorithm>

namespace linsolve {

ErrorCode matrix_alloc(Arena& arena, std::uint8_t rows, std::uint8_t cols, MatrixMutView* out) noexcept {
		if (!out)
				return ErrorCode::Internal;
		if (rows == 0 || cols == 0 || rows > kMaxRows || cols > kMaxCols)
				return ErrorCode::InvalidDimension;

		const std::size_t count = static_cast<std::size_t>(rows) * cols;
		double* data = arena.allocate_array<double>(count);
		if (!data)
				return ErrorCode::Overflow;
		std::fill_n(data, count, 0.0);

		*out = MatrixMutView{rows, cols, cols, data};
		return ErrorCode::Ok;
}

ErrorCode matrix_copy(MatrixView src, MatrixMutView dst) noexcept {
		if (!src.data || !dst.data)
				return ErrorCode::Internal;
		if (src.rows != dst.rows || src.cols != dst.cols)
				return ErrorCode::DimensionMismatch;

		for (std::uint8_t r = 0; r < src.rows; r++)
				std::copy_n(&src.at(r, 0), src.cols, &dst.at(r, 0));
		return ErrorCode::Ok;
}

ErrorCode matrix_clone(Arena& arena, MatrixView src, MatrixMutView* out) noexcept {
		if (!out || !src.data)
				return ErrorCode::Internal;

		ArenaScope scope(arena);
		MatrixMutView m;
		ErrorCode ec = matrix_alloc(arena, src.rows, src.cols, &m);
		if (is_ok(ec))
				ec = matrix_copy(src, m);
		if (!is_ok(ec))
				return ec;

		scope.commit();
		*out = m;
		return ErrorCode::Ok;
}

ErrorCode matrix_from_values(Arena& arena, std::uint8_t rows, std::uint8_t cols, const double* values, MatrixMutView* out) noexcept {
		if (!values)
				return ErrorCode::Internal;
		return matrix_clone(arena, MatrixView{rows, cols, cols, values}, out);
}

bool matrix_equal(MatrixView a, MatrixView b) noexcept {
		if (!a.data || !b.data || a.rows != b.rows || a.cols != b.cols)
				return false;
		for (std::uint8_t r = 0; r < a.rows; r++) {
				if (!std::equal(&a.at(r, 0), &a.at(r, 0) + a.cols, &b.at(r, 0)))
						return false;
		}
		return true;
}

ErrorCode matrix_mul(MatrixView a, MatrixView b, MatrixMutView out) noexcept {
		if (!a.data || !b.data || !out.data)
				return ErrorCode::Internal;
		if (a.cols != b.rows || out.rows != a.rows || out.cols != b.cols)
				return ErrorCode::DimensionMismatch;

		for (std::uint8_t i = 0; i < out.rows; i++) {
				for (std::uint8_t j = 0; j < out.cols; j++) {
						double dot = 0.0;
						for (std::uint8_t k = 0; k < a.cols; k++)
								dot += a.at(i, k) * b.at(k, j);
						out.at(i, j) = dot;
				}
		}
		return ErrorCode::Ok;
}

ErrorCode vector_alloc(Arena& arena, std::uint8_t size, VectorMutView* out) noexcept {
		if (!out)
				return ErrorCode::Internal;
		if (size == 0 || size > kMaxRows)
				return ErrorCode::InvalidDimension;

		double* data = arena.allocate_array<double>(size);
		if (!data)
				return ErrorCode::Overflow;
		std::fill_n(data, size, 0.0);

		*out = VectorMutView{size, data};
		return ErrorCode::Ok;
}

} // namespace linsolve
