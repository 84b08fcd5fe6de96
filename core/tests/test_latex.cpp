#include "linsolve/linsolve.hpp"

#include <cassert>
#include <cstdint>
#include <cstring>

using linsolve::Arena;
using linsolve::ErrorCode;
using linsolve::MatrixMutView;
using linsolve::RowOp;
using linsolve::Slab;
using linsolve::VectorMutView;
using linsolve::latex::Buffer;
using linsolve::latex::MatrixBrackets;

static MatrixMutView mat(Arena& a, std::uint8_t rows, std::uint8_t cols, const double* values) {
		MatrixMutView m;
		assert(linsolve::matrix_from_values(a, rows, cols, values, &m) == ErrorCode::Ok);
		return m;
}

int main() {
		Slab slab;
		assert(slab.init(16 * 1024) == ErrorCode::Ok);
		Arena persist;
		slab.split(&persist, nullptr);

		char buf[256];

		// numbers
		{
				assert(linsolve::latex::write_number(0.5, {buf, sizeof(buf)}) == ErrorCode::Ok);
				assert(std::strcmp(buf, "0.5") == 0);
				assert(linsolve::latex::write_number(-3, {buf, sizeof(buf)}) == ErrorCode::Ok);
				assert(std::strcmp(buf, "-3") == 0);
				assert(linsolve::latex::write_number(1.0 / 3.0, {buf, sizeof(buf)}) == ErrorCode::Ok);
				assert(std::strcmp(buf, "0.333333") == 0);
				assert(linsolve::latex::write_number(1234567, {buf, sizeof(buf)}) == ErrorCode::Ok);
				assert(std::strcmp(buf, "1.23457e+06") == 0);

				// elimination residue prints as a clean zero, negative zero too
				assert(linsolve::latex::write_number(4e-17, {buf, sizeof(buf)}) == ErrorCode::Ok);
				assert(std::strcmp(buf, "0") == 0);
				assert(linsolve::latex::write_number(-0.0, {buf, sizeof(buf)}) == ErrorCode::Ok);
				assert(std::strcmp(buf, "0") == 0);

				char small[3];
				assert(linsolve::latex::write_number(-1.5, {small, sizeof(small)}) == ErrorCode::BufferTooSmall);
				assert(linsolve::latex::write_number(1, {nullptr, 0}) == ErrorCode::BufferTooSmall);
		}

		const double vals[] = {1, 2, 3, 4};
		MatrixMutView m = mat(persist, 2, 2, vals);

		{
				assert(linsolve::latex::write_matrix(m.view(), MatrixBrackets::BMatrix, {buf, sizeof(buf)}) == ErrorCode::Ok);
				assert(std::strcmp(buf, "\\begin{bmatrix}1 & 2 \\\\ 3 & 4\\end{bmatrix}") == 0);

				assert(linsolve::latex::write_matrix_display(m.view(), MatrixBrackets::VMatrix, {buf, sizeof(buf)})
				        == ErrorCode::Ok);
				assert(std::strcmp(buf, "$$\\begin{vmatrix}1 & 2 \\\\ 3 & 4\\end{vmatrix}$$") == 0);

				assert(linsolve::latex::write_matrix(m.view(), MatrixBrackets::PMatrix, {buf, 10}) == ErrorCode::BufferTooSmall);
				assert(linsolve::latex::write_matrix({}, MatrixBrackets::PMatrix, {buf, sizeof(buf)}) == ErrorCode::Internal);
		}

		// augmented
		{
				const double rhs[] = {5, 6};
				MatrixMutView r = mat(persist, 2, 1, rhs);
				assert(linsolve::latex::write_augmented_matrix(m.view(), r.view(), {buf, sizeof(buf)}) == ErrorCode::Ok);
				assert(std::strcmp(buf, "\\left[\\begin{array}{rr|r}1 & 2 & 5 \\\\ 3 & 4 & 6\\end{array}\\right]") == 0);

				assert(linsolve::latex::write_augmented_matrix_display(m.view(), r.view(), {buf, sizeof(buf)})
				        == ErrorCode::Ok);
				assert(std::strncmp(buf, "$$\\left[", 8) == 0);

				MatrixMutView r3;
				assert(linsolve::matrix_alloc(persist, 3, 1, &r3) == ErrorCode::Ok);
				assert(linsolve::latex::write_augmented_matrix(m.view(), r3.view(), {buf, sizeof(buf)})
				        == ErrorCode::DimensionMismatch);
		}

		// named vectors and numbers
		{
				VectorMutView x;
				assert(linsolve::vector_alloc(persist, 2, &x) == ErrorCode::Ok);
				x.at(0) = -4;
				x.at(1) = 4.5;
				assert(linsolve::latex::write_named_vector_display("x", x.view(), {buf, sizeof(buf)}) == ErrorCode::Ok);
				assert(std::strcmp(buf, "$$x = \\begin{bmatrix}-4 \\\\ 4.5\\end{bmatrix}$$") == 0);

				assert(linsolve::latex::write_named_number_display("\\det(A)", -2, {buf, sizeof(buf)}) == ErrorCode::Ok);
				assert(std::strcmp(buf, "$$\\det(A) = -2$$") == 0);

				assert(linsolve::latex::write_named_number_display(nullptr, 1, {buf, sizeof(buf)}) == ErrorCode::Internal);
		}

		// row op captions
		{
				assert(linsolve::row_op_caption(RowOp::swap(0, 2), buf, sizeof(buf)) == ErrorCode::Ok);
				assert(std::strcmp(buf, "$R_{1} \\leftrightarrow R_{3}$") == 0);

				assert(linsolve::row_op_caption(RowOp::divide(1, -0.25), buf, sizeof(buf)) == ErrorCode::Ok);
				assert(std::strcmp(buf, "$R_{2} \\leftarrow R_{2} / (-0.25)$") == 0);

				const RowOp sub = RowOp::submul(2, 0, 3);
				assert(linsolve::row_op_caption(sub, buf, sizeof(buf)) == ErrorCode::Ok);
				assert(std::strcmp(buf, "$R_{3} \\leftarrow R_{3} - (3) R_{1}$") == 0);

				// rows past 9 keep all their digits
				assert(linsolve::row_op_caption(RowOp::swap(9, 63), buf, sizeof(buf)) == ErrorCode::Ok);
				assert(std::strcmp(buf, "$R_{10} \\leftrightarrow R_{64}$") == 0);

				char small[8];
				assert(linsolve::row_op_caption(sub, small, sizeof(small)) == ErrorCode::BufferTooSmall);
				// what fit is still terminated
				assert(std::strlen(small) == sizeof(small) - 1);
				assert(linsolve::row_op_caption(sub, nullptr, 0) == ErrorCode::BufferTooSmall);
		}

		return 0;
}
