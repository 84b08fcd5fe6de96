#include "linsolve/linsolve.hpp"

#include "linsolve/det_detail.hpp"

#include <cassert>
#include <cmath>
#include <cstdint>

using linsolve::Arena;
using linsolve::ErrorCode;
using linsolve::MatrixMutView;
using linsolve::Slab;

static MatrixMutView mat(Arena& a, std::uint8_t rows, std::uint8_t cols, const double* values) {
		MatrixMutView m;
		assert(linsolve::matrix_from_values(a, rows, cols, values, &m) == ErrorCode::Ok);
		return m;
}

static bool near(double a, double b) {
		return std::fabs(a - b) <= 1e-9;
}

int main() {
		Slab slab;
		assert(slab.init(64 * 1024) == ErrorCode::Ok);
		Arena persist;
		Arena scratch;
		slab.split(&persist, &scratch);

		{
				const double vals[] = {1, 2, 3, 4};
				MatrixMutView a = mat(persist, 2, 2, vals);
				double det = 0.0;
				auto err = linsolve::op_det(a.view(), scratch, &det);
				assert(linsolve::is_ok(err));
				// det = 1*4 - 2*3 = -2
				assert(near(det, -2.0));
				// input untouched
				assert(a.at(0, 0) == 1 && a.at(1, 0) == 3);
		}

		// row swaps flip the sign; pivoting picks the larger entry
		{
				const double vals[] = {0, 1, 1, 0};
				MatrixMutView a = mat(persist, 2, 2, vals);
				double det = 0.0;
				assert(linsolve::is_ok(linsolve::op_det(a.view(), scratch, &det)));
				assert(near(det, -1.0));
		}

		{
				const double vals[] = {
				        2, 1, -1, //
				        -3, -1, 2, //
				        -2, 1, 2, //
				};
				MatrixMutView a = mat(persist, 3, 3, vals);
				double det = 0.0;
				assert(linsolve::is_ok(linsolve::op_det(a.view(), scratch, &det)));
				assert(near(det, -1.0));
		}

		{
				const double vals[] = {
				        -1, -4, 2, 1, //
				        2, -1, 7, 9, //
				        -1, 1, 3, 1, //
				        1, -2, 1, -4, //
				};
				MatrixMutView a = mat(persist, 4, 4, vals);
				double det = 0.0;
				assert(linsolve::is_ok(linsolve::op_det(a.view(), scratch, &det)));
				assert(near(det, -423.0));
		}

		// linearly dependent rows
		{
				const double vals[] = {1, 2, 2, 4};
				MatrixMutView a = mat(persist, 2, 2, vals);
				double det = 1.0;
				assert(linsolve::is_ok(linsolve::op_det(a.view(), scratch, &det)));
				assert(std::fabs(det) <= linsolve::kSingularTolerance);

				const double zero_col[] = {0, 1, 0, 2};
				MatrixMutView z = mat(persist, 2, 2, zero_col);
				assert(linsolve::is_ok(linsolve::op_det(z.view(), scratch, &det)));
				assert(det == 0.0);
		}

		{
				const double vals[] = {7};
				MatrixMutView a = mat(persist, 1, 1, vals);
				double det = 0.0;
				assert(linsolve::is_ok(linsolve::op_det(a.view(), scratch, &det)));
				assert(det == 7.0);
		}

		// errors
		{
				MatrixMutView ns;
				assert(linsolve::matrix_alloc(persist, 2, 3, &ns) == ErrorCode::Ok);
				double det = 0.0;
				auto err = linsolve::op_det(ns.view(), scratch, &det);
				assert(err.code == ErrorCode::NotSquare);
				assert(err.a.rows == 2 && err.a.cols == 3);

				MatrixMutView a;
				assert(linsolve::matrix_alloc(persist, 3, 3, &a) == ErrorCode::Ok);
				err = linsolve::op_det(a.view(), scratch, nullptr);
				assert(err.code == ErrorCode::Internal);

				std::uint8_t tiny_buf[32] = {};
				Arena tiny(tiny_buf, sizeof(tiny_buf));
				err = linsolve::op_det(a.view(), tiny, &det);
				assert(err.code == ErrorCode::Overflow);
		}

		// the detail entry point rejects non square input on its own
		{
				MatrixMutView ns;
				assert(linsolve::matrix_alloc(scratch, 2, 3, &ns) == ErrorCode::Ok);
				double det = 0.0;
				assert(linsolve::detail::det_elim(ns, &det) == ErrorCode::NotSquare);
				assert(linsolve::detail::det_elim(ns, nullptr) == ErrorCode::Internal);
		}

		return 0;
}
