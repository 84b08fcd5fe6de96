#include "linsolve/latex.hpp"
#include "linsolve/writer.hpp"

namespace linsolve::latex {
namespace {

const char* env_name(MatrixBrackets b) noexcept {
		switch (b) {
		case MatrixBrackets::BMatrix:
				return "bmatrix";
		case MatrixBrackets::PMatrix:
				return "pmatrix";
		case MatrixBrackets::VMatrix:
				return "vmatrix";
		}
		return nullptr;
}

// cells of row r, each preceded by " & " except the very first of the line
void cells(Writer& w, MatrixView m, std::uint8_t r, bool continues_line) noexcept {
		for (std::uint8_t c = 0; c < m.cols; c++) {
				if (c > 0 || continues_line)
						w.text(" & ");
				w.number(m.at(r, c));
		}
}

void row_break(Writer& w, std::uint8_t r, std::uint8_t rows) noexcept {
		if (r + 1 < rows)
				w.text(" \\\\ ");
}

ErrorCode matrix_body(Writer& w, MatrixView m, MatrixBrackets brackets) noexcept {
		const char* env = env_name(brackets);
		if (!m.data || !env)
				return ErrorCode::Internal;

		w.text("\\begin{").text(env).ch('}');
		for (std::uint8_t r = 0; r < m.rows; r++) {
				cells(w, m, r, false);
				row_break(w, r, m.rows);
		}
		return w.text("\\end{").text(env).ch('}').status();
}

ErrorCode augmented_body(Writer& w, MatrixView left, MatrixView right) noexcept {
		if (!left.data || !right.data)
				return ErrorCode::Internal;
		if (left.rows != right.rows)
				return ErrorCode::DimensionMismatch;
		if (left.cols == 0 || right.cols == 0)
				return ErrorCode::InvalidDimension;

		w.text("\\left[\\begin{array}{");
		for (std::uint8_t c = 0; c < left.cols; c++)
				w.ch('r');
		w.ch('|');
		for (std::uint8_t c = 0; c < right.cols; c++)
				w.ch('r');
		w.ch('}');

		for (std::uint8_t r = 0; r < left.rows; r++) {
				cells(w, left, r, false);
				cells(w, right, r, true);
				row_break(w, r, left.rows);
		}
		return w.text("\\end{array}\\right]").status();
}

// wraps `body` in $$ ... $$
template <typename Body> ErrorCode display(Writer& w, Body body) noexcept {
		w.text("$$");
		const ErrorCode ec = body();
		if (!is_ok(ec))
				return ec;
		return w.text("$$").status();
}

} // namespace

ErrorCode write_number(double v, Buffer out) noexcept {
		return Writer(out.data, out.cap).number(v).status();
}

ErrorCode write_matrix(MatrixView m, MatrixBrackets brackets, Buffer out) noexcept {
		Writer w(out.data, out.cap);
		return matrix_body(w, m, brackets);
}

ErrorCode write_matrix_display(MatrixView m, MatrixBrackets brackets, Buffer out) noexcept {
		Writer w(out.data, out.cap);
		return display(w, [&]() noexcept { return matrix_body(w, m, brackets); });
}

ErrorCode write_augmented_matrix(MatrixView left, MatrixView right, Buffer out) noexcept {
		Writer w(out.data, out.cap);
		return augmented_body(w, left, right);
}

ErrorCode write_augmented_matrix_display(MatrixView left, MatrixView right, Buffer out) noexcept {
		Writer w(out.data, out.cap);
		return display(w, [&]() noexcept { return augmented_body(w, left, right); });
}

ErrorCode write_named_vector_display(const char* name, VectorView v, Buffer out) noexcept {
		Writer w(out.data, out.cap);
		if (!name || !v.data)
				return ErrorCode::Internal;
		return display(w, [&]() noexcept {
				w.text(name).text(" = ");
				return matrix_body(w, v.as_column(), MatrixBrackets::BMatrix);
		});
}

ErrorCode write_named_number_display(const char* label, double v, Buffer out) noexcept {
		Writer w(out.data, out.cap);
		if (!label)
				return ErrorCode::Internal;
		return display(w, [&]() noexcept { return w.text(label).text(" = ").number(v).status(); });
}

} // namespace linsolve::latex
