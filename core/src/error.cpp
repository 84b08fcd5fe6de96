#include "linsolve/error.hpp"

namespace linsolve {

const char* error_name(ErrorCode code) noexcept {
		switch (code) {
		case ErrorCode::Ok:
				return "ok";
		case ErrorCode::FeatureDisabled:
				return "feature_disabled";
		case ErrorCode::InvalidDimension:
				return "invalid_dimension";
		case ErrorCode::DimensionMismatch:
				return "dimension_mismatch";
		case ErrorCode::NotSquare:
				return "not_square";
		case ErrorCode::Overflow:
				return "overflow";
		case ErrorCode::BufferTooSmall:
				return "buffer_too_small";
		case ErrorCode::IndexOutOfRange:
				return "index_out_of_range";
		case ErrorCode::StepOutOfRange:
				return "step_out_of_range";
		case ErrorCode::Internal:
				return "internal";
		}
		return "unknown";
}

} // namespace linsolve
