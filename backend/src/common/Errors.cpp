#include "common/Errors.h"

namespace nocturna::backend::common {

const char* toString(ErrorCategory c) {
	switch (c) {
		case ErrorCategory::NoData: return "no_data";
		case ErrorCategory::InvalidInput: return "invalid_input";
		case ErrorCategory::Computation: return "computation";
		case ErrorCategory::Unavailable: return "unavailable";
	}
	return "computation";
}

InsufficientDataError::InsufficientDataError(std::size_t validCount, std::size_t totalCount, std::size_t required)
	: AnalysisError(ErrorCategory::NoData,
		"insufficient data: " + std::to_string(validCount) + " valid of " + std::to_string(totalCount)
		+ " samples, need at least " + std::to_string(required)),
	  validCount_(validCount), totalCount_(totalCount), required_(required) {}

InsufficientSeriesError::InsufficientSeriesError(std::size_t available, std::size_t required)
	: ShortSeriesError("insufficient series: " + std::to_string(available) + " years, trend needs "
		+ std::to_string(required), available, required) {}

InsufficientHistoryError::InsufficientHistoryError(std::size_t available, std::size_t required)
	: ShortSeriesError("insufficient history: " + std::to_string(available) + " years, forecast needs "
		+ std::to_string(required), available, required) {}

} // namespace nocturna::backend::common
