#ifndef NOCTURNA_BACKEND_COMMON_ERRORS_H
#define NOCTURNA_BACKEND_COMMON_ERRORS_H

#include <cstddef>
#include <stdexcept>
#include <string>

namespace nocturna::backend::common {

// Lets the presentation layer tell "no data available" apart from a failed computation.
enum class ErrorCategory {
	NoData,       // not enough samples / years to say anything
	InvalidInput, // caller supplied a malformed geometry, series or request
	Computation,  // a model or reduction could not be evaluated
	Unavailable   // the measurement source could not be reached
};

const char* toString(ErrorCategory c);

class AnalysisError : public std::runtime_error {
public:
	AnalysisError(ErrorCategory category, const std::string& what)
		: std::runtime_error(what), category_(category) {}
	ErrorCategory category() const noexcept { return category_; }
	// Short machine-readable kind, e.g. "insufficient_data"
	virtual const char* kind() const noexcept = 0;

private:
	ErrorCategory category_;
};

class InsufficientGeometryError : public AnalysisError {
public:
	explicit InsufficientGeometryError(const std::string& what)
		: AnalysisError(ErrorCategory::InvalidInput, what) {}
	const char* kind() const noexcept override { return "insufficient_geometry"; }
};

class InsufficientDataError : public AnalysisError {
public:
	InsufficientDataError(std::size_t validCount, std::size_t totalCount, std::size_t required);
	const char* kind() const noexcept override { return "insufficient_data"; }
	std::size_t validCount() const noexcept { return validCount_; }
	std::size_t totalCount() const noexcept { return totalCount_; }
	std::size_t required() const noexcept { return required_; }

private:
	std::size_t validCount_;
	std::size_t totalCount_;
	std::size_t required_;
};

// Shared shape for "series too short" errors (trend vs forecast need different minimums).
class ShortSeriesError : public AnalysisError {
public:
	ShortSeriesError(const std::string& what, std::size_t available, std::size_t required)
		: AnalysisError(ErrorCategory::NoData, what), available_(available), required_(required) {}
	std::size_t available() const noexcept { return available_; }
	std::size_t required() const noexcept { return required_; }

private:
	std::size_t available_;
	std::size_t required_;
};

class InsufficientSeriesError : public ShortSeriesError {
public:
	InsufficientSeriesError(std::size_t available, std::size_t required);
	const char* kind() const noexcept override { return "insufficient_series"; }
};

class InsufficientHistoryError : public ShortSeriesError {
public:
	InsufficientHistoryError(std::size_t available, std::size_t required);
	const char* kind() const noexcept override { return "insufficient_history"; }
};

// Raised by a single forecast model; the ensemble absorbs it and carries on.
class ModelFitError : public AnalysisError {
public:
	ModelFitError(const std::string& model, const std::string& reason)
		: AnalysisError(ErrorCategory::Computation, model + ": " + reason), model_(model), reason_(reason) {}
	const char* kind() const noexcept override { return "model_fit"; }
	const std::string& model() const noexcept { return model_; }
	const std::string& reason() const noexcept { return reason_; }

private:
	std::string model_;
	std::string reason_;
};

class GatewayUnavailableError : public AnalysisError {
public:
	explicit GatewayUnavailableError(const std::string& what)
		: AnalysisError(ErrorCategory::Unavailable, what) {}
	const char* kind() const noexcept override { return "gateway_unavailable"; }
};

// Non-monotonic / duplicate years or non-finite values in a yearly series.
class InvalidSeriesError : public AnalysisError {
public:
	explicit InvalidSeriesError(const std::string& what)
		: AnalysisError(ErrorCategory::InvalidInput, what) {}
	const char* kind() const noexcept override { return "invalid_series"; }
};

// Out-of-range request parameters (yearsForward, percentile, year range).
class InvalidRequestError : public AnalysisError {
public:
	explicit InvalidRequestError(const std::string& what)
		: AnalysisError(ErrorCategory::InvalidInput, what) {}
	const char* kind() const noexcept override { return "invalid_request"; }
};

} // namespace nocturna::backend::common

#endif // NOCTURNA_BACKEND_COMMON_ERRORS_H
