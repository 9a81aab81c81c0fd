#include "chunkflow/core/Error.hpp"

#include <absl/strings/cord.h>

namespace chunkflow {
namespace core {

static constexpr char ERROR_CODE_PAYLOAD[] = "chunkflow/error_code";

static absl::StatusCode canonical_code(ErrorCode code) {
	switch(code) {
		case ErrorCode::Ok: return absl::StatusCode::kOk;
		case ErrorCode::InvalidInput: return absl::StatusCode::kInvalidArgument;
		case ErrorCode::NotFound: return absl::StatusCode::kNotFound;
		case ErrorCode::UnSupport: return absl::StatusCode::kUnimplemented;
		case ErrorCode::UserCanceled: return absl::StatusCode::kCancelled;
		case ErrorCode::PermissionDenied: return absl::StatusCode::kPermissionDenied;
		case ErrorCode::NotSupport: return absl::StatusCode::kUnimplemented;
		case ErrorCode::ErrorState: return absl::StatusCode::kFailedPrecondition;
		case ErrorCode::Timeout: return absl::StatusCode::kDeadlineExceeded;
		default: return absl::StatusCode::kUnknown;
	}
}

absl::Status make_error(ErrorCode code, absl::string_view msg) {
	if(code == ErrorCode::Ok) {
		return absl::OkStatus();
	}

	absl::Status status(canonical_code(code), msg);
	status.SetPayload(ERROR_CODE_PAYLOAD, absl::Cord(std::string(1, static_cast<char>(code))));
	return status;
}

ErrorCode error_code(absl::Status const& status) {
	if(status.ok()) {
		return ErrorCode::Ok;
	}

	auto payload = status.GetPayload(ERROR_CODE_PAYLOAD);
	if(payload.has_value() && payload->size() == 1) {
		return static_cast<ErrorCode>(static_cast<uint8_t>(payload->Flatten()[0]));
	}

	// Statuses built by other libraries
	switch(status.code()) {
		case absl::StatusCode::kInvalidArgument: return ErrorCode::InvalidInput;
		case absl::StatusCode::kNotFound: return ErrorCode::NotFound;
		case absl::StatusCode::kUnimplemented: return ErrorCode::UnSupport;
		case absl::StatusCode::kCancelled: return ErrorCode::UserCanceled;
		case absl::StatusCode::kPermissionDenied: return ErrorCode::PermissionDenied;
		case absl::StatusCode::kFailedPrecondition: return ErrorCode::ErrorState;
		case absl::StatusCode::kDeadlineExceeded: return ErrorCode::Timeout;
		default: return ErrorCode::Unknown;
	}
}

char const* error_name(ErrorCode code) {
	switch(code) {
		case ErrorCode::Ok: return "Ok";
		case ErrorCode::InvalidInput: return "InvalidInput";
		case ErrorCode::NotFound: return "NotFound";
		case ErrorCode::UnSupport: return "UnSupport";
		case ErrorCode::UserCanceled: return "UserCanceled";
		case ErrorCode::PermissionDenied: return "PermissionDenied";
		case ErrorCode::NotSupport: return "NotSupport";
		case ErrorCode::ErrorState: return "ErrorState";
		case ErrorCode::Timeout: return "Timeout";
		default: return "Unknown";
	}
}

} // namespace core
} // namespace chunkflow
