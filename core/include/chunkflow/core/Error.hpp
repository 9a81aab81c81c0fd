/*! \file Error.hpp
	\brief Error taxonomy on top of absl::Status
*/

#ifndef CHUNKFLOW_CORE_ERROR_HPP
#define CHUNKFLOW_CORE_ERROR_HPP

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/string_view.h>

#include <stdint.h>

namespace chunkflow {
namespace core {

/// Error codes understood by the transfer engine
enum class ErrorCode : uint8_t {
	Ok = 0,
	/// Length or seek mismatch, corrupted data
	InvalidInput = 1,
	/// Piece, session or context absent
	NotFound = 2,
	/// Storage asks for the asynchronous path
	UnSupport = 3,
	/// Task canceled by the user
	UserCanceled = 4,
	PermissionDenied = 5,
	NotSupport = 6,
	/// Operation not valid in the current state
	ErrorState = 7,
	Timeout = 8,
	Unknown = 255
};

/// Build a status carrying the given code
absl::Status make_error(ErrorCode code, absl::string_view msg);

/// Recover the error code of a status, Ok for an ok status
ErrorCode error_code(absl::Status const& status);

template<typename T>
ErrorCode error_code(absl::StatusOr<T> const& result) {
	return error_code(result.status());
}

/// Name of an error code, for logs
char const* error_name(ErrorCode code);

} // namespace core
} // namespace chunkflow

#endif // CHUNKFLOW_CORE_ERROR_HPP
