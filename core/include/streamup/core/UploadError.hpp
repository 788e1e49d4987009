/*! \file UploadError.hpp
	\brief Error values surfaced by the upload pipeline
*/

#ifndef STREAMUP_CORE_UPLOADERROR_HPP
#define STREAMUP_CORE_UPLOADERROR_HPP

#include <string>

namespace streamup {
namespace core {

enum class ErrorCode {
	/// More bytes were requested from a buffer than it holds, logic bug
	ExtractionBounds,
	/// Network level failure during a request, retried
	TransientTransport,
	/// Well formed response other than 2xx/308, not retried
	DestinationRejected,
	/// Transient failures used up every allowed attempt
	RetriesExhausted,
	/// Finalized without ever ingesting a byte
	NoDataToUpload,
	/// Final response body is not a JSON object
	MalformedResponse,
	/// Offload initialize for an instance id which is already live
	InstanceExists
};

char const* to_string(ErrorCode code);

struct UploadError {
	ErrorCode code;
	/// HTTP status where one was received, 0 otherwise
	long status = 0;
	std::string message;

	std::string to_string() const;
};

} // namespace core
} // namespace streamup

#endif // STREAMUP_CORE_UPLOADERROR_HPP
