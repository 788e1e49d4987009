#include "streamup/core/UploadError.hpp"

#include <spdlog/fmt/fmt.h>

namespace streamup {
namespace core {

char const* to_string(ErrorCode code) {
	switch(code) {
		case ErrorCode::ExtractionBounds: return "ExtractionBounds";
		case ErrorCode::TransientTransport: return "TransientTransport";
		case ErrorCode::DestinationRejected: return "DestinationRejected";
		case ErrorCode::RetriesExhausted: return "RetriesExhausted";
		case ErrorCode::NoDataToUpload: return "NoDataToUpload";
		case ErrorCode::MalformedResponse: return "MalformedResponse";
		case ErrorCode::InstanceExists: return "InstanceExists";
	}

	return "Unknown";
}

std::string UploadError::to_string() const {
	if(status != 0) {
		return fmt::format("{} ({}): {}", core::to_string(code), status, message);
	}
	return fmt::format("{}: {}", core::to_string(code), message);
}

} // namespace core
} // namespace streamup
