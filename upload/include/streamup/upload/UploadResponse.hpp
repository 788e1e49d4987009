#ifndef STREAMUP_UPLOAD_UPLOADRESPONSE_HPP
#define STREAMUP_UPLOAD_UPLOADRESPONSE_HPP

#include <rapidjson/document.h>

#include <optional>
#include <string>

namespace streamup {
namespace upload {

/// Terminal payload returned by the destination once the final chunk is accepted
struct UploadResponse {
	long status = 0;
	/// Total bytes the destination acknowledged
	uint64_t total_bytes = 0;
	/// Raw response text
	std::string body;
	/// Parsed body, null when the body was empty
	rapidjson::Document document;

	/// Parses body as a JSON object. Returns nullopt with error set if it is not one.
	static std::optional<UploadResponse> parse(
		long status,
		uint64_t total_bytes,
		std::string&& body,
		std::string& error
	);

	/// String member of the document, if present
	std::optional<std::string> get_string(char const* name) const;
};

} // namespace upload
} // namespace streamup

#endif // STREAMUP_UPLOAD_UPLOADRESPONSE_HPP
