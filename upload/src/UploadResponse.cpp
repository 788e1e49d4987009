#include "streamup/upload/UploadResponse.hpp"

#include <rapidjson/error/en.h>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>

namespace streamup {
namespace upload {

std::optional<UploadResponse> UploadResponse::parse(
	long status,
	uint64_t total_bytes,
	std::string&& body,
	std::string& error
) {
	UploadResponse res;
	res.status = status;
	res.total_bytes = total_bytes;
	res.body = std::move(body);

	auto blank = std::all_of(res.body.begin(), res.body.end(), [](char c) {
		return std::isspace((unsigned char)c);
	});
	if(blank) {
		return std::move(res);
	}

	res.document.Parse(res.body.data(), res.body.size());
	if(res.document.HasParseError()) {
		error = fmt::format(
			"Invalid JSON at offset {}: {}",
			res.document.GetErrorOffset(),
			rapidjson::GetParseError_En(res.document.GetParseError())
		);
		return std::nullopt;
	}
	if(!res.document.IsObject()) {
		error = "Response is not a JSON object";
		return std::nullopt;
	}

	return std::move(res);
}

std::optional<std::string> UploadResponse::get_string(char const* name) const {
	if(!document.IsObject()) {
		return std::nullopt;
	}

	auto iter = document.FindMember(name);
	if(iter == document.MemberEnd() || !iter->value.IsString()) {
		return std::nullopt;
	}

	return std::string(iter->value.GetString(), iter->value.GetStringLength());
}

} // namespace upload
} // namespace streamup
