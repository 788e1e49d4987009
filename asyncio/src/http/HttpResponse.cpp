#include "streamup/asyncio/http/HttpResponse.hpp"

#include <algorithm>
#include <cctype>

namespace streamup {
namespace asyncio {

namespace {

bool iequals(std::string_view a, std::string_view b) {
	return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
		return std::tolower((unsigned char)x) == std::tolower((unsigned char)y);
	});
}

std::string_view trim(std::string_view s) {
	while(!s.empty() && std::isspace((unsigned char)s.front())) s.remove_prefix(1);
	while(!s.empty() && std::isspace((unsigned char)s.back())) s.remove_suffix(1);
	return s;
}

}

std::optional<std::string> HttpResponse::header(std::string_view name) const {
	for(auto const& [key, value] : headers) {
		if(iequals(key, name)) {
			return value;
		}
	}

	return std::nullopt;
}

void HttpResponse::add_header_line(std::string_view line) {
	line = trim(line);
	if(line.empty()) {
		return;
	}

	// Status line of a fresh response (after 100 Continue or a redirect), drop earlier headers
	if(line.substr(0, 5) == "HTTP/") {
		headers.clear();
		return;
	}

	auto colon = line.find(':');
	if(colon == std::string_view::npos) {
		return;
	}

	headers.emplace_back(
		std::string(trim(line.substr(0, colon))),
		std::string(trim(line.substr(colon + 1)))
	);
}

} // namespace asyncio
} // namespace streamup
