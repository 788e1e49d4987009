#ifndef STREAMUP_ASYNCIO_HTTP_HTTPRESPONSE_HPP
#define STREAMUP_ASYNCIO_HTTP_HTTPRESPONSE_HPP

#include "streamup/asyncio/http/HttpRequest.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace streamup {
namespace asyncio {

struct HttpResponse {
	long status = 0;
	HttpHeaders headers;
	std::string body;

	bool ok() const {
		return status >= 200 && status < 300;
	}

	/// First header with the given name, compared case insensitively
	std::optional<std::string> header(std::string_view name) const;

	/// Parses a raw "Name: value" header line, ignoring status lines and blanks
	void add_header_line(std::string_view line);
};

} // namespace asyncio
} // namespace streamup

#endif // STREAMUP_ASYNCIO_HTTP_HTTPRESPONSE_HPP
