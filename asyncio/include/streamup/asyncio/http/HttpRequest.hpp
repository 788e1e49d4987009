#ifndef STREAMUP_ASYNCIO_HTTP_HTTPREQUEST_HPP
#define STREAMUP_ASYNCIO_HTTP_HTTPREQUEST_HPP

#include <streamup/core/Buffer.hpp>

#include <string>
#include <utility>
#include <vector>

namespace streamup {
namespace asyncio {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

/// Request owned by the client for the lifetime of the exchange
struct HttpRequest {
	std::string method = "PUT";
	std::string url;
	HttpHeaders headers;
	core::Buffer body = core::Buffer(0);
	/// 0 leaves the transport default in place
	uint64_t connect_timeout_ms = 0;
	/// 0 for no limit
	uint64_t timeout_ms = 0;
};

} // namespace asyncio
} // namespace streamup

#endif // STREAMUP_ASYNCIO_HTTP_HTTPREQUEST_HPP
