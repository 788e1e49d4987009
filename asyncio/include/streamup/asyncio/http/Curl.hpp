/*! \file Curl.hpp
	\brief Blocking libcurl exchange, run off the loop thread
*/

#ifndef STREAMUP_ASYNCIO_HTTP_CURL_HPP
#define STREAMUP_ASYNCIO_HTTP_CURL_HPP

#include "streamup/asyncio/http/HttpResponse.hpp"

#include <string>

namespace streamup {
namespace asyncio {
namespace curl {

/// Process wide libcurl initialisation, safe to call repeatedly
void global_init();

/// Performs the request, filling in response on success.
/// Returns 0 if a response was received, a CURLcode otherwise with error describing it.
int perform(HttpRequest const& request, HttpResponse& response, std::string& error);

} // namespace curl
} // namespace asyncio
} // namespace streamup

#endif // STREAMUP_ASYNCIO_HTTP_CURL_HPP
