#include "streamup/asyncio/http/Curl.hpp"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>
#include <mutex>

namespace streamup {
namespace asyncio {
namespace curl {

namespace {

struct ReadState {
	uint8_t const* data;
	size_t size;
	size_t offset;
};

size_t read_cb(char* dst, size_t size, size_t nitems, void* userdata) {
	auto& state = *(ReadState*)userdata;
	auto num = std::min(size * nitems, state.size - state.offset);
	if(num != 0) {
		std::memcpy(dst, state.data + state.offset, num);
	}
	state.offset += num;

	return num;
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
	((std::string*)userdata)->append(ptr, size * nmemb);
	return size * nmemb;
}

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
	((HttpResponse*)userdata)->add_header_line(std::string_view(buffer, size * nitems));
	return size * nitems;
}

std::once_flag init_flag;

}

void global_init() {
	std::call_once(init_flag, []() {
		auto res = curl_global_init(CURL_GLOBAL_DEFAULT);
		if(res != CURLE_OK) {
			SPDLOG_ERROR("Curl: Global init error: {}", curl_easy_strerror(res));
		}
	});
}

int perform(HttpRequest const& request, HttpResponse& response, std::string& error) {
	CURL* handle = curl_easy_init();
	if(handle == nullptr) {
		error = "curl_easy_init failed";
		return CURLE_FAILED_INIT;
	}

	char errbuf[CURL_ERROR_SIZE];
	errbuf[0] = 0;

	curl_slist* headers = nullptr;
	for(auto const& [name, value] : request.headers) {
		headers = curl_slist_append(headers, (name + ": " + value).c_str());
	}
	// No 100-continue round trip
	headers = curl_slist_append(headers, "Expect:");

	ReadState body { request.body.data(), request.body.size(), 0 };

	curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());
	if(request.method == "PUT") {
		curl_easy_setopt(handle, CURLOPT_UPLOAD, 1L);
		curl_easy_setopt(handle, CURLOPT_READFUNCTION, read_cb);
		curl_easy_setopt(handle, CURLOPT_READDATA, &body);
		curl_easy_setopt(handle, CURLOPT_INFILESIZE_LARGE, (curl_off_t)body.size);
	} else {
		curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
	}
	curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers);
	curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_cb);
	curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);
	curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, header_cb);
	curl_easy_setopt(handle, CURLOPT_HEADERDATA, &response);
	curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, errbuf);
	curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
	if(request.connect_timeout_ms != 0) {
		curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, (long)request.connect_timeout_ms);
	}
	if(request.timeout_ms != 0) {
		curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, (long)request.timeout_ms);
	}

	auto res = curl_easy_perform(handle);
	if(res == CURLE_OK) {
		curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);
	} else {
		error = errbuf[0] != 0 ? errbuf : curl_easy_strerror(res);
	}

	curl_slist_free_all(headers);
	curl_easy_cleanup(handle);

	return res;
}

} // namespace curl
} // namespace asyncio
} // namespace streamup
