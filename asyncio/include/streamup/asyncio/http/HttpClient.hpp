/*! \file HttpClient.hpp
	\brief Single flight HTTP client driven from the event loop
*/

#ifndef STREAMUP_ASYNCIO_HTTP_HTTPCLIENT_HPP
#define STREAMUP_ASYNCIO_HTTP_HTTPCLIENT_HPP

#include "streamup/asyncio/http/Curl.hpp"

#include <uv.h>
#include <spdlog/spdlog.h>

namespace streamup {
namespace asyncio {

//! HTTP client running one exchange at a time on the libuv worker pool
/*!
	The blocking transfer happens on a pool thread, the delegate is always called back
	on the loop thread with either did_recv_response or did_fail_request.
*/
template<typename DelegateType>
class HttpClient {
private:
	using Self = HttpClient<DelegateType>;

	struct Exchange {
		uv_work_t req;
		Self* client;
		HttpRequest request;
		HttpResponse response;
		int result = 0;
		std::string error;
	};

	Exchange* in_flight = nullptr;

	static void work_cb(uv_work_t* req);
	static void after_work_cb(uv_work_t* req, int status);
public:
	DelegateType* delegate;

	HttpClient(DelegateType* delegate);
	HttpClient(HttpClient const&) = delete;
	~HttpClient();

	/// Starts the exchange, returns negative if one is already in flight
	int send(HttpRequest&& request);
};


// Impl

template<typename DelegateType>
HttpClient<DelegateType>::HttpClient(DelegateType* delegate) : delegate(delegate) {
	curl::global_init();
}

template<typename DelegateType>
HttpClient<DelegateType>::~HttpClient() {
	if(in_flight == nullptr) {
		return;
	}

	// Detach, the exchange cleans itself up once the pool is done with it
	in_flight->client = nullptr;
	uv_cancel((uv_req_t*)&in_flight->req);
}

template<typename DelegateType>
void HttpClient<DelegateType>::work_cb(uv_work_t* req) {
	auto* exchange = (Exchange*)req->data;
	exchange->result = curl::perform(exchange->request, exchange->response, exchange->error);
}

template<typename DelegateType>
void HttpClient<DelegateType>::after_work_cb(uv_work_t* req, int status) {
	auto* exchange = (Exchange*)req->data;
	auto* client = exchange->client;

	if(client == nullptr) {
		delete exchange;
		return;
	}
	client->in_flight = nullptr;

	if(status < 0) {
		SPDLOG_ERROR("HttpClient: Work error: {}", uv_strerror(status));
		exchange->result = status;
		exchange->error = uv_strerror(status);
	}

	if(exchange->result != 0) {
		client->delegate->did_fail_request(*client, exchange->result, exchange->error);
	} else {
		client->delegate->did_recv_response(*client, std::move(exchange->response));
	}

	delete exchange;
}

template<typename DelegateType>
int HttpClient<DelegateType>::send(HttpRequest&& request) {
	if(in_flight != nullptr) {
		SPDLOG_ERROR("HttpClient: Request already in flight: {}", in_flight->request.url);
		return -1;
	}

	auto* exchange = new Exchange { uv_work_t(), this, std::move(request), HttpResponse(), 0, "" };
	exchange->req.data = exchange;

	auto res = uv_queue_work(uv_default_loop(), &exchange->req, work_cb, after_work_cb);
	if(res < 0) {
		SPDLOG_ERROR("HttpClient: Queue work error: {}", uv_strerror(res));
		delete exchange;
		return res;
	}

	in_flight = exchange;
	return 0;
}

} // namespace asyncio
} // namespace streamup

#endif // STREAMUP_ASYNCIO_HTTP_HTTPCLIENT_HPP
