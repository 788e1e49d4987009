/*! \file TransferSession.hpp
	\brief Resumable PUT protocol against a single signed upload URL
*/

#ifndef STREAMUP_UPLOAD_TRANSFERSESSION_HPP
#define STREAMUP_UPLOAD_TRANSFERSESSION_HPP

#include <streamup/asyncio/core/Timer.hpp>
#include <streamup/asyncio/http/HttpClient.hpp>
#include <streamup/core/UploadError.hpp>
#include <streamup/utils/logs.hpp>

#include "streamup/upload/Config.hpp"
#include "streamup/upload/PendingChunk.hpp"
#include "streamup/upload/Range.hpp"
#include "streamup/upload/UploadResponse.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace streamup {
namespace upload {

//! Uploads one chunk at a time with Content-Range semantics, resyncing on 308
/*!
	start_byte is the only source of the Content-Range lower bound and only ever moves
	forward, on a 2xx (by the bytes sent) or on a 308 (to the server reported Range).
	Transport failures, and 308s that report no progress, are retried with exponential
	backoff. Any other status fails the chunk immediately.

	Delegate callbacks:
	- did_upload(session, chunk, state) after a 2xx for a non final chunk or any 308 with progress
	- did_complete(session, chunk, response) after a 2xx for the final chunk
	- did_fail(session, chunk, error) once the chunk can not be uploaded
*/
template<
	typename DelegateType,
	template<typename> class HttpClientType = asyncio::HttpClient,
	typename TimerType = asyncio::Timer
>
class TransferSession {
public:
	using Self = TransferSession<DelegateType, HttpClientType, TimerType>;

	enum class State {
		Idle,
		InFlight,
		Backoff,
		Accepted,
		RangeResynced,
		Failed
	};

private:
	SessionConfig config;
	HttpClientType<Self> client;
	TimerType retry_timer;

	uint64_t cursor;
	State state = State::Idle;

	PendingChunk const* current = nullptr;
	/// Cursor when the in flight request was built
	uint64_t sent_start = 0;
	uint64_t sent_length = 0;
	uint32_t attempts = 0;

	void send();
	void retry_or_fail(std::string const& reason);
	void fail(core::ErrorCode code, long status, std::string message);

public:
	DelegateType* delegate;

	TransferSession(DelegateType* delegate, SessionConfig const& config);
	TransferSession(TransferSession const&) = delete;

	/// Starts uploading the unacknowledged part of chunk, which must outlive the attempt
	void upload(PendingChunk const& chunk);
	/// Abandons the current chunk without notifying, later responses and retries are dropped
	void stop();

	uint64_t start_byte() const {
		return cursor;
	}

	State get_state() const {
		return state;
	}

	uint32_t get_attempts() const {
		return attempts;
	}

	SessionConfig const& get_config() const {
		return config;
	}

	// HttpClient delegate
	void did_recv_response(HttpClientType<Self>& client, asyncio::HttpResponse&& response);
	void did_fail_request(HttpClientType<Self>& client, int code, std::string const& reason);

	void retry_timer_cb();
};


// Impl

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
TransferSession<DelegateType, HttpClientType, TimerType>::TransferSession(
	DelegateType* delegate,
	SessionConfig const& config
) : config(config), client(this), retry_timer(this), cursor(config.start_byte), delegate(delegate) {
	if(this->config.max_attempts == 0) {
		this->config.max_attempts = 1;
	}
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
void TransferSession<DelegateType, HttpClientType, TimerType>::upload(PendingChunk const& chunk) {
	current = &chunk;
	attempts = 0;

	if(cursor < chunk.offset) {
		fail(
			core::ErrorCode::ExtractionBounds,
			0,
			fmt::format("Chunk at offset {} is ahead of confirmed byte {}", chunk.offset, cursor)
		);
		return;
	}

	send();
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
void TransferSession<DelegateType, HttpClientType, TimerType>::stop() {
	retry_timer.stop();
	state = State::Failed;
	current = nullptr;
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
void TransferSession<DelegateType, HttpClientType, TimerType>::send() {
	auto const& chunk = *current;

	auto skip = std::min(cursor - chunk.offset, chunk.size());
	sent_start = cursor;
	sent_length = chunk.size() - skip;

	std::optional<uint64_t> total;
	if(chunk.is_final) {
		total = sent_start + sent_length;
	}
	auto range = content_range(sent_start, sent_length, total);

	asyncio::HttpRequest request;
	request.method = "PUT";
	request.url = config.destination_url;
	request.headers = {
		{"Content-Length", std::to_string(sent_length)},
		{"Content-Range", range},
		{"Content-Type", config.mime_type}
	};
	request.body = core::Buffer::copy_of(chunk.bytes.data() + skip, sent_length);
	request.connect_timeout_ms = config.connect_timeout_ms;
	request.timeout_ms = config.request_timeout_ms;

	STREAMUP_LOG_DEBUG(
		"PUT {}, attempt {}",
		range,
		attempts + 1
	);

	state = State::InFlight;
	auto res = client.send(std::move(request));
	if(res < 0) {
		retry_or_fail(fmt::format("Request not started: {}", res));
	}
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
void TransferSession<DelegateType, HttpClientType, TimerType>::did_recv_response(
	HttpClientType<Self>&,
	asyncio::HttpResponse&& response
) {
	if(state != State::InFlight) {
		SPDLOG_WARN("TransferSession: Unexpected response {}, ignoring", response.status);
		return;
	}

	auto const& chunk = *current;

	if(response.ok()) {
		cursor = sent_start + sent_length;

		if(!chunk.is_final) {
			SPDLOG_INFO("TransferSession: Chunk accepted up to byte {}", cursor);
			state = State::Accepted;
			current = nullptr;
			delegate->did_upload(*this, chunk, state);
			return;
		}

		std::string error;
		auto result = UploadResponse::parse(response.status, cursor, std::move(response.body), error);
		if(!result.has_value()) {
			fail(core::ErrorCode::MalformedResponse, response.status, std::move(error));
			return;
		}

		SPDLOG_INFO("TransferSession: Upload complete: {} bytes", cursor);
		state = State::Accepted;
		current = nullptr;
		delegate->did_complete(*this, chunk, std::move(*result));
		return;
	}

	if(response.status == 308) {
		auto resynced = cursor;

		auto range = response.header("Range");
		if(!range.has_value()) {
			SPDLOG_WARN("TransferSession: 308 without Range, destination holds nothing new");
		} else if(auto last = parse_range_end(*range); !last.has_value()) {
			SPDLOG_WARN("TransferSession: Unparseable Range: {}", *range);
		} else if(*last + 1 < cursor) {
			SPDLOG_WARN(
				"TransferSession: Range {} behind confirmed byte {}, keeping cursor",
				*range,
				cursor
			);
		} else {
			resynced = *last + 1;
		}

		// Unlike other 308s, one without progress counts as a failed attempt and shares the
		// transport backoff, so a destination stuck on the same Range ends in RetriesExhausted
		if(resynced <= sent_start) {
			retry_or_fail(fmt::format("Resync made no progress past byte {}", sent_start));
			return;
		}

		if(resynced != sent_start + sent_length) {
			SPDLOG_INFO(
				"TransferSession: Resynced to byte {}, sent up to {}",
				resynced,
				sent_start + sent_length
			);
		}

		cursor = resynced;
		state = State::RangeResynced;
		current = nullptr;
		delegate->did_upload(*this, chunk, state);
		return;
	}

	fail(core::ErrorCode::DestinationRejected, response.status, std::move(response.body));
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
void TransferSession<DelegateType, HttpClientType, TimerType>::did_fail_request(
	HttpClientType<Self>&,
	int code,
	std::string const& reason
) {
	if(state != State::InFlight) {
		return;
	}

	retry_or_fail(fmt::format("Transport error {}: {}", code, reason));
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
void TransferSession<DelegateType, HttpClientType, TimerType>::retry_or_fail(std::string const& reason) {
	attempts++;
	if(attempts >= config.max_attempts) {
		fail(
			core::ErrorCode::RetriesExhausted,
			0,
			fmt::format("Upload failed after {} attempts: {}", attempts, reason)
		);
		return;
	}

	auto delay = config.base_backoff_ms << std::min<uint32_t>(attempts - 1, 32);

	SPDLOG_WARN(
		"TransferSession: {}, retrying in {} ms ({}/{})",
		reason,
		delay,
		attempts,
		config.max_attempts
	);

	state = State::Backoff;
	retry_timer.template start<Self, &Self::retry_timer_cb>(delay, 0);
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
void TransferSession<DelegateType, HttpClientType, TimerType>::retry_timer_cb() {
	if(state != State::Backoff) {
		return;
	}

	send();
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
void TransferSession<DelegateType, HttpClientType, TimerType>::fail(
	core::ErrorCode code,
	long status,
	std::string message
) {
	retry_timer.stop();
	state = State::Failed;

	auto const& chunk = *current;
	current = nullptr;

	core::UploadError error { code, status, std::move(message) };
	SPDLOG_ERROR("TransferSession: {}", error.to_string());

	delegate->did_fail(*this, chunk, std::move(error));
}

} // namespace upload
} // namespace streamup

#endif // STREAMUP_UPLOAD_TRANSFERSESSION_HPP
