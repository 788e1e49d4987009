/*! \file UploadQueue.hpp
	\brief Ordered single flight dispatch of pending chunks to a transfer session
*/

#ifndef STREAMUP_UPLOAD_UPLOADQUEUE_HPP
#define STREAMUP_UPLOAD_UPLOADQUEUE_HPP

#include "streamup/upload/TransferSession.hpp"

#include <list>
#include <spdlog/spdlog.h>

namespace streamup {
namespace upload {

//! Holds chunks in offset order and feeds them to a TransferSession one at a time
/*!
	A chunk leaves the queue only once the destination has acknowledged all of its bytes.
	On a terminal session failure the head chunk stays queued and draining stops for good.

	Delegate callbacks:
	- did_upload_chunk(queue, chunk) for every acknowledged non final chunk
	- did_complete(queue, response) once the final chunk is accepted
	- did_fail(queue, error) on the first terminal failure
*/
template<
	typename DelegateType,
	template<typename> class HttpClientType = asyncio::HttpClient,
	typename TimerType = asyncio::Timer
>
class UploadQueue {
public:
	using Self = UploadQueue<DelegateType, HttpClientType, TimerType>;
	using SessionType = TransferSession<Self, HttpClientType, TimerType>;

private:
	std::list<PendingChunk> pending;
	SessionType session;

	bool draining = false;
	bool failed = false;

	void send_head();
	bool is_acknowledged(PendingChunk const& chunk) const;
public:
	DelegateType* delegate;

	UploadQueue(DelegateType* delegate, SessionConfig const& config);

	void enqueue(PendingChunk&& chunk);
	/// Starts uploading from the head, no-op while a drain is running or after a failure
	void drain();
	/// Stops draining for good, chunks still queued are never sent
	void stop();

	size_t size() const {
		return pending.size();
	}

	bool empty() const {
		return pending.empty();
	}

	bool is_draining() const {
		return draining;
	}

	bool has_failed() const {
		return failed;
	}

	PendingChunk const* head() const {
		return pending.empty() ? nullptr : &pending.front();
	}

	SessionType const& get_session() const {
		return session;
	}

	// TransferSession delegate
	void did_upload(SessionType& session, PendingChunk const& chunk, typename SessionType::State state);
	void did_complete(SessionType& session, PendingChunk const& chunk, UploadResponse&& response);
	void did_fail(SessionType& session, PendingChunk const& chunk, core::UploadError&& error);
};


// Impl

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
UploadQueue<DelegateType, HttpClientType, TimerType>::UploadQueue(
	DelegateType* delegate,
	SessionConfig const& config
) : session(this, config), delegate(delegate) {}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
bool UploadQueue<DelegateType, HttpClientType, TimerType>::is_acknowledged(PendingChunk const& chunk) const {
	// The final chunk always goes out, at worst as a zero length status query
	return !chunk.is_final && session.start_byte() >= chunk.end_offset();
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
void UploadQueue<DelegateType, HttpClientType, TimerType>::enqueue(PendingChunk&& chunk) {
	if(!pending.empty() && pending.back().is_final) {
		SPDLOG_ERROR("UploadQueue: Chunk at offset {} enqueued after the final chunk, dropping", chunk.offset);
		return;
	}

	SPDLOG_DEBUG(
		"UploadQueue: Enqueued {} bytes at offset {}{}",
		chunk.size(),
		chunk.offset,
		chunk.is_final ? ", final" : ""
	);
	pending.push_back(std::move(chunk));
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
void UploadQueue<DelegateType, HttpClientType, TimerType>::drain() {
	if(draining || failed || pending.empty()) {
		return;
	}

	draining = true;
	send_head();
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
void UploadQueue<DelegateType, HttpClientType, TimerType>::stop() {
	if(failed) {
		return;
	}

	SPDLOG_WARN("UploadQueue: Stopped with {} chunks pending", pending.size());

	failed = true;
	draining = false;
	session.stop();
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
void UploadQueue<DelegateType, HttpClientType, TimerType>::send_head() {
	// Drop chunks a resync has already covered
	while(!pending.empty() && is_acknowledged(pending.front())) {
		SPDLOG_DEBUG(
			"UploadQueue: Chunk at offset {} already held by destination",
			pending.front().offset
		);
		delegate->did_upload_chunk(*this, pending.front());
		pending.pop_front();
	}

	if(pending.empty()) {
		draining = false;
		return;
	}

	session.upload(pending.front());
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
void UploadQueue<DelegateType, HttpClientType, TimerType>::did_upload(
	SessionType&,
	PendingChunk const& chunk,
	typename SessionType::State
) {
	if(is_acknowledged(chunk)) {
		delegate->did_upload_chunk(*this, chunk);
		pending.pop_front();
	} else {
		SPDLOG_INFO(
			"UploadQueue: Resending remainder of chunk at offset {} from byte {}",
			chunk.offset,
			session.start_byte()
		);
	}

	send_head();
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
void UploadQueue<DelegateType, HttpClientType, TimerType>::did_complete(
	SessionType&,
	PendingChunk const&,
	UploadResponse&& response
) {
	pending.pop_front();
	draining = false;

	if(!pending.empty()) {
		SPDLOG_WARN("UploadQueue: {} chunks left behind the final chunk", pending.size());
	}

	delegate->did_complete(*this, std::move(response));
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
void UploadQueue<DelegateType, HttpClientType, TimerType>::did_fail(
	SessionType&,
	PendingChunk const& chunk,
	core::UploadError&& error
) {
	SPDLOG_ERROR(
		"UploadQueue: Stopped at chunk offset {} with {} chunks pending",
		chunk.offset,
		pending.size()
	);

	failed = true;
	draining = false;

	delegate->did_fail(*this, std::move(error));
}

} // namespace upload
} // namespace streamup

#endif // STREAMUP_UPLOAD_UPLOADQUEUE_HPP
