/*! \file UploadEngine.hpp
	\brief Composition root: fragments in, aligned chunks uploaded in order, one terminal outcome out
*/

#ifndef STREAMUP_UPLOAD_UPLOADENGINE_HPP
#define STREAMUP_UPLOAD_UPLOADENGINE_HPP

#include <streamup/core/Aligner.hpp>
#include <streamup/core/ChunkBuffer.hpp>

#include "streamup/upload/Config.hpp"
#include "streamup/upload/UploadQueue.hpp"

#include <optional>
#include <spdlog/spdlog.h>

namespace streamup {
namespace upload {

//! Buffers captured fragments, carves aligned chunks and drives their upload
/*!
	ingest() and finalize() only report whether the call was accepted. Progress and the
	single terminal outcome are delivered to the delegate:
	- did_upload_chunk(engine, chunk) for every acknowledged non final chunk
	- did_complete(engine, response) exactly once on success
	- did_fail(engine, error) exactly once on the first terminal failure

	Once failed or completed the engine rejects all further calls.
*/
template<
	typename DelegateType,
	template<typename> class HttpClientType = asyncio::HttpClient,
	typename TimerType = asyncio::Timer
>
class UploadEngine {
public:
	using Self = UploadEngine<DelegateType, HttpClientType, TimerType>;
	using QueueType = UploadQueue<Self, HttpClientType, TimerType>;

	enum class State {
		Recording,
		Finalized,
		Completed,
		Failed
	};

private:
	EngineConfig config;
	core::ChunkBuffer buffer;
	core::Aligner aligner;
	QueueType queue;

	State state = State::Recording;
	/// Bytes received through ingest
	uint64_t ingested = 0;
	/// Stream offset of the next chunk to be carved
	uint64_t carved;
	size_t chunks = 0;

	std::optional<core::UploadError> terminal_error;

	int carve(bool is_last);
	void fail(core::UploadError&& error);
	void log_buffer_status() const;
public:
	DelegateType* delegate;

	UploadEngine(DelegateType* delegate, EngineConfig const& config);
	UploadEngine(UploadEngine const&) = delete;

	/// Appends a captured fragment. A fragment with is_last set finalizes the engine.
	int ingest(uint8_t const* bytes, size_t size, bool is_last = false);
	int ingest(core::WeakBuffer const& fragment, bool is_last = false);

	/// Enqueues whatever is left as the final chunk and drains the queue to completion
	int finalize();

	uint32_t instance_id() const {
		return config.instance_id;
	}

	State get_state() const {
		return state;
	}

	uint64_t ingested_bytes() const {
		return ingested;
	}

	size_t chunks_enqueued() const {
		return chunks;
	}

	/// Bytes the destination has confirmed
	uint64_t start_byte() const {
		return queue.get_session().start_byte();
	}

	core::ChunkBuffer const& get_buffer() const {
		return buffer;
	}

	QueueType const& get_queue() const {
		return queue;
	}

	std::optional<core::UploadError> const& error() const {
		return terminal_error;
	}

	// UploadQueue delegate
	void did_upload_chunk(QueueType& queue, PendingChunk const& chunk);
	void did_complete(QueueType& queue, UploadResponse&& response);
	void did_fail(QueueType& queue, core::UploadError&& error);
};


// Impl

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
UploadEngine<DelegateType, HttpClientType, TimerType>::UploadEngine(
	DelegateType* delegate,
	EngineConfig const& config
) : config(config),
	buffer(config.initial_buffer_capacity),
	aligner(config.aligner),
	queue(this, config.session),
	carved(config.session.start_byte),
	delegate(delegate) {}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
int UploadEngine<DelegateType, HttpClientType, TimerType>::ingest(
	uint8_t const* bytes,
	size_t size,
	bool is_last
) {
	if(state != State::Recording) {
		SPDLOG_WARN("UploadEngine {}: Fragment of {} bytes rejected, no longer recording", config.instance_id, size);
		return -1;
	}

	buffer.append(bytes, size);
	ingested += size;

	if(config.debug_buffer_status) {
		log_buffer_status();
	}

	if(is_last) {
		return finalize();
	}

	if(carve(false) < 0) {
		return -1;
	}

	queue.drain();
	return 0;
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
int UploadEngine<DelegateType, HttpClientType, TimerType>::ingest(
	core::WeakBuffer const& fragment,
	bool is_last
) {
	return ingest(fragment.data(), fragment.size(), is_last);
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
int UploadEngine<DelegateType, HttpClientType, TimerType>::finalize() {
	if(state != State::Recording) {
		SPDLOG_WARN("UploadEngine {}: Finalize rejected, no longer recording", config.instance_id);
		return -1;
	}

	state = State::Finalized;

	if(buffer.used_bytes() > 0) {
		if(carve(true) < 0) {
			return -1;
		}
	} else if(chunks == 0) {
		fail(core::UploadError {
			core::ErrorCode::NoDataToUpload,
			0,
			"Finalized without any recorded bytes"
		});
		return -1;
	} else {
		// Everything went out in aligned chunks, close the upload with its total
		queue.enqueue(PendingChunk(core::Buffer(0), carved, true));
		chunks++;
	}

	SPDLOG_INFO(
		"UploadEngine {}: Finalized at {} bytes in {} chunks",
		config.instance_id,
		ingested,
		chunks
	);

	queue.drain();
	return 0;
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
int UploadEngine<DelegateType, HttpClientType, TimerType>::carve(bool is_last) {
	while(true) {
		auto size = aligner.next_extraction(buffer.used_bytes(), is_last);
		if(!size.has_value()) {
			break;
		}

		auto bytes = buffer.extract(*size);
		if(!bytes.has_value()) {
			fail(core::UploadError {
				core::ErrorCode::ExtractionBounds,
				0,
				fmt::format("Extraction of {} bytes with {} buffered", *size, buffer.used_bytes())
			});
			return -1;
		}

		SPDLOG_DEBUG(
			"UploadEngine {}: Carved {} bytes at offset {}",
			config.instance_id,
			*size,
			carved
		);

		queue.enqueue(PendingChunk(std::move(*bytes), carved, is_last));
		carved += *size;
		chunks++;

		if(is_last) {
			break;
		}
	}

	return 0;
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
void UploadEngine<DelegateType, HttpClientType, TimerType>::fail(core::UploadError&& error) {
	if(state == State::Completed || state == State::Failed) {
		return;
	}

	state = State::Failed;
	terminal_error = std::move(error);
	queue.stop();

	SPDLOG_ERROR("UploadEngine {}: {}", config.instance_id, terminal_error->to_string());

	delegate->did_fail(*this, *terminal_error);
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
void UploadEngine<DelegateType, HttpClientType, TimerType>::log_buffer_status() const {
	SPDLOG_INFO(
		"UploadEngine {}: Buffer cap {} used {} free {} r {} w {} [{}]",
		config.instance_id,
		buffer.capacity(),
		buffer.used_bytes(),
		buffer.free_space(),
		buffer.read_index(),
		buffer.write_index(),
		buffer.status_bar()
	);
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
void UploadEngine<DelegateType, HttpClientType, TimerType>::did_upload_chunk(
	QueueType&,
	PendingChunk const& chunk
) {
	delegate->did_upload_chunk(*this, chunk);
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
void UploadEngine<DelegateType, HttpClientType, TimerType>::did_complete(
	QueueType&,
	UploadResponse&& response
) {
	if(state != State::Finalized) {
		SPDLOG_ERROR("UploadEngine {}: Completion outside finalization, ignoring", config.instance_id);
		return;
	}

	state = State::Completed;
	SPDLOG_INFO("UploadEngine {}: Upload complete, {} bytes", config.instance_id, response.total_bytes);

	delegate->did_complete(*this, std::move(response));
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
void UploadEngine<DelegateType, HttpClientType, TimerType>::did_fail(
	QueueType&,
	core::UploadError&& error
) {
	fail(std::move(error));
}

} // namespace upload
} // namespace streamup

#endif // STREAMUP_UPLOAD_UPLOADENGINE_HPP
