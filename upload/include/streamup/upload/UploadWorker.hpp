/*! \file UploadWorker.hpp
	\brief Offload context hosting isolated upload engines behind a message interface
*/

#ifndef STREAMUP_UPLOAD_UPLOADWORKER_HPP
#define STREAMUP_UPLOAD_UPLOADWORKER_HPP

#include "streamup/upload/Messages.hpp"
#include "streamup/upload/UploadEngine.hpp"

#include <uv.h>
#include <spdlog/spdlog.h>

#include <deque>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace streamup {
namespace upload {

//! Routes inbound messages to per instance engines and reports their outcomes as outbound messages
/*!
	post() may be called from any thread, messages are handed to the loop thread through a
	libuv async handle. Everything else runs on the loop thread. Engines share nothing,
	each one owns its buffer and its transfer session.

	Delegate callbacks:
	- did_post(worker, message) for every outbound message
*/
template<
	typename DelegateType,
	template<typename> class HttpClientType = asyncio::HttpClient,
	typename TimerType = asyncio::Timer
>
class UploadWorker {
public:
	using Self = UploadWorker<DelegateType, HttpClientType, TimerType>;
	using EngineType = UploadEngine<Self, HttpClientType, TimerType>;

private:
	EngineConfig defaults;

	uv_async_t* async = nullptr;
	std::mutex inbox_mutex;
	std::deque<msg::Inbound> inbox;
	bool closed = false;

	std::unordered_map<uint32_t, std::unique_ptr<EngineType>> engines;
	/// Finished engines, destroyed outside their own callbacks
	std::vector<std::unique_ptr<EngineType>> retired;

	static void async_cb(uv_async_t* handle);
	static void close_cb(uv_handle_t* handle) {
		delete (uv_async_t*)handle;
	}

	void on_initialize(msg::Initialize&& message);
	void on_buffer_chunk(msg::BufferChunk&& message);
	void retire(uint32_t instance_id);
public:
	DelegateType* delegate;

	UploadWorker(DelegateType* delegate, EngineConfig const& defaults = EngineConfig());
	UploadWorker(UploadWorker const&) = delete;
	~UploadWorker();

	/// Thread safe, returns negative once the worker is closed
	int post(msg::Inbound&& message);
	/// Processes a message on the loop thread
	void handle(msg::Inbound&& message);
	/// Stops accepting messages and releases the async handle
	void close();

	size_t active_instances() const {
		return engines.size();
	}

	EngineType* get_engine(uint32_t instance_id) {
		auto iter = engines.find(instance_id);
		return iter == engines.end() ? nullptr : iter->second.get();
	}

	// UploadEngine delegate
	void did_upload_chunk(EngineType& engine, PendingChunk const& chunk);
	void did_complete(EngineType& engine, UploadResponse&& response);
	void did_fail(EngineType& engine, core::UploadError const& error);
};


// Impl

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
UploadWorker<DelegateType, HttpClientType, TimerType>::UploadWorker(
	DelegateType* delegate,
	EngineConfig const& defaults
) : defaults(defaults), delegate(delegate) {
	async = new uv_async_t();
	async->data = this;
	auto res = uv_async_init(uv_default_loop(), async, async_cb);
	if(res < 0) {
		SPDLOG_ERROR("UploadWorker: Async init error: {}", uv_strerror(res));
		delete async;
		async = nullptr;
		closed = true;
	}
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
UploadWorker<DelegateType, HttpClientType, TimerType>::~UploadWorker() {
	close();
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
int UploadWorker<DelegateType, HttpClientType, TimerType>::post(msg::Inbound&& message) {
	std::lock_guard<std::mutex> lock(inbox_mutex);
	if(closed) {
		SPDLOG_WARN("UploadWorker: Closed, dropping message");
		return -1;
	}

	inbox.push_back(std::move(message));
	return uv_async_send(async);
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
void UploadWorker<DelegateType, HttpClientType, TimerType>::async_cb(uv_async_t* handle) {
	auto& worker = *(Self*)handle->data;

	worker.retired.clear();

	std::deque<msg::Inbound> messages;
	{
		std::lock_guard<std::mutex> lock(worker.inbox_mutex);
		messages.swap(worker.inbox);
	}

	for(auto& message : messages) {
		worker.handle(std::move(message));
	}
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
void UploadWorker<DelegateType, HttpClientType, TimerType>::close() {
	std::lock_guard<std::mutex> lock(inbox_mutex);
	if(async == nullptr) {
		return;
	}

	closed = true;
	if(!inbox.empty()) {
		SPDLOG_WARN("UploadWorker: Closing with {} unprocessed messages", inbox.size());
		inbox.clear();
	}

	uv_close((uv_handle_t*)async, close_cb);
	async = nullptr;
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
void UploadWorker<DelegateType, HttpClientType, TimerType>::handle(msg::Inbound&& message) {
	if(auto* init = std::get_if<msg::Initialize>(&message)) {
		on_initialize(std::move(*init));
	} else {
		on_buffer_chunk(std::get<msg::BufferChunk>(std::move(message)));
	}
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
void UploadWorker<DelegateType, HttpClientType, TimerType>::on_initialize(msg::Initialize&& message) {
	auto id = message.instance_id;

	if(engines.find(id) != engines.end()) {
		SPDLOG_WARN("UploadWorker: Instance {} already initialized", id);
		delegate->did_post(*this, msg::UploadError {
			id,
			core::UploadError {
				core::ErrorCode::InstanceExists,
				0,
				fmt::format("Instance {} already initialized", id)
			}
		});
		return;
	}

	auto config = defaults;
	config.instance_id = id;
	config.session.destination_url = std::move(message.destination_url);
	if(message.mime_type.has_value()) {
		config.session.mime_type = std::move(*message.mime_type);
	}

	SPDLOG_INFO("UploadWorker: Instance {} initialized: {}", id, config.session.destination_url);
	engines.emplace(id, std::make_unique<EngineType>(this, config));
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
void UploadWorker<DelegateType, HttpClientType, TimerType>::on_buffer_chunk(msg::BufferChunk&& message) {
	auto* engine = get_engine(message.instance_id);
	if(engine == nullptr) {
		SPDLOG_WARN(
			"UploadWorker: Unknown instance {}, dropping {} bytes",
			message.instance_id,
			message.chunk.size()
		);
		return;
	}

	auto res = engine->ingest(message.chunk.data(), message.chunk.size(), message.is_last);
	if(res < 0) {
		SPDLOG_WARN("UploadWorker: Instance {} rejected fragment", message.instance_id);
	}
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
void UploadWorker<DelegateType, HttpClientType, TimerType>::retire(uint32_t instance_id) {
	auto iter = engines.find(instance_id);
	if(iter == engines.end()) {
		return;
	}

	retired.push_back(std::move(iter->second));
	engines.erase(iter);

	// Purged on the next async callback
	std::lock_guard<std::mutex> lock(inbox_mutex);
	if(async != nullptr) {
		uv_async_send(async);
	}
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
void UploadWorker<DelegateType, HttpClientType, TimerType>::did_upload_chunk(
	EngineType& engine,
	PendingChunk const& chunk
) {
	SPDLOG_DEBUG("UploadWorker: Instance {} chunk at {} uploaded", engine.instance_id(), chunk.offset);
	delegate->did_post(*this, msg::UploadSuccess {
		engine.instance_id(),
		false,
		engine.start_byte(),
		std::nullopt
	});
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
void UploadWorker<DelegateType, HttpClientType, TimerType>::did_complete(
	EngineType& engine,
	UploadResponse&& response
) {
	auto id = engine.instance_id();
	auto start_byte = engine.start_byte();
	retire(id);

	delegate->did_post(*this, msg::UploadSuccess {
		id,
		true,
		start_byte,
		std::move(response)
	});
}

template<typename DelegateType, template<typename> class HttpClientType, typename TimerType>
void UploadWorker<DelegateType, HttpClientType, TimerType>::did_fail(
	EngineType& engine,
	core::UploadError const& error
) {
	auto id = engine.instance_id();
	retire(id);

	delegate->did_post(*this, msg::UploadError { id, error });
}

} // namespace upload
} // namespace streamup

#endif // STREAMUP_UPLOAD_UPLOADWORKER_HPP
