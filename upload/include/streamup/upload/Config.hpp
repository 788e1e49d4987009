/*! \file Config.hpp
	\brief Tunables for transfer sessions and engines
*/

#ifndef STREAMUP_UPLOAD_CONFIG_HPP
#define STREAMUP_UPLOAD_CONFIG_HPP

#include <streamup/core/Aligner.hpp>
#include <streamup/core/ChunkBuffer.hpp>

#include <stdint.h>
#include <string>

namespace streamup {
namespace upload {

struct SessionConfig {
	/// Signed resumable upload URL
	std::string destination_url;
	/// Content-Type of every PUT
	std::string mime_type = "video/webm";
	/// Total attempts per chunk, including the first
	uint32_t max_attempts = 10;
	/// Delay before the first retry, doubled for every further one
	uint64_t base_backoff_ms = 500;
	uint64_t connect_timeout_ms = 30000;
	/// 0 for no limit
	uint64_t request_timeout_ms = 0;
	/// Bytes the destination already holds, for resuming a known session
	uint64_t start_byte = 0;
};

struct EngineConfig {
	uint32_t instance_id = 0;
	size_t initial_buffer_capacity = core::ChunkBuffer::default_capacity;
	core::AlignerConfig aligner;
	SessionConfig session;
	/// Log a buffer occupancy snapshot after every ingest
	bool debug_buffer_status = false;
};

} // namespace upload
} // namespace streamup

#endif // STREAMUP_UPLOAD_CONFIG_HPP
