#ifndef STREAMUP_UPLOAD_PENDINGCHUNK_HPP
#define STREAMUP_UPLOAD_PENDINGCHUNK_HPP

#include <streamup/core/Buffer.hpp>

namespace streamup {
namespace upload {

/// Immutable slice of the recorded stream waiting to be uploaded
struct PendingChunk {
	/// Chunk bytes
	core::Buffer bytes;
	/// Offset of the first byte in the stream
	uint64_t offset;
	/// Last chunk of the stream, announces the total size
	bool is_final;

	PendingChunk(
		core::Buffer &&_bytes,
		uint64_t _offset,
		bool _is_final
	) : bytes(std::move(_bytes)), offset(_offset), is_final(_is_final) {}

	uint64_t size() const {
		return bytes.size();
	}

	/// Offset one past the last byte in the stream
	uint64_t end_offset() const {
		return offset + bytes.size();
	}
};

} // namespace upload
} // namespace streamup

#endif // STREAMUP_UPLOAD_PENDINGCHUNK_HPP
