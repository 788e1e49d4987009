/*! \file Messages.hpp
	\brief Message contract between a capture context and the upload worker
*/

#ifndef STREAMUP_UPLOAD_MESSAGES_HPP
#define STREAMUP_UPLOAD_MESSAGES_HPP

#include <streamup/core/Buffer.hpp>
#include <streamup/core/UploadError.hpp>

#include "streamup/upload/UploadResponse.hpp"

#include <optional>
#include <string>
#include <variant>

namespace streamup {
namespace upload {
namespace msg {

// Inbound

/// Creates an isolated engine for instance_id
struct Initialize {
	uint32_t instance_id;
	std::string destination_url;
	/// Worker default if unset
	std::optional<std::string> mime_type;
};

/// Captured fragment for instance_id, is_last on the final one
struct BufferChunk {
	uint32_t instance_id;
	core::Buffer chunk;
	bool is_last;
};

using Inbound = std::variant<Initialize, BufferChunk>;

// Outbound

struct UploadSuccess {
	uint32_t instance_id;
	bool is_final;
	/// Bytes the destination has confirmed so far
	uint64_t start_byte;
	/// Terminal payload, only set when is_final
	std::optional<UploadResponse> video_upload_response;
};

struct UploadError {
	uint32_t instance_id;
	core::UploadError error;
};

using Outbound = std::variant<UploadSuccess, UploadError>;

} // namespace msg
} // namespace upload
} // namespace streamup

#endif // STREAMUP_UPLOAD_MESSAGES_HPP
