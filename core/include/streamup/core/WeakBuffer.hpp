#ifndef STREAMUP_CORE_WEAKBUFFER_HPP
#define STREAMUP_CORE_WEAKBUFFER_HPP

#include "streamup/core/BaseBuffer.hpp"

namespace streamup {
namespace core {

/// @brief Byte range with modifiable bounds without memory ownership
/// @headerfile WeakBuffer.hpp <streamup/core/WeakBuffer.hpp>
class WeakBuffer : public BaseBuffer<WeakBuffer> {
public:
	using BaseBuffer<WeakBuffer>::BaseBuffer;

	/// View over read-only bytes, callers must not write through it
	WeakBuffer(uint8_t const* buf, size_t size) : BaseBuffer<WeakBuffer>((uint8_t*)buf, size) {}
};

} // namespace core
} // namespace streamup

#endif // STREAMUP_CORE_WEAKBUFFER_HPP
