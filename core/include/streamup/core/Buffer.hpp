/*! \file Buffer.hpp
*/

#ifndef STREAMUP_CORE_BUFFER_HPP
#define STREAMUP_CORE_BUFFER_HPP

#include "streamup/core/WeakBuffer.hpp"

namespace streamup {
namespace core {

/// @brief Byte buffer implementation with modifiable bounds and memory ownership
/// @headerfile Buffer.hpp <streamup/core/Buffer.hpp>
class Buffer : public BaseBuffer<Buffer> {
public:
	/// Construct with given size - preferred constructor
	Buffer(size_t size);

	/// Construct from uint8_t array - unsafe if uint8_t * isn't obtained from new[]
	Buffer(uint8_t *buf, size_t size);

	/// Construct by copying size bytes from src
	static Buffer copy_of(uint8_t const* src, size_t size);

	Buffer(Buffer &&b) noexcept;
	Buffer(Buffer const &b) = delete;

	Buffer &operator=(Buffer &&b) noexcept;
	Buffer &operator=(Buffer const &p) = delete;

	~Buffer();

	/// Implicit conversion to WeakBuffer
	operator WeakBuffer() {
		return WeakBuffer(data(), size());
	}

	operator WeakBuffer const() const {
		return WeakBuffer(data(), size());
	}
};

} // namespace core
} // namespace streamup

#endif // STREAMUP_CORE_BUFFER_HPP
