#ifndef STREAMUP_CORE_BASEBUFFER_HPP
#define STREAMUP_CORE_BASEBUFFER_HPP

#include <stdint.h>
#include <cstddef>
#include <utility>

namespace streamup {
namespace core {

/// @brief Byte range with modifiable bounds over an underlying memory region
/// @headerfile BaseBuffer.hpp <streamup/core/BaseBuffer.hpp>
template<typename DerivedBuffer>
class BaseBuffer {
protected:
	/// Pointer to underlying memory
	uint8_t *buf;
	/// Capacity of memory
	size_t capacity;
	/// Start index in memory, inclusive
	size_t start_index;
	/// End index in memory, non-inclusive
	size_t end_index;

public:
	/// @brief Construct from uint8_t array
	/// @param buf Pointer to bytes
	/// @param size Size of bytes
	BaseBuffer(uint8_t *buf, size_t size);

	BaseBuffer(BaseBuffer &&b) = default;
	BaseBuffer(BaseBuffer const &b) = default;
	BaseBuffer &operator=(BaseBuffer &&b) = default;
	BaseBuffer &operator=(BaseBuffer const &b) = default;

	/// Start of buffer
	inline uint8_t *data() {
		return buf + start_index;
	}

	inline uint8_t const *data() const {
		return buf + start_index;
	}

	/// Length of buffer
	inline size_t size() const {
		return end_index - start_index;
	}

	/// @name Bounds change
	/// @{

	/// Moves start of buffer forward and covers given number of bytes
	[[nodiscard]] bool cover(size_t num);
	/// Moves start of buffer forward without bounds checking
	DerivedBuffer& cover_unsafe(size_t num) &;
	DerivedBuffer&& cover_unsafe(size_t num) &&;

	/// Moves end of buffer backward and covers given number of bytes
	[[nodiscard]] bool truncate(size_t num);
	/// Moves end of buffer backward without bounds checking
	DerivedBuffer& truncate_unsafe(size_t num) &;
	DerivedBuffer&& truncate_unsafe(size_t num) &&;
	/// @}

	/// @name Read/Write arbitrary data
	/// @{

	/// Read arbitrary data starting at given byte
	[[nodiscard]] bool read(size_t pos, uint8_t* out, size_t size) const;
	/// Read arbitrary data starting at given byte without bounds checking
	void read_unsafe(size_t pos, uint8_t* out, size_t size) const;

	/// Write arbitrary data starting at given byte
	[[nodiscard]] bool write(size_t pos, uint8_t const* in, size_t size);
	/// Write arbitrary data starting at given byte without bounds checking
	DerivedBuffer& write_unsafe(size_t pos, uint8_t const* in, size_t size) &;
	DerivedBuffer&& write_unsafe(size_t pos, uint8_t const* in, size_t size) &&;
	/// @}
};

} // namespace core
} // namespace streamup

#include "streamup/core/BaseBuffer.ipp"

#endif // STREAMUP_CORE_BASEBUFFER_HPP
