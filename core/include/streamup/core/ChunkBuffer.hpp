/*! \file ChunkBuffer.hpp
	\brief Growable ring buffer holding captured bytes which have not been carved into chunks yet
*/

#ifndef STREAMUP_CORE_CHUNKBUFFER_HPP
#define STREAMUP_CORE_CHUNKBUFFER_HPP

#include "streamup/core/Buffer.hpp"

#include <optional>
#include <string>

namespace streamup {
namespace core {

/// @brief Ring buffer of bytes with a doubling growth policy
/// @headerfile ChunkBuffer.hpp <streamup/core/ChunkBuffer.hpp>
///
/// Live bytes occupy [read_index, write_index) modulo capacity. Cursors are plain
/// indices into the store, never pointers, so growth can replace the store freely.
class ChunkBuffer {
public:
	static constexpr size_t default_capacity = 20 * 1024 * 1024;

	explicit ChunkBuffer(size_t initial_capacity = default_capacity);

	ChunkBuffer(ChunkBuffer const&) = delete;
	ChunkBuffer& operator=(ChunkBuffer const&) = delete;

	/// Appends bytes to the tail, doubling capacity until they fit
	void append(uint8_t const* bytes, size_t size);
	void append(WeakBuffer const& bytes);

	/// Removes exactly num bytes from the head, in order.
	/// Returns nullopt without touching the buffer if fewer than num bytes are held.
	[[nodiscard]] std::optional<Buffer> extract(size_t num);

	size_t used_bytes() const {
		return used;
	}

	size_t free_space() const {
		return store.size() - used;
	}

	size_t capacity() const {
		return store.size();
	}

	size_t read_index() const {
		return read_idx;
	}

	size_t write_index() const {
		return write_idx;
	}

	/// Fixed width text rendering of occupancy with read (R) and write (W) markers
	std::string status_bar(size_t width = 50) const;

private:
	Buffer store;
	size_t read_idx = 0;
	size_t write_idx = 0;
	size_t used = 0;

	void grow(size_t min_free);
	static Buffer copy_live_region(
		Buffer const& old_store,
		size_t read_idx,
		size_t used,
		size_t new_capacity
	);
};

} // namespace core
} // namespace streamup

#endif // STREAMUP_CORE_CHUNKBUFFER_HPP
