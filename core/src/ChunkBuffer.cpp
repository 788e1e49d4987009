#include "streamup/core/ChunkBuffer.hpp"

#include <streamup/utils/logs.hpp>

#include <algorithm>
#include <spdlog/spdlog.h>

namespace streamup {
namespace core {

ChunkBuffer::ChunkBuffer(size_t initial_capacity) : store(initial_capacity) {}

Buffer ChunkBuffer::copy_live_region(
	Buffer const& old_store,
	size_t read_idx,
	size_t used,
	size_t new_capacity
) {
	Buffer fresh(new_capacity);

	auto first = std::min(used, old_store.size() - read_idx);
	fresh.write_unsafe(0, old_store.data() + read_idx, first);
	// Wrapped part
	fresh.write_unsafe(first, old_store.data(), used - first);

	return fresh;
}

void ChunkBuffer::grow(size_t min_free) {
	auto new_capacity = std::max<size_t>(store.size(), 1);
	while(new_capacity - used < min_free) {
		new_capacity *= 2;
	}

	STREAMUP_LOG_DEBUG(
		"Growing: {} -> {} bytes, {} live",
		store.size(),
		new_capacity,
		used
	);

	store = copy_live_region(store, read_idx, used, new_capacity);
	read_idx = 0;
	write_idx = used % new_capacity;
}

void ChunkBuffer::append(uint8_t const* bytes, size_t size) {
	if(size == 0) {
		return;
	}

	if(size > free_space()) {
		grow(size);
	}

	auto cap = store.size();
	auto first = std::min(size, cap - write_idx);
	store.write_unsafe(write_idx, bytes, first);
	store.write_unsafe(0, bytes + first, size - first);

	write_idx = (write_idx + size) % cap;
	used += size;
}

void ChunkBuffer::append(WeakBuffer const& bytes) {
	append(bytes.data(), bytes.size());
}

std::optional<Buffer> ChunkBuffer::extract(size_t num) {
	if(num > used) {
		SPDLOG_ERROR(
			"ChunkBuffer: Extract out of bounds: requested {}, held {}",
			num,
			used
		);
		return std::nullopt;
	}

	Buffer out(num);
	if(num == 0) {
		return out;
	}

	auto cap = store.size();
	auto first = std::min(num, cap - read_idx);
	store.read_unsafe(read_idx, out.data(), first);
	store.read_unsafe(0, out.data() + first, num - first);

	read_idx = (read_idx + num) % cap;
	used -= num;

	return out;
}

std::string ChunkBuffer::status_bar(size_t width) const {
	if(width == 0 || store.size() == 0) {
		return "";
	}

	auto cap = store.size();
	std::string bar(width, '.');

	auto used_cells = (size_t)((double)used / cap * width + 0.5);
	std::fill_n(bar.begin(), std::min(used_cells, width), '#');

	auto read_pos = std::min(read_idx * width / cap, width - 1);
	auto write_pos = std::min(write_idx * width / cap, width - 1);
	if(read_pos == write_pos) {
		bar[read_pos] = 'X';
	} else {
		bar[read_pos] = 'R';
		bar[write_pos] = 'W';
	}

	return bar;
}

} // namespace core
} // namespace streamup
