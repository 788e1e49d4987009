#include "streamup/core/Buffer.hpp"
#include <cstring>

namespace streamup {
namespace core {

Buffer::Buffer(size_t size) :
BaseBuffer(new uint8_t[size], size) {}

Buffer::Buffer(uint8_t *buf, size_t size) :
BaseBuffer(buf, size) {}

Buffer Buffer::copy_of(uint8_t const* src, size_t size) {
	Buffer res(size);
	if(size != 0) {
		std::memcpy(res.buf, src, size);
	}

	return res;
}

Buffer::Buffer(Buffer &&b) noexcept :
BaseBuffer(static_cast<BaseBuffer&&>(std::move(b))) {
	b.buf = nullptr;
	b.capacity = 0;
	b.start_index = 0;
	b.end_index = 0;
}

Buffer &Buffer::operator=(Buffer &&b) noexcept {
	if(this == &b) {
		return *this;
	}

	delete[] buf;

	buf = b.buf;
	capacity = b.capacity;
	start_index = b.start_index;
	end_index = b.end_index;

	b.buf = nullptr;
	b.capacity = 0;
	b.start_index = 0;
	b.end_index = 0;

	return *this;
}

Buffer::~Buffer() {
	delete[] buf;
}

} // namespace core
} // namespace streamup
