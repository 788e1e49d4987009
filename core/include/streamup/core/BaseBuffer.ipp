#include <cstring>
#include <cassert>

namespace streamup {
namespace core {

template<typename DerivedBuffer>
BaseBuffer<DerivedBuffer>::BaseBuffer(uint8_t *buf, size_t size) :
buf(buf), capacity(size), start_index(0), end_index(size) {}

template<typename DerivedBuffer>
bool BaseBuffer<DerivedBuffer>::cover(size_t num) {
	if (num > size())
		return false;

	cover_unsafe(num);

	return true;
}

template<typename DerivedBuffer>
DerivedBuffer& BaseBuffer<DerivedBuffer>::cover_unsafe(size_t num) & {
	assert(num <= size());

	start_index += num;

	return *static_cast<DerivedBuffer*>(this);
}

template<typename DerivedBuffer>
DerivedBuffer&& BaseBuffer<DerivedBuffer>::cover_unsafe(size_t num) && {
	return std::move(cover_unsafe(num));
}

template<typename DerivedBuffer>
bool BaseBuffer<DerivedBuffer>::truncate(size_t num) {
	if (num > size())
		return false;

	truncate_unsafe(num);

	return true;
}

template<typename DerivedBuffer>
DerivedBuffer& BaseBuffer<DerivedBuffer>::truncate_unsafe(size_t num) & {
	assert(num <= size());

	end_index -= num;

	return *static_cast<DerivedBuffer*>(this);
}

template<typename DerivedBuffer>
DerivedBuffer&& BaseBuffer<DerivedBuffer>::truncate_unsafe(size_t num) && {
	return std::move(truncate_unsafe(num));
}

template<typename DerivedBuffer>
bool BaseBuffer<DerivedBuffer>::read(size_t pos, uint8_t* out, size_t size) const {
	if(this->size() < size || this->size() - size < pos)
		return false;

	read_unsafe(pos, out, size);

	return true;
}

template<typename DerivedBuffer>
void BaseBuffer<DerivedBuffer>::read_unsafe(size_t pos, uint8_t* out, size_t size) const {
	assert(this->size() >= size && this->size() - size >= pos);

	if(size == 0)
		return;
	std::memcpy(out, data()+pos, size);
}

template<typename DerivedBuffer>
bool BaseBuffer<DerivedBuffer>::write(size_t pos, uint8_t const* in, size_t size) {
	if(this->size() < size || this->size() - size < pos)
		return false;

	write_unsafe(pos, in, size);

	return true;
}

template<typename DerivedBuffer>
DerivedBuffer& BaseBuffer<DerivedBuffer>::write_unsafe(size_t pos, uint8_t const* in, size_t size) & {
	assert(this->size() >= size && this->size() - size >= pos);

	if(size != 0)
		std::memcpy(data()+pos, in, size);

	return *static_cast<DerivedBuffer*>(this);
}

template<typename DerivedBuffer>
DerivedBuffer&& BaseBuffer<DerivedBuffer>::write_unsafe(size_t pos, uint8_t const* in, size_t size) && {
	return std::move(write_unsafe(pos, in, size));
}

} // namespace core
} // namespace streamup
