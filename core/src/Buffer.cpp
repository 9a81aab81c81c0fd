#include "chunkflow/core/Buffer.hpp"
#include "chunkflow/core/Endian.hpp"

#include <cstring>
#include <cassert>
#include <algorithm>

namespace chunkflow {
namespace core {

Buffer::Buffer(size_t size) :
buf(new uint8_t[size]), capacity(size), start_index(0), end_index(size) {}

Buffer::Buffer(std::initializer_list<uint8_t> il, size_t size) :
buf(new uint8_t[size]), capacity(size), start_index(0), end_index(size) {
	assert(il.size() <= size);
	std::copy(il.begin(), il.end(), buf);
}

Buffer::Buffer(uint8_t *buf, size_t size) :
buf(buf), capacity(size), start_index(0), end_index(size) {}

Buffer Buffer::copy_of(uint8_t const* in, size_t size) {
	Buffer res(size);
	if(size > 0) {
		std::memcpy(res.buf, in, size);
	}
	return res;
}

Buffer::Buffer(Buffer &&b) noexcept :
buf(b.buf), capacity(b.capacity), start_index(b.start_index), end_index(b.end_index) {
	b.buf = nullptr;
	b.capacity = 0;
	b.start_index = 0;
	b.end_index = 0;
}

Buffer &Buffer::operator=(Buffer &&b) noexcept {
	if(this == &b) {
		return *this;
	}

	// Destroy old
	delete[] buf;

	// Assign from new
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

//---------------- Bounds change begin ----------------//

bool Buffer::cover(size_t num) {
	if(num > size())
		return false;

	cover_unsafe(num);
	return true;
}

Buffer& Buffer::cover_unsafe(size_t num) {
	assert(num <= size());
	start_index += num;
	return *this;
}

bool Buffer::uncover(size_t num) {
	if(start_index < num)
		return false;

	uncover_unsafe(num);
	return true;
}

Buffer& Buffer::uncover_unsafe(size_t num) {
	assert(start_index >= num);
	start_index -= num;
	return *this;
}

bool Buffer::truncate(size_t num) {
	if(num > size())
		return false;

	truncate_unsafe(num);
	return true;
}

Buffer& Buffer::truncate_unsafe(size_t num) {
	assert(num <= size());
	end_index -= num;
	return *this;
}

bool Buffer::expand(size_t num) {
	if(end_index + num > capacity)
		return false;

	expand_unsafe(num);
	return true;
}

Buffer& Buffer::expand_unsafe(size_t num) {
	assert(end_index + num <= capacity);
	end_index += num;
	return *this;
}

//---------------- Bounds change end ----------------//

//---------------- Arbitrary read/write begin ----------------//

bool Buffer::read(size_t pos, uint8_t* out, size_t size) const {
	// Bounds checking, written to avoid overflow of pos + size
	if(size > this->size() || pos > this->size() - size)
		return false;

	read_unsafe(pos, out, size);
	return true;
}

void Buffer::read_unsafe(size_t pos, uint8_t* out, size_t size) const {
	std::memcpy(out, data() + pos, size);
}

bool Buffer::write(size_t pos, uint8_t const* in, size_t size) {
	if(size > this->size() || pos > this->size() - size)
		return false;

	write_unsafe(pos, in, size);
	return true;
}

Buffer& Buffer::write_unsafe(size_t pos, uint8_t const* in, size_t size) {
	std::memcpy(data() + pos, in, size);
	return *this;
}

//---------------- Arbitrary read/write end ----------------//

//---------------- Integer read/write begin ----------------//

template<typename T>
std::optional<T> Buffer::read_uint(size_t pos) const {
	if(sizeof(T) > size() || pos > size() - sizeof(T))
		return std::nullopt;

	return read_uint_unsafe<T>(pos);
}

template<typename T>
T Buffer::read_uint_unsafe(size_t pos) const {
	T num;
	std::memcpy(&num, data() + pos, sizeof(T));
	return to_be<T>(num);
}

template<typename T>
bool Buffer::write_uint(size_t pos, T num) {
	if(sizeof(T) > size() || pos > size() - sizeof(T))
		return false;

	write_uint_unsafe<T>(pos, num);
	return true;
}

template<typename T>
void Buffer::write_uint_unsafe(size_t pos, T num) {
	T be = to_be<T>(num);
	std::memcpy(data() + pos, &be, sizeof(T));
}

std::optional<uint8_t> Buffer::read_uint8(size_t pos) const {
	return read_uint<uint8_t>(pos);
}

uint8_t Buffer::read_uint8_unsafe(size_t pos) const {
	return read_uint_unsafe<uint8_t>(pos);
}

std::optional<uint16_t> Buffer::read_uint16_be(size_t pos) const {
	return read_uint<uint16_t>(pos);
}

uint16_t Buffer::read_uint16_be_unsafe(size_t pos) const {
	return read_uint_unsafe<uint16_t>(pos);
}

std::optional<uint32_t> Buffer::read_uint32_be(size_t pos) const {
	return read_uint<uint32_t>(pos);
}

uint32_t Buffer::read_uint32_be_unsafe(size_t pos) const {
	return read_uint_unsafe<uint32_t>(pos);
}

std::optional<uint64_t> Buffer::read_uint64_be(size_t pos) const {
	return read_uint<uint64_t>(pos);
}

uint64_t Buffer::read_uint64_be_unsafe(size_t pos) const {
	return read_uint_unsafe<uint64_t>(pos);
}

bool Buffer::write_uint8(size_t pos, uint8_t num) {
	return write_uint<uint8_t>(pos, num);
}

Buffer& Buffer::write_uint8_unsafe(size_t pos, uint8_t num) {
	write_uint_unsafe<uint8_t>(pos, num);
	return *this;
}

bool Buffer::write_uint16_be(size_t pos, uint16_t num) {
	return write_uint<uint16_t>(pos, num);
}

Buffer& Buffer::write_uint16_be_unsafe(size_t pos, uint16_t num) {
	write_uint_unsafe<uint16_t>(pos, num);
	return *this;
}

bool Buffer::write_uint32_be(size_t pos, uint32_t num) {
	return write_uint<uint32_t>(pos, num);
}

Buffer& Buffer::write_uint32_be_unsafe(size_t pos, uint32_t num) {
	write_uint_unsafe<uint32_t>(pos, num);
	return *this;
}

bool Buffer::write_uint64_be(size_t pos, uint64_t num) {
	return write_uint<uint64_t>(pos, num);
}

Buffer& Buffer::write_uint64_be_unsafe(size_t pos, uint64_t num) {
	write_uint_unsafe<uint64_t>(pos, num);
	return *this;
}

//---------------- Integer read/write end ----------------//

} // namespace core
} // namespace chunkflow
