/*! \file Buffer.hpp
*/

#ifndef CHUNKFLOW_CORE_BUFFER_HPP
#define CHUNKFLOW_CORE_BUFFER_HPP

#include <stdint.h>
#include <stddef.h>
#include <initializer_list>
#include <optional>

namespace chunkflow {
namespace core {

/// @brief Byte buffer with modifiable bounds and memory ownership
/// @headerfile Buffer.hpp <chunkflow/core/Buffer.hpp>
///
/// Multi byte integers are read and written in network (big endian) order.
class Buffer {
private:
	/// Pointer to underlying memory
	uint8_t *buf;
	/// Capacity of memory
	size_t capacity;
	/// Start index in memory, inclusive
	size_t start_index;
	/// End index in memory, non-inclusive
	size_t end_index;

	template<typename T>
	std::optional<T> read_uint(size_t pos) const;
	template<typename T>
	T read_uint_unsafe(size_t pos) const;
	template<typename T>
	bool write_uint(size_t pos, T num);
	template<typename T>
	void write_uint_unsafe(size_t pos, T num);

public:
	/// Construct with given size - preferred constructor
	Buffer(size_t size);

	/// Construct with initializer list and given size
	Buffer(std::initializer_list<uint8_t> il, size_t size);

	/// Construct from uint8_t array - unsafe if uint8_t * isn't obtained from new[]
	Buffer(uint8_t *buf, size_t size);

	/// Construct by copying bytes
	static Buffer copy_of(uint8_t const* in, size_t size);

	/// Move contructor
	Buffer(Buffer &&b) noexcept;

	/// Delete copy contructor
	Buffer(Buffer const &b) = delete;

	/// Move assign
	Buffer &operator=(Buffer &&b) noexcept;

	/// Delete copy assign
	Buffer &operator=(Buffer const &p) = delete;

	~Buffer();

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

	/// Release the memory held by the buffer
	inline uint8_t *release() {
		uint8_t *_buf = buf;

		buf = nullptr;
		capacity = 0;
		start_index = 0;
		end_index = 0;

		return _buf;
	}

	/// @name Bounds change
	/// @{

	/// Moves start of buffer forward and covers given number of bytes
	[[nodiscard]] bool cover(size_t num);
	/// Moves start of buffer forward without bounds checking
	Buffer& cover_unsafe(size_t num);

	/// Moves start of buffer backward and uncovers given number of bytes
	[[nodiscard]] bool uncover(size_t num);
	/// Moves start of buffer backward without bounds checking
	Buffer& uncover_unsafe(size_t num);

	/// Moves end of buffer backward and covers given number of bytes
	[[nodiscard]] bool truncate(size_t num);
	/// Moves end of buffer backward without bounds checking
	Buffer& truncate_unsafe(size_t num);

	/// Moves end of buffer forward and uncovers given number of bytes
	[[nodiscard]] bool expand(size_t num);
	/// Moves end of buffer forward without bounds checking
	Buffer& expand_unsafe(size_t num);
	/// @}

	/// @name Read/Write arbitrary data
	/// @{
	[[nodiscard]] bool read(size_t pos, uint8_t* out, size_t size) const;
	void read_unsafe(size_t pos, uint8_t* out, size_t size) const;

	[[nodiscard]] bool write(size_t pos, uint8_t const* in, size_t size);
	Buffer& write_unsafe(size_t pos, uint8_t const* in, size_t size);
	/// @}

	/// @name Read/Write big endian integers
	/// @{
	std::optional<uint8_t> read_uint8(size_t pos) const;
	uint8_t read_uint8_unsafe(size_t pos) const;
	std::optional<uint16_t> read_uint16_be(size_t pos) const;
	uint16_t read_uint16_be_unsafe(size_t pos) const;
	std::optional<uint32_t> read_uint32_be(size_t pos) const;
	uint32_t read_uint32_be_unsafe(size_t pos) const;
	std::optional<uint64_t> read_uint64_be(size_t pos) const;
	uint64_t read_uint64_be_unsafe(size_t pos) const;

	[[nodiscard]] bool write_uint8(size_t pos, uint8_t num);
	Buffer& write_uint8_unsafe(size_t pos, uint8_t num);
	[[nodiscard]] bool write_uint16_be(size_t pos, uint16_t num);
	Buffer& write_uint16_be_unsafe(size_t pos, uint16_t num);
	[[nodiscard]] bool write_uint32_be(size_t pos, uint32_t num);
	Buffer& write_uint32_be_unsafe(size_t pos, uint32_t num);
	[[nodiscard]] bool write_uint64_be(size_t pos, uint64_t num);
	Buffer& write_uint64_be_unsafe(size_t pos, uint64_t num);
	/// @}
};

} // namespace core
} // namespace chunkflow

#endif // CHUNKFLOW_CORE_BUFFER_HPP
