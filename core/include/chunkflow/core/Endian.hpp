#ifndef CHUNKFLOW_CORE_ENDIAN_HPP
#define CHUNKFLOW_CORE_ENDIAN_HPP

// Define endianness constants
#define CHUNKFLOW_CORE_BIG_ENDIAN 1234
#define CHUNKFLOW_CORE_LITTLE_ENDIAN 4321

// Check if already defined externally
#ifndef CHUNKFLOW_CORE_ENDIANNESS

#if __has_include(<endian.h>)

#include <endian.h>
#if defined(__BYTE_ORDER) && __BYTE_ORDER == __BIG_ENDIAN
#define CHUNKFLOW_CORE_ENDIANNESS CHUNKFLOW_CORE_BIG_ENDIAN
#elif defined(__BYTE_ORDER) && __BYTE_ORDER == __LITTLE_ENDIAN
#define CHUNKFLOW_CORE_ENDIANNESS CHUNKFLOW_CORE_LITTLE_ENDIAN
#endif

#elif __has_include(<machine/endian.h>)

#include <machine/endian.h>
#if defined(__DARWIN_BYTE_ORDER) && __DARWIN_BYTE_ORDER == __DARWIN_BIG_ENDIAN
#define CHUNKFLOW_CORE_ENDIANNESS CHUNKFLOW_CORE_BIG_ENDIAN
#elif defined(__DARWIN_BYTE_ORDER) && __DARWIN_BYTE_ORDER == __DARWIN_LITTLE_ENDIAN
#define CHUNKFLOW_CORE_ENDIANNESS CHUNKFLOW_CORE_LITTLE_ENDIAN
#endif

#endif

#ifndef CHUNKFLOW_CORE_ENDIANNESS
#error Could not detect endianness
#endif

#endif

#include <stdint.h>

namespace chunkflow {
namespace core {

/// Convert between host and network (big endian) order
template<typename T>
inline T to_be(T num) {
#if CHUNKFLOW_CORE_ENDIANNESS == CHUNKFLOW_CORE_BIG_ENDIAN
	return num;
#else
	if constexpr (sizeof(T) == 1) {
		return num;
	} else if constexpr (sizeof(T) == 2) {
		return __builtin_bswap16(num);
	} else if constexpr (sizeof(T) == 4) {
		return __builtin_bswap32(num);
	} else {
		return __builtin_bswap64(num);
	}
#endif
}

} // namespace core
} // namespace chunkflow

#endif // CHUNKFLOW_CORE_ENDIAN_HPP
