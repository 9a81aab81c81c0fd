#include "chunkflow/ndn/types/ChunkId.hpp"

#include <sodium.h>

namespace chunkflow {
namespace ndn {

ChunkId::ChunkId(std::array<uint8_t, HASH_SIZE> const& digest, uint32_t length) :
digest(digest), length(length) {}

ChunkId ChunkId::calculate(uint8_t const* data, size_t size) {
	static_assert(HASH_SIZE == crypto_hash_sha256_BYTES);

	std::array<uint8_t, HASH_SIZE> digest;
	crypto_hash_sha256(digest.data(), data, size);

	return ChunkId(digest, static_cast<uint32_t>(size));
}

std::string ChunkId::to_string() const {
	char hex[HASH_SIZE * 2 + 1];
	sodium_bin2hex(hex, sizeof(hex), digest.data(), HASH_SIZE);

	return std::string(hex).append(":").append(std::to_string(length));
}

std::optional<ChunkId> ChunkId::from_string(std::string const& str) {
	auto pos = str.find(':');
	if(pos != HASH_SIZE * 2 || pos + 1 >= str.size()) {
		return std::nullopt;
	}

	std::array<uint8_t, HASH_SIZE> digest;
	size_t bin_len = 0;
	if(sodium_hex2bin(
		digest.data(),
		HASH_SIZE,
		str.data(),
		pos,
		nullptr,
		&bin_len,
		nullptr
	) != 0 || bin_len != HASH_SIZE) {
		return std::nullopt;
	}

	auto len_string = str.substr(pos + 1);
	if(len_string.size() > 10 || len_string.find_first_not_of("0123456789") != std::string::npos) {
		return std::nullopt;
	}
	auto length = std::stoull(len_string);
	if(length > UINT32_MAX) {
		return std::nullopt;
	}

	return ChunkId(digest, static_cast<uint32_t>(length));
}

void ChunkId::serialize(core::Buffer& buf, size_t pos) const {
	buf.write_unsafe(pos, digest.data(), HASH_SIZE);
	buf.write_uint32_be_unsafe(pos + HASH_SIZE, length);
}

std::optional<ChunkId> ChunkId::deserialize(core::Buffer const& buf, size_t pos) {
	std::array<uint8_t, HASH_SIZE> digest;
	if(!buf.read(pos, digest.data(), HASH_SIZE)) {
		return std::nullopt;
	}

	auto length = buf.read_uint32_be(pos + HASH_SIZE);
	if(!length.has_value()) {
		return std::nullopt;
	}

	return ChunkId(digest, *length);
}

} // namespace ndn
} // namespace chunkflow
