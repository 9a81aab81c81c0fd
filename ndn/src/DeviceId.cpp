#include "chunkflow/ndn/types/DeviceId.hpp"

#include <sodium.h>

namespace chunkflow {
namespace ndn {

DeviceId DeviceId::from_name(std::string const& name) {
	std::array<uint8_t, SIZE> id;
	crypto_hash_sha256(id.data(), (uint8_t const*)name.data(), name.size());

	return DeviceId(id);
}

std::optional<DeviceId> DeviceId::from_string(std::string const& hex) {
	if(hex.size() != SIZE * 2) {
		return std::nullopt;
	}

	std::array<uint8_t, SIZE> id;
	size_t bin_len = 0;
	if(sodium_hex2bin(id.data(), SIZE, hex.data(), hex.size(), nullptr, &bin_len, nullptr) != 0 ||
		bin_len != SIZE) {
		return std::nullopt;
	}

	return DeviceId(id);
}

std::string DeviceId::to_string() const {
	char hex[SIZE * 2 + 1];
	sodium_bin2hex(hex, sizeof(hex), id.data(), SIZE);

	return std::string(hex);
}

std::optional<DeviceId> DeviceId::deserialize(core::Buffer const& buf, size_t pos) {
	std::array<uint8_t, SIZE> id;
	if(!buf.read(pos, id.data(), SIZE)) {
		return std::nullopt;
	}

	return DeviceId(id);
}

} // namespace ndn
} // namespace chunkflow
