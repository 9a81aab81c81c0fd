/*! \file DeviceId.hpp
	\brief Peer identity and descriptor
*/

#ifndef CHUNKFLOW_NDN_DEVICEID_HPP
#define CHUNKFLOW_NDN_DEVICEID_HPP

#include <chunkflow/core/Buffer.hpp>
#include <chunkflow/core/SocketAddress.hpp>

#include <array>
#include <cstring>
#include <functional>
#include <optional>
#include <string>

namespace chunkflow {
namespace ndn {

/// 32 byte identity of a peer
class DeviceId {
public:
	static constexpr size_t SIZE = 32;

private:
	std::array<uint8_t, SIZE> id{};

public:
	DeviceId() = default;
	DeviceId(std::array<uint8_t, SIZE> const& id) : id(id) {}

	/// Derive an id by hashing a name
	static DeviceId from_name(std::string const& name);
	static std::optional<DeviceId> from_string(std::string const& hex);
	std::string to_string() const;

	std::array<uint8_t, SIZE> const& bytes() const {
		return id;
	}

	void serialize(core::Buffer& buf, size_t pos) const {
		buf.write_unsafe(pos, id.data(), SIZE);
	}
	static std::optional<DeviceId> deserialize(core::Buffer const& buf, size_t pos);

	bool operator==(DeviceId const& other) const {
		return id == other.id;
	}
	bool operator!=(DeviceId const& other) const {
		return id != other.id;
	}
	bool operator<(DeviceId const& other) const {
		return id < other.id;
	}
};

/// A peer and where to reach it
struct PeerDesc {
	DeviceId id;
	core::SocketAddress endpoint;
};

} // namespace ndn
} // namespace chunkflow

namespace std {
	template <>
	struct hash<chunkflow::ndn::DeviceId>
	{
		size_t operator()(chunkflow::ndn::DeviceId const& device) const
		{
			size_t res;
			std::memcpy(&res, device.bytes().data(), sizeof(res));
			return res;
		}
	};
}

#endif // CHUNKFLOW_NDN_DEVICEID_HPP
