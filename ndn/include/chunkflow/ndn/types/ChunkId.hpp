/*! \file ChunkId.hpp
	\brief Content hash identity of a chunk
*/

#ifndef CHUNKFLOW_NDN_CHUNKID_HPP
#define CHUNKFLOW_NDN_CHUNKID_HPP

#include <chunkflow/core/Buffer.hpp>

#include <array>
#include <cstring>
#include <functional>
#include <optional>
#include <string>

namespace chunkflow {
namespace ndn {

/// SHA-256 of the content plus its length, immutable
class ChunkId {
public:
	static constexpr size_t HASH_SIZE = 32;
	/// Bytes on the wire
	static constexpr size_t SERIALIZED_SIZE = HASH_SIZE + 4;

private:
	std::array<uint8_t, HASH_SIZE> digest{};
	uint32_t length = 0;

public:
	ChunkId() = default;
	ChunkId(std::array<uint8_t, HASH_SIZE> const& digest, uint32_t length);

	/// Hash the given content
	static ChunkId calculate(uint8_t const* data, size_t size);

	uint32_t len() const {
		return length;
	}

	std::array<uint8_t, HASH_SIZE> const& hash() const {
		return digest;
	}

	/// "<hex digest>:<length>"
	std::string to_string() const;
	static std::optional<ChunkId> from_string(std::string const& str);

	/// Write at pos, caller checks bounds
	void serialize(core::Buffer& buf, size_t pos) const;
	static std::optional<ChunkId> deserialize(core::Buffer const& buf, size_t pos);

	bool operator==(ChunkId const& other) const {
		return length == other.length && digest == other.digest;
	}
	bool operator!=(ChunkId const& other) const {
		return !(*this == other);
	}
	bool operator<(ChunkId const& other) const {
		return digest < other.digest || (digest == other.digest && length < other.length);
	}
};

} // namespace ndn
} // namespace chunkflow

namespace std {
	template <>
	struct hash<chunkflow::ndn::ChunkId>
	{
		size_t operator()(chunkflow::ndn::ChunkId const& chunk) const
		{
			size_t res;
			std::memcpy(&res, chunk.hash().data(), sizeof(res));
			return res ^ std::hash<uint32_t>()(chunk.len());
		}
	};
}

#endif // CHUNKFLOW_NDN_CHUNKID_HPP
