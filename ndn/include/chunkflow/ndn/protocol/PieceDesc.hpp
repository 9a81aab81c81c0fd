/*! \file PieceDesc.hpp
	\brief Description of one piece, or of a window of pieces, of a chunk
*/

#ifndef CHUNKFLOW_NDN_PIECEDESC_HPP
#define CHUNKFLOW_NDN_PIECEDESC_HPP

#include <chunkflow/core/Buffer.hpp>
#include <chunkflow/ndn/types/ChunkId.hpp>

#include <optional>
#include <string>
#include <tuple>
#include <utility>

namespace chunkflow {
namespace ndn {

/// Half open byte range
struct ByteRange {
	uint64_t start = 0;
	uint64_t end = 0;

	uint64_t len() const {
		return end - start;
	}

	bool operator==(ByteRange const& other) const {
		return start == other.start && end == other.end;
	}
};

/// Number of pieces of size piece_size needed for len bytes
inline uint32_t piece_count_of(uint64_t len, uint16_t piece_size) {
	return static_cast<uint32_t>((len + piece_size - 1) / piece_size);
}

//! Immutable piece descriptor
/*!
	\li Range(index, step): a single piece, step is the piece size in bytes
	\li Stream(start, end, step): the index window [start, end), |step| is the piece
	size and its sign the direction in which the window is walked
*/
class PieceDesc {
public:
	enum class Type : uint8_t {
		Range = 0,
		Stream = 1
	};

	/// Bytes of an encoded Range desc
	static constexpr size_t RANGE_SIZE = 7;
	/// Bytes of an encoded Stream desc
	static constexpr size_t STREAM_SIZE = 13;

private:
	Type desc_type;
	uint32_t start;
	uint32_t end;
	int32_t step;

	PieceDesc(Type desc_type, uint32_t start, uint32_t end, int32_t step);

public:
	static PieceDesc range(uint32_t index, uint16_t step);
	static PieceDesc stream(uint32_t start, uint32_t end, int32_t step);
	/// Window over every piece of a chunk
	static PieceDesc full_stream(uint64_t chunk_len, uint16_t piece_size, bool reverse = false);

	Type type() const {
		return desc_type;
	}

	bool is_range() const {
		return desc_type == Type::Range;
	}

	/// Piece index of a Range, first index of a Stream
	uint32_t index() const {
		return start;
	}

	uint16_t piece_size() const {
		return static_cast<uint16_t>(step < 0 ? -step : step);
	}

	/// (start, end, step) window, a Range is the window of its single index
	std::tuple<uint32_t, uint32_t, int32_t> unwrap_as_stream() const {
		return std::make_tuple(start, end, step);
	}

	/// Index and absolute byte range in a chunk
	std::pair<uint32_t, ByteRange> stream_piece_range(ChunkId const& chunk) const;

	size_t encoded_size() const {
		return desc_type == Type::Range ? RANGE_SIZE : STREAM_SIZE;
	}

	/// Write at pos, caller checks bounds
	void encode(core::Buffer& buf, size_t pos) const;
	static std::optional<PieceDesc> decode(core::Buffer const& buf, size_t pos);

	std::string to_string() const;

	bool operator==(PieceDesc const& other) const {
		return desc_type == other.desc_type &&
			start == other.start &&
			end == other.end &&
			step == other.step;
	}
	bool operator!=(PieceDesc const& other) const {
		return !(*this == other);
	}
};

} // namespace ndn
} // namespace chunkflow

#endif // CHUNKFLOW_NDN_PIECEDESC_HPP
