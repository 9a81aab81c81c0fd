#include "chunkflow/ndn/protocol/PieceDesc.hpp"

#include <algorithm>

namespace chunkflow {
namespace ndn {

PieceDesc::PieceDesc(Type desc_type, uint32_t start, uint32_t end, int32_t step) :
desc_type(desc_type), start(start), end(end), step(step) {}

PieceDesc PieceDesc::range(uint32_t index, uint16_t step) {
	return PieceDesc(Type::Range, index, index + 1, step);
}

PieceDesc PieceDesc::stream(uint32_t start, uint32_t end, int32_t step) {
	return PieceDesc(Type::Stream, start, end, step);
}

PieceDesc PieceDesc::full_stream(uint64_t chunk_len, uint16_t piece_size, bool reverse) {
	int32_t step = reverse ? -static_cast<int32_t>(piece_size) : piece_size;
	return stream(0, piece_count_of(chunk_len, piece_size), step);
}

std::pair<uint32_t, ByteRange> PieceDesc::stream_piece_range(ChunkId const& chunk) const {
	uint64_t size = piece_size();
	uint64_t len = chunk.len();

	ByteRange range;
	range.start = std::min<uint64_t>(start * size, len);
	range.end = std::min<uint64_t>(end * size, len);

	return std::make_pair(start, range);
}

void PieceDesc::encode(core::Buffer& buf, size_t pos) const {
	buf.write_uint8_unsafe(pos, static_cast<uint8_t>(desc_type));
	if(desc_type == Type::Range) {
		buf.write_uint32_be_unsafe(pos + 1, start);
		buf.write_uint16_be_unsafe(pos + 5, piece_size());
	} else {
		buf.write_uint32_be_unsafe(pos + 1, start);
		buf.write_uint32_be_unsafe(pos + 5, end);
		buf.write_uint32_be_unsafe(pos + 9, static_cast<uint32_t>(step));
	}
}

std::optional<PieceDesc> PieceDesc::decode(core::Buffer const& buf, size_t pos) {
	auto tag = buf.read_uint8(pos);
	if(!tag.has_value()) {
		return std::nullopt;
	}

	if(*tag == static_cast<uint8_t>(Type::Range)) {
		auto index = buf.read_uint32_be(pos + 1);
		auto step = buf.read_uint16_be(pos + 5);
		if(!index.has_value() || !step.has_value() || *step == 0 || *index == UINT32_MAX) {
			return std::nullopt;
		}
		return range(*index, *step);
	} else if(*tag == static_cast<uint8_t>(Type::Stream)) {
		auto start = buf.read_uint32_be(pos + 1);
		auto end = buf.read_uint32_be(pos + 5);
		auto step = buf.read_uint32_be(pos + 9);
		if(!start.has_value() || !end.has_value() || !step.has_value()) {
			return std::nullopt;
		}
		auto signed_step = static_cast<int32_t>(*step);
		if(signed_step == 0 || signed_step > UINT16_MAX || signed_step < -UINT16_MAX || *start > *end) {
			return std::nullopt;
		}
		return stream(*start, *end, signed_step);
	}

	return std::nullopt;
}

std::string PieceDesc::to_string() const {
	if(desc_type == Type::Range) {
		return "Range(" + std::to_string(start) + ", " + std::to_string(step) + ")";
	}
	return "Stream(" + std::to_string(start) + ", " + std::to_string(end) + ", " + std::to_string(step) + ")";
}

} // namespace ndn
} // namespace chunkflow
