#include "chunkflow/ndn/protocol/Messages.hpp"

#include <algorithm>
#include <cstring>

namespace chunkflow {
namespace ndn {

using core::ErrorCode;
using core::make_error;

std::optional<CommandCode> command_of(core::Buffer const& buf) {
	auto code = buf.read_uint8(0);
	if(!code.has_value()) {
		return std::nullopt;
	}

	switch(*code) {
		case 0x10: return CommandCode::Interest;
		case 0x11: return CommandCode::RespInterest;
		case 0x12: return CommandCode::PieceData;
		case 0x13: return CommandCode::PieceControl;
	}
	return std::nullopt;
}

static void encode_prefix(core::Buffer& buf, CommandCode code, uint32_t session_id, ChunkId const& chunk) {
	buf.write_uint8_unsafe(0, static_cast<uint8_t>(code))
		.write_uint32_be_unsafe(1, session_id);
	chunk.serialize(buf, 5);
}

static absl::Status decode_prefix(
	core::Buffer const& buf,
	CommandCode code,
	uint32_t& session_id,
	ChunkId& chunk
) {
	if(buf.size() < COMMAND_PREFIX_SIZE || buf.read_uint8_unsafe(0) != static_cast<uint8_t>(code)) {
		return make_error(ErrorCode::InvalidInput, "command too short or mismatched");
	}

	session_id = buf.read_uint32_be_unsafe(1);
	auto decoded = ChunkId::deserialize(buf, 5);
	if(!decoded.has_value()) {
		return make_error(ErrorCode::InvalidInput, "invalid chunk id");
	}
	chunk = *decoded;

	return absl::OkStatus();
}

//---------------- Interest begin ----------------//

core::Buffer Interest::encode() const {
	core::Buffer buf(COMMAND_PREFIX_SIZE + desc.encoded_size());
	encode_prefix(buf, CommandCode::Interest, session_id, chunk);
	desc.encode(buf, COMMAND_PREFIX_SIZE);
	return buf;
}

absl::StatusOr<Interest> Interest::decode(core::Buffer const& buf) {
	uint32_t session_id;
	ChunkId chunk;
	auto status = decode_prefix(buf, CommandCode::Interest, session_id, chunk);
	if(!status.ok()) {
		return status;
	}

	auto desc = PieceDesc::decode(buf, COMMAND_PREFIX_SIZE);
	if(!desc.has_value()) {
		return make_error(ErrorCode::InvalidInput, "invalid piece desc");
	}

	return Interest{session_id, chunk, *desc};
}

//---------------- Interest end ----------------//

//---------------- RespInterest begin ----------------//

core::Buffer RespInterest::encode() const {
	core::Buffer buf(COMMAND_PREFIX_SIZE + 1);
	encode_prefix(buf, CommandCode::RespInterest, session_id, chunk);
	buf.write_uint8_unsafe(COMMAND_PREFIX_SIZE, static_cast<uint8_t>(err));
	return buf;
}

absl::StatusOr<RespInterest> RespInterest::decode(core::Buffer const& buf) {
	uint32_t session_id;
	ChunkId chunk;
	auto status = decode_prefix(buf, CommandCode::RespInterest, session_id, chunk);
	if(!status.ok()) {
		return status;
	}

	auto err = buf.read_uint8(COMMAND_PREFIX_SIZE);
	if(!err.has_value()) {
		return make_error(ErrorCode::InvalidInput, "missing error code");
	}

	return RespInterest{session_id, chunk, static_cast<ErrorCode>(*err)};
}

//---------------- RespInterest end ----------------//

//---------------- PieceData begin ----------------//

std::optional<size_t> PieceData::encode_header(
	uint32_t session_id,
	ChunkId const& chunk,
	PieceDesc const& desc,
	uint8_t* out,
	size_t len
) {
	auto size = header_size(desc);
	if(len < size) {
		return std::nullopt;
	}

	core::Buffer header(size);
	encode_prefix(header, CommandCode::PieceData, session_id, chunk);
	desc.encode(header, COMMAND_PREFIX_SIZE);
	std::memcpy(out, header.data(), size);

	return size;
}

core::Buffer PieceData::encode() const {
	auto size = header_size(desc);
	core::Buffer buf(size + data.size());
	encode_prefix(buf, CommandCode::PieceData, session_id, chunk);
	desc.encode(buf, COMMAND_PREFIX_SIZE);
	buf.write_unsafe(size, data.data(), data.size());
	return buf;
}

absl::StatusOr<PieceData> PieceData::decode(core::Buffer&& buf) {
	uint32_t session_id;
	ChunkId chunk;
	auto status = decode_prefix(buf, CommandCode::PieceData, session_id, chunk);
	if(!status.ok()) {
		return status;
	}

	auto desc = PieceDesc::decode(buf, COMMAND_PREFIX_SIZE);
	if(!desc.has_value()) {
		return make_error(ErrorCode::InvalidInput, "invalid piece desc");
	}

	buf.cover_unsafe(header_size(*desc));
	return PieceData{session_id, chunk, *desc, std::move(buf)};
}

//---------------- PieceData end ----------------//

//---------------- PieceControl begin ----------------//

core::Buffer PieceControl::encode() const {
	auto count = std::min<size_t>(lost.size(), UINT16_MAX);
	core::Buffer buf(HEADER_SIZE + count * 8);
	encode_prefix(buf, CommandCode::PieceControl, session_id, chunk);
	buf.write_uint8_unsafe(COMMAND_PREFIX_SIZE, static_cast<uint8_t>(command))
		.write_uint32_be_unsafe(COMMAND_PREFIX_SIZE + 1, max_index)
		.write_uint16_be_unsafe(COMMAND_PREFIX_SIZE + 5, static_cast<uint16_t>(count));

	size_t pos = HEADER_SIZE;
	for(size_t i = 0; i < count; i++, pos += 8) {
		buf.write_uint32_be_unsafe(pos, lost[i].start)
			.write_uint32_be_unsafe(pos + 4, lost[i].end);
	}

	return buf;
}

absl::StatusOr<PieceControl> PieceControl::decode(core::Buffer const& buf) {
	uint32_t session_id;
	ChunkId chunk;
	auto status = decode_prefix(buf, CommandCode::PieceControl, session_id, chunk);
	if(!status.ok()) {
		return status;
	}

	if(buf.size() < HEADER_SIZE) {
		return make_error(ErrorCode::InvalidInput, "piece control too short");
	}

	auto command = buf.read_uint8_unsafe(COMMAND_PREFIX_SIZE);
	if(command > static_cast<uint8_t>(PieceControlCommand::Cancel)) {
		return make_error(ErrorCode::InvalidInput, "unknown piece control command");
	}

	auto max_index = buf.read_uint32_be_unsafe(COMMAND_PREFIX_SIZE + 1);
	auto count = buf.read_uint16_be_unsafe(COMMAND_PREFIX_SIZE + 5);
	if(buf.size() < HEADER_SIZE + size_t(count) * 8) {
		return make_error(ErrorCode::InvalidInput, "truncated lost ranges");
	}

	std::vector<IndexRange> lost;
	lost.reserve(count);
	size_t pos = HEADER_SIZE;
	for(uint16_t i = 0; i < count; i++, pos += 8) {
		lost.push_back(IndexRange{buf.read_uint32_be_unsafe(pos), buf.read_uint32_be_unsafe(pos + 4)});
	}

	return PieceControl{session_id, chunk, static_cast<PieceControlCommand>(command), max_index, std::move(lost)};
}

//---------------- PieceControl end ----------------//

} // namespace ndn
} // namespace chunkflow
