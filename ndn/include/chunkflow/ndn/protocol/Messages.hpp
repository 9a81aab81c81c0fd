/*! \file Messages.hpp
	\brief Commands exchanged on the datagram tunnel, one datagram each

	Layout, big endian:
	\verbatim
	Interest     [u8 0x10][u32 session][chunk 36][desc]
	RespInterest [u8 0x11][u32 session][chunk 36][u8 error code]
	PieceData    [u8 0x12][u32 session][chunk 36][desc][payload]
	PieceControl [u8 0x13][u32 session][chunk 36][u8 command][u32 max_index]
	             [u16 count][count x (u32 start, u32 end)]
	\endverbatim
*/

#ifndef CHUNKFLOW_NDN_MESSAGES_HPP
#define CHUNKFLOW_NDN_MESSAGES_HPP

#include <chunkflow/core/Buffer.hpp>
#include <chunkflow/core/Error.hpp>
#include <chunkflow/ndn/protocol/IndexQueue.hpp>
#include <chunkflow/ndn/protocol/PieceDesc.hpp>
#include <chunkflow/ndn/types/ChunkId.hpp>

#include <absl/status/statusor.h>

#include <optional>
#include <vector>

namespace chunkflow {
namespace ndn {

enum class CommandCode : uint8_t {
	Interest = 0x10,
	RespInterest = 0x11,
	PieceData = 0x12,
	PieceControl = 0x13
};

/// Command code of a datagram, nullopt if unknown
std::optional<CommandCode> command_of(core::Buffer const& buf);

/// Size of [code][session][chunk] common to every command
constexpr size_t COMMAND_PREFIX_SIZE = 1 + 4 + ChunkId::SERIALIZED_SIZE;

/// Ask a peer to upload a window of a chunk
struct Interest {
	uint32_t session_id;
	ChunkId chunk;
	PieceDesc desc;

	core::Buffer encode() const;
	static absl::StatusOr<Interest> decode(core::Buffer const& buf);
};

/// Negative answer to an Interest
struct RespInterest {
	uint32_t session_id;
	ChunkId chunk;
	core::ErrorCode err;

	core::Buffer encode() const;
	static absl::StatusOr<RespInterest> decode(core::Buffer const& buf);
};

//! One piece of a chunk
/*!
	The header length depends only on the desc, header_size(desc) bytes precede
	the payload.
*/
struct PieceData {
	uint32_t session_id;
	ChunkId chunk;
	PieceDesc desc;
	core::Buffer data;

	static size_t header_size(PieceDesc const& desc) {
		return COMMAND_PREFIX_SIZE + desc.encoded_size();
	}

	//! Write the header at the front of out
	/*!
		\return header length, nullopt if out is too short
	*/
	static std::optional<size_t> encode_header(
		uint32_t session_id,
		ChunkId const& chunk,
		PieceDesc const& desc,
		uint8_t* out,
		size_t len
	);

	core::Buffer encode() const;
	/// Consumes the datagram, data is the covered payload
	static absl::StatusOr<PieceData> decode(core::Buffer&& buf);
};

enum class PieceControlCommand : uint8_t {
	/// Resend lost ranges, then continue beyond max_index
	Continue = 0,
	/// Download side has the whole window
	Finish = 1,
	/// Download side gave up
	Cancel = 2
};

/// Flow control sent by the download side
struct PieceControl {
	uint32_t session_id;
	ChunkId chunk;
	PieceControlCommand command;
	uint32_t max_index = 0;
	std::vector<IndexRange> lost;

	/// Fixed part of the command
	static constexpr size_t HEADER_SIZE = COMMAND_PREFIX_SIZE + 1 + 4 + 2;

	/// Lost ranges that fit a datagram of mtu bytes
	static size_t max_lost_in(size_t mtu) {
		return mtu > HEADER_SIZE ? (mtu - HEADER_SIZE) / 8 : 0;
	}

	core::Buffer encode() const;
	static absl::StatusOr<PieceControl> decode(core::Buffer const& buf);
};

} // namespace ndn
} // namespace chunkflow

#endif // CHUNKFLOW_NDN_MESSAGES_HPP
