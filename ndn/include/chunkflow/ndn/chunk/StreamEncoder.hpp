/*! \file StreamEncoder.hpp
*/

#ifndef CHUNKFLOW_NDN_STREAMENCODER_HPP
#define CHUNKFLOW_NDN_STREAMENCODER_HPP

#include <chunkflow/ndn/chunk/ChunkStreamCache.hpp>
#include <chunkflow/ndn/protocol/IndexQueue.hpp>

#include <memory>
#include <mutex>
#include <variant>

namespace chunkflow {
namespace ndn {

//! Send side of one session
/*!
	Walks an OutcomeIndexQueue over its window and encodes one PieceData per
	next_piece call. Storage refusing sync reads gets one async read in flight at a
	time:

	\li None: nothing in flight
	\li Pending: async read of desc dispatched
	\li Waiting: async read of desc completed, result kept for the next poll
*/
class StreamEncoder : public std::enable_shared_from_this<StreamEncoder> {
private:
	struct None {};
	struct Pending {
		PieceDesc desc;
	};
	struct Waiting {
		PieceDesc desc;
		absl::StatusOr<core::Buffer> result;
	};
	using State = std::variant<None, Pending, Waiting>;

	std::shared_ptr<ChunkStreamCache> stream_cache;
	PieceDesc window;

	mutable std::mutex lock;
	OutcomeIndexQueue indices;
	State state;

	StreamEncoder(std::shared_ptr<ChunkStreamCache> cache, PieceDesc const& desc);

	/// Index of the piece in flight, if any
	std::optional<uint32_t> in_flight() const;
	/// Drop the piece in flight if it is no longer the head, caller holds the lock
	void abandon_stale();
	void on_async_read(PieceDesc const& desc, absl::StatusOr<core::Buffer> result);

public:
	static std::shared_ptr<StreamEncoder> create(std::shared_ptr<ChunkStreamCache> cache, PieceDesc const& desc);

	std::shared_ptr<ChunkStreamCache> const& cache() const {
		return stream_cache;
	}

	PieceDesc const& desc() const {
		return window;
	}

	//! Encode the next piece into buf
	/*!
		\return bytes written, 0 if nothing is ready yet
	*/
	absl::StatusOr<size_t> next_piece(uint32_t session_id, uint8_t* buf, size_t len);

	/// Rewind to the whole window
	void reset();
	//! Apply a Continue from the remote
	/*!
		Rewinds to the whole window like reset. A piece in flight is kept only
		when it is the new head.
	*/
	void merge(uint32_t max_index, std::vector<IndexRange> const& lost);

	/// Nothing left to send and nothing in flight
	bool finished() const;
	uint32_t remaining() const;
};

} // namespace ndn
} // namespace chunkflow

#endif // CHUNKFLOW_NDN_STREAMENCODER_HPP
