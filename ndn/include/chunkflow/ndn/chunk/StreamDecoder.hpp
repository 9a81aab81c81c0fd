/*! \file StreamDecoder.hpp
*/

#ifndef CHUNKFLOW_NDN_STREAMDECODER_HPP
#define CHUNKFLOW_NDN_STREAMDECODER_HPP

#include <chunkflow/ndn/chunk/ChunkStreamCache.hpp>

#include <memory>
#include <mutex>

namespace chunkflow {
namespace ndn {

//! Receive side of one session
/*!
	Accepts Range pieces of its own window only and reports finished on the push
	that completes the window.
*/
class StreamDecoder {
private:
	ChunkId chunk_id;
	PieceDesc window;
	std::shared_ptr<ChunkStreamCache> stream_cache;

	mutable std::mutex lock;
	bool is_finished = false;

public:
	StreamDecoder(ChunkId const& chunk, PieceDesc const& desc, std::shared_ptr<ChunkStreamCache> cache);

	ChunkId const& chunk() const {
		return chunk_id;
	}

	PieceDesc const& desc() const {
		return window;
	}

	std::shared_ptr<ChunkStreamCache> const& cache() const {
		return stream_cache;
	}

	absl::StatusOr<PushIndexResult> push_piece_data(PieceData const& piece);

	/// Missing pieces of the window, nullopt once complete
	std::optional<RequireIndex> require_index() const;

	bool finished() const;
};

} // namespace ndn
} // namespace chunkflow

#endif // CHUNKFLOW_NDN_STREAMDECODER_HPP
