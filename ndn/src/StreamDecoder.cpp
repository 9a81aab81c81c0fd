#include "chunkflow/ndn/chunk/StreamDecoder.hpp"

#include <spdlog/spdlog.h>

namespace chunkflow {
namespace ndn {

StreamDecoder::StreamDecoder(ChunkId const& chunk, PieceDesc const& desc, std::shared_ptr<ChunkStreamCache> cache) :
chunk_id(chunk), window(desc), stream_cache(std::move(cache)) {}

absl::StatusOr<PushIndexResult> StreamDecoder::push_piece_data(PieceData const& piece) {
	auto [start, end, step] = window.unwrap_as_stream();
	(void)step;

	if(!piece.desc.is_range() || piece.chunk != chunk_id) {
		SPDLOG_TRACE("StreamDecoder {{ Chunk: {} }}: Reject piece {}", chunk_id.to_string(), piece.desc.to_string());
		return PushIndexResult();
	}
	auto index = piece.desc.index();
	if(index < start || index >= end) {
		SPDLOG_TRACE("StreamDecoder {{ Chunk: {} }}: Piece {} out of window", chunk_id.to_string(), index);
		return PushIndexResult();
	}

	auto res = stream_cache->push_piece_data(piece);
	if(!res.ok()) {
		return res;
	}

	if(res->pushed()) {
		auto required = stream_cache->require_index(window);
		res->finished = !required.has_value();

		std::lock_guard<std::mutex> guard(lock);
		is_finished = is_finished || res->finished;
	} else {
		res->finished = false;
	}

	return res;
}

std::optional<RequireIndex> StreamDecoder::require_index() const {
	return stream_cache->require_index(window);
}

bool StreamDecoder::finished() const {
	{
		std::lock_guard<std::mutex> guard(lock);
		if(is_finished) {
			return true;
		}
	}
	return !stream_cache->require_index(window).has_value();
}

} // namespace ndn
} // namespace chunkflow
