#include "chunkflow/ndn/chunk/StreamEncoder.hpp"

#include <chunkflow/core/Error.hpp>

#include <spdlog/spdlog.h>

#include <cstring>

namespace chunkflow {
namespace ndn {

using core::ErrorCode;
using core::make_error;

StreamEncoder::StreamEncoder(std::shared_ptr<ChunkStreamCache> cache, PieceDesc const& desc) :
stream_cache(std::move(cache)),
window(desc),
indices(std::get<0>(desc.unwrap_as_stream()), std::get<1>(desc.unwrap_as_stream()), std::get<2>(desc.unwrap_as_stream())),
state(None{}) {}

std::shared_ptr<StreamEncoder> StreamEncoder::create(std::shared_ptr<ChunkStreamCache> cache, PieceDesc const& desc) {
	return std::shared_ptr<StreamEncoder>(new StreamEncoder(std::move(cache), desc));
}

std::optional<uint32_t> StreamEncoder::in_flight() const {
	if(auto* pending = std::get_if<Pending>(&state)) {
		return pending->desc.index();
	}
	if(auto* waiting = std::get_if<Waiting>(&state)) {
		return waiting->desc.index();
	}
	return std::nullopt;
}

void StreamEncoder::abandon_stale() {
	auto index = in_flight();
	if(index.has_value() && indices.next() != index) {
		SPDLOG_DEBUG(
			"StreamEncoder {{ Chunk: {} }}: Abandon piece {} in flight",
			stream_cache->chunk().to_string(),
			*index
		);
		state = None{};
	}
}

absl::StatusOr<size_t> StreamEncoder::next_piece(uint32_t session_id, uint8_t* buf, size_t len) {
	std::unique_lock<std::mutex> guard(lock);

	if(std::holds_alternative<Pending>(state)) {
		return 0;
	}

	if(std::holds_alternative<Waiting>(state)) {
		auto waiting = std::move(std::get<Waiting>(state));
		state = None{};

		if(indices.next() != waiting.desc.index()) {
			// Head moved while the read was in flight
			return 0;
		}
		if(!waiting.result.ok()) {
			return waiting.result.status();
		}

		auto& data = *waiting.result;
		auto header = PieceData::encode_header(session_id, stream_cache->chunk(), waiting.desc, buf, len);
		if(!header.has_value() || len - *header < data.size()) {
			return make_error(ErrorCode::InvalidInput, "buffer shorter than piece");
		}
		std::memcpy(buf + *header, data.data(), data.size());

		indices.pop_next();
		return *header + data.size();
	}

	auto head = indices.next();
	if(!head.has_value() || !stream_cache->exists(*head)) {
		return 0;
	}

	auto desc = PieceDesc::range(*head, window.piece_size());
	auto header = PieceData::encode_header(session_id, stream_cache->chunk(), desc, buf, len);
	if(!header.has_value()) {
		return make_error(ErrorCode::InvalidInput, "buffer shorter than piece header");
	}

	auto read = stream_cache->sync_try_read(desc, buf + *header, len - *header);
	if(read.ok()) {
		indices.pop_next();
		return *header + *read;
	}
	if(core::error_code(read.status()) != ErrorCode::UnSupport) {
		return read.status();
	}

	// Storage wants async access
	state = Pending{desc};
	guard.unlock();

	SPDLOG_TRACE(
		"StreamEncoder {{ Chunk: {} }}: Async read of piece {}",
		stream_cache->chunk().to_string(),
		desc.index()
	);
	std::weak_ptr<StreamEncoder> weak_self = shared_from_this();
	stream_cache->async_try_read(desc, [weak_self, desc](absl::StatusOr<core::Buffer> result) {
		if(auto self = weak_self.lock()) {
			self->on_async_read(desc, std::move(result));
		}
	});

	return 0;
}

void StreamEncoder::on_async_read(PieceDesc const& desc, absl::StatusOr<core::Buffer> result) {
	std::lock_guard<std::mutex> guard(lock);

	auto* pending = std::get_if<Pending>(&state);
	if(pending == nullptr || pending->desc != desc) {
		SPDLOG_TRACE(
			"StreamEncoder {{ Chunk: {} }}: Discard stale read of piece {}",
			stream_cache->chunk().to_string(),
			desc.index()
		);
		return;
	}

	state = Waiting{desc, std::move(result)};
}

void StreamEncoder::reset() {
	std::lock_guard<std::mutex> guard(lock);
	indices.reset();
	abandon_stale();
}

void StreamEncoder::merge(uint32_t max_index, std::vector<IndexRange> const& lost) {
	std::lock_guard<std::mutex> guard(lock);
	SPDLOG_TRACE(
		"StreamEncoder {{ Chunk: {} }}: Merge at {} with {} lost ranges, rewind window",
		stream_cache->chunk().to_string(),
		max_index,
		lost.size()
	);
	indices.reset();
	abandon_stale();
}

bool StreamEncoder::finished() const {
	std::lock_guard<std::mutex> guard(lock);
	return indices.empty() && std::holds_alternative<None>(state);
}

uint32_t StreamEncoder::remaining() const {
	std::lock_guard<std::mutex> guard(lock);
	return indices.remaining();
}

} // namespace ndn
} // namespace chunkflow
