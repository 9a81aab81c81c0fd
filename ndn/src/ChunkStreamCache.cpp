#include "chunkflow/ndn/chunk/ChunkStreamCache.hpp"

#include <chunkflow/core/Error.hpp>

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace chunkflow {
namespace ndn {

using core::ErrorCode;
using core::make_error;

ChunkStreamCache::ChunkStreamCache(ChunkId const& chunk, uint16_t piece_size) :
chunk_id(chunk), piece_sz(piece_size), indices(chunk.len(), piece_size) {}

std::shared_ptr<ChunkStreamCache> ChunkStreamCache::create(ChunkId const& chunk, uint16_t piece_size) {
	return std::shared_ptr<ChunkStreamCache>(new ChunkStreamCache(chunk, piece_size));
}

absl::StatusOr<RawCache*> ChunkStreamCache::raw_cache() const {
	std::shared_lock<std::shared_mutex> guard(lock);
	if(!raw) {
		return make_error(ErrorCode::ErrorState, "raw cache not loaded");
	}
	return raw.get();
}

std::optional<std::pair<IndexRange, ByteRange>> ChunkStreamCache::piece_range(PieceDesc const& desc) const {
	if(desc.piece_size() != piece_sz) {
		return std::nullopt;
	}

	auto [start, end, step] = desc.unwrap_as_stream();
	(void)step;
	if(start >= end || end > indices.piece_count()) {
		return std::nullopt;
	}

	return std::make_pair(IndexRange{start, end}, desc.stream_piece_range(chunk_id).second);
}

//---------------- Load begin ----------------//

absl::Status ChunkStreamCache::load(bool finished, std::unique_ptr<RawCache> raw_cache) {
	if(raw_cache->capacity() < chunk_id.len()) {
		SPDLOG_ERROR(
			"ChunkStreamCache {{ Chunk: {} }}: Raw cache too small: {}",
			chunk_id.to_string(),
			raw_cache->capacity()
		);
		return make_error(ErrorCode::InvalidInput, "raw cache smaller than chunk");
	}

	std::vector<std::shared_ptr<ExistsWaiter>> ready;
	{
		std::unique_lock<std::shared_mutex> guard(lock);
		if(raw) {
			guard.unlock();
			SPDLOG_CRITICAL("ChunkStreamCache {{ Chunk: {} }}: Raw cache loaded twice", chunk_id.to_string());
			throw std::logic_error("raw cache loaded twice");
		}

		raw = std::move(raw_cache);
		if(finished) {
			indices.fill();
			ready = take_ready_waiters();
		}
	}

	SPDLOG_DEBUG("ChunkStreamCache {{ Chunk: {} }}: Loaded, finished: {}", chunk_id.to_string(), finished);
	wake(ready);

	return absl::OkStatus();
}

bool ChunkStreamCache::loaded() const {
	std::shared_lock<std::shared_mutex> guard(lock);
	return raw != nullptr;
}

//---------------- Load end ----------------//

//---------------- Write begin ----------------//

absl::StatusOr<PushIndexResult> ChunkStreamCache::push_piece_data(PieceData const& piece) {
	if(piece.chunk != chunk_id) {
		return PushIndexResult();
	}

	auto ranges = piece_range(piece.desc);
	if(!ranges.has_value()) {
		return PushIndexResult();
	}
	auto index_range = ranges->first;
	auto byte_range = ranges->second;

	RawCache* storage;
	{
		std::unique_lock<std::shared_mutex> guard(lock);
		if(!raw) {
			return make_error(ErrorCode::ErrorState, "raw cache not loaded");
		}
		auto res = indices.try_push(index_range);
		if(!res.pushed()) {
			SPDLOG_TRACE(
				"ChunkStreamCache {{ Chunk: {} }}: Skip piece {}, exists: {}",
				chunk_id.to_string(),
				piece.desc.to_string(),
				res.exists
			);
			return res;
		}
		storage = raw.get();
	}

	// Reserved, this caller owns the write
	auto status = [&]() -> absl::Status {
		if(piece.data.size() != byte_range.len()) {
			return make_error(ErrorCode::InvalidInput, "piece length mismatch");
		}

		auto writer = storage->sync_writer();
		if(!writer.ok()) {
			return writer.status();
		}

		auto pos = (*writer)->seek(byte_range.start);
		if(!pos.ok()) {
			return pos.status();
		}
		if(*pos != byte_range.start) {
			return make_error(ErrorCode::InvalidInput, "seek mismatch");
		}

		auto written = (*writer)->write(piece.data.data(), piece.data.size());
		if(!written.ok()) {
			return written.status();
		}
		if(*written != byte_range.len()) {
			return make_error(ErrorCode::InvalidInput, "write length mismatch");
		}

		return absl::OkStatus();
	}();

	if(!status.ok()) {
		{
			std::unique_lock<std::shared_mutex> guard(lock);
			indices.unreserve(index_range);
		}
		SPDLOG_ERROR(
			"ChunkStreamCache {{ Chunk: {} }}: Write piece {} error: {}",
			chunk_id.to_string(),
			piece.desc.to_string(),
			status.ToString()
		);
		return status;
	}

	PushIndexResult res;
	std::vector<std::shared_ptr<ExistsWaiter>> ready;
	{
		std::unique_lock<std::shared_mutex> guard(lock);
		res = indices.push(index_range);
		ready = take_ready_waiters();
	}

	SPDLOG_TRACE(
		"ChunkStreamCache {{ Chunk: {} }}: Committed piece {}, finished: {}",
		chunk_id.to_string(),
		piece.desc.to_string(),
		res.finished
	);
	wake(ready);

	return res;
}

//---------------- Write end ----------------//

//---------------- Exists begin ----------------//

bool ChunkStreamCache::exists(uint32_t index) const {
	std::shared_lock<std::shared_mutex> guard(lock);
	return indices.exists(index);
}

std::vector<std::shared_ptr<ChunkStreamCache::ExistsWaiter>> ChunkStreamCache::take_ready_waiters() {
	std::vector<std::shared_ptr<ExistsWaiter>> ready;
	for(auto iter = waiters.begin(); iter != waiters.end();) {
		if(indices.exists(iter->first)) {
			ready.push_back(std::move(iter->second));
			iter = waiters.erase(iter);
		} else {
			iter++;
		}
	}
	return ready;
}

void ChunkStreamCache::wake(std::vector<std::shared_ptr<ExistsWaiter>>& ready) {
	for(auto& waiter : ready) {
		if(waiter->timer) {
			waiter->timer->stop();
		}
		auto cb = std::move(waiter->cb);
		cb(true);
	}
}

void ChunkStreamCache::async_exists(uint32_t index, std::optional<uint64_t> timeout, ExistsCallback cb) {
	if(index >= piece_count()) {
		cb(make_error(ErrorCode::NotFound, "index out of chunk"));
		return;
	}

	auto waiter = std::make_shared<ExistsWaiter>();
	{
		std::unique_lock<std::shared_mutex> guard(lock);
		if(!indices.exists(index)) {
			waiter->cb = std::move(cb);
			waiters.emplace(index, waiter);
		}
	}

	if(!waiter->cb) {
		cb(true);
		return;
	}

	if(timeout.has_value()) {
		waiter->timer.reset(new asyncio::Timer());
		std::weak_ptr<ChunkStreamCache> weak_self = shared_from_this();
		std::weak_ptr<ExistsWaiter> weak_waiter = waiter;
		waiter->timer->start(*timeout, 0, [weak_self, weak_waiter, index]() {
			auto self = weak_self.lock();
			auto waiter = weak_waiter.lock();
			if(!self || !waiter) {
				return;
			}

			bool found = false;
			{
				std::unique_lock<std::shared_mutex> guard(self->lock);
				auto range = self->waiters.equal_range(index);
				for(auto iter = range.first; iter != range.second; iter++) {
					if(iter->second == waiter) {
						self->waiters.erase(iter);
						found = true;
						break;
					}
				}
			}
			if(!found) {
				return;
			}

			SPDLOG_DEBUG(
				"ChunkStreamCache {{ Chunk: {} }}: Wait for piece {} timed out",
				self->chunk_id.to_string(),
				index
			);
			auto cb = std::move(waiter->cb);
			cb(make_error(ErrorCode::NotFound, "piece not found before timeout"));
		});
	}
}

//---------------- Exists end ----------------//

//---------------- Read begin ----------------//

absl::StatusOr<size_t> ChunkStreamCache::sync_try_read(PieceDesc const& desc, uint8_t* out, size_t len) {
	auto ranges = piece_range(desc);
	if(!ranges.has_value()) {
		return make_error(ErrorCode::NotFound, "piece out of chunk");
	}
	auto index_range = ranges->first;
	auto byte_range = ranges->second;

	RawCache* storage;
	{
		std::shared_lock<std::shared_mutex> guard(lock);
		if(!raw) {
			return make_error(ErrorCode::ErrorState, "raw cache not loaded");
		}
		for(auto i = index_range.start; i < index_range.end; i++) {
			if(!indices.exists(i)) {
				return make_error(ErrorCode::NotFound, "piece not committed");
			}
		}
		storage = raw.get();
	}

	if(len < byte_range.len()) {
		return make_error(ErrorCode::InvalidInput, "buffer shorter than piece");
	}

	auto reader = storage->sync_reader();
	if(!reader.ok()) {
		return reader.status();
	}

	auto pos = (*reader)->seek(byte_range.start);
	if(!pos.ok()) {
		return pos.status();
	}
	if(*pos != byte_range.start) {
		return make_error(ErrorCode::InvalidInput, "seek mismatch");
	}

	auto read = (*reader)->read(out, byte_range.len());
	if(!read.ok()) {
		return read.status();
	}
	if(*read != byte_range.len()) {
		return make_error(ErrorCode::InvalidInput, "read length mismatch");
	}

	return *read;
}

void ChunkStreamCache::async_read_from(RawCache* storage, ByteRange range, ReadCallback cb) {
	// Keep the cache, and with it the raw cache, alive until completion
	auto self = shared_from_this();

	storage->async_reader([self, range, cb](absl::StatusOr<std::unique_ptr<AsyncReader>> reader_res) {
		if(!reader_res.ok()) {
			cb(reader_res.status());
			return;
		}
		std::shared_ptr<AsyncReader> reader(std::move(*reader_res));

		reader->seek(range.start, [self, reader, range, cb](absl::StatusOr<uint64_t> pos) {
			if(!pos.ok()) {
				cb(pos.status());
				return;
			}
			if(*pos != range.start) {
				cb(make_error(ErrorCode::InvalidInput, "seek mismatch"));
				return;
			}

			auto buf = std::make_shared<core::Buffer>(range.len());
			reader->read(buf->data(), buf->size(), [self, reader, buf, cb](absl::StatusOr<size_t> read) {
				if(!read.ok()) {
					cb(read.status());
					return;
				}
				if(*read != buf->size()) {
					cb(make_error(ErrorCode::InvalidInput, "read length mismatch"));
					return;
				}
				cb(std::move(*buf));
			});
		});
	});
}

void ChunkStreamCache::async_try_read(PieceDesc const& desc, ReadCallback cb) {
	auto ranges = piece_range(desc);
	if(!ranges.has_value()) {
		cb(make_error(ErrorCode::NotFound, "piece out of chunk"));
		return;
	}
	auto index_range = ranges->first;
	auto byte_range = ranges->second;

	RawCache* storage;
	{
		std::shared_lock<std::shared_mutex> guard(lock);
		if(!raw) {
			guard.unlock();
			cb(make_error(ErrorCode::ErrorState, "raw cache not loaded"));
			return;
		}
		for(auto i = index_range.start; i < index_range.end; i++) {
			if(!indices.exists(i)) {
				guard.unlock();
				cb(make_error(ErrorCode::NotFound, "piece not committed"));
				return;
			}
		}
		storage = raw.get();
	}

	async_read_from(storage, byte_range, std::move(cb));
}

void ChunkStreamCache::async_read(PieceDesc const& desc, std::optional<uint64_t> timeout, ReadCallback cb) {
	auto ranges = piece_range(desc);
	if(!ranges.has_value()) {
		cb(make_error(ErrorCode::NotFound, "piece out of chunk"));
		return;
	}
	auto index_range = ranges->first;

	// Wait for every index in turn, then read
	auto self = shared_from_this();
	auto wait_next = std::make_shared<std::function<void(uint32_t)>>();
	*wait_next = [self, desc, timeout, cb, index_range, weak_next = std::weak_ptr<std::function<void(uint32_t)>>(wait_next)](uint32_t index) {
		if(index == index_range.end) {
			self->async_try_read(desc, cb);
			return;
		}

		auto next = weak_next.lock();
		self->async_exists(index, timeout, [next, index, cb](absl::StatusOr<bool> res) {
			if(!res.ok()) {
				cb(res.status());
				return;
			}
			(*next)(index + 1);
		});
	};
	(*wait_next)(index_range.start);
}

//---------------- Read end ----------------//

bool ChunkStreamCache::finished() const {
	std::shared_lock<std::shared_mutex> guard(lock);
	return indices.finished();
}

uint32_t ChunkStreamCache::committed_count() const {
	std::shared_lock<std::shared_mutex> guard(lock);
	return indices.committed_count();
}

uint32_t ChunkStreamCache::piece_count() const {
	return indices.piece_count();
}

std::optional<RequireIndex> ChunkStreamCache::require_index(PieceDesc const& desc) const {
	auto [start, end, step] = desc.unwrap_as_stream();
	std::shared_lock<std::shared_mutex> guard(lock);
	return indices.require(start, end, step);
}

} // namespace ndn
} // namespace chunkflow
