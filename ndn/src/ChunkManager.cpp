#include "chunkflow/ndn/chunk/ChunkManager.hpp"

#include <chunkflow/core/Error.hpp>
#include <chunkflow/ndn/chunk/MemRawCache.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <vector>

namespace chunkflow {
namespace ndn {

using core::ErrorCode;
using core::make_error;

ChunkManager::ChunkManager(ChannelManager& channel_manager, NdnConfig const& config) :
channel_manager(channel_manager), cfg(config) {
	channel_manager.set_upload_source(this);
}

ChunkManager::~ChunkManager() {
	channel_manager.set_upload_source(nullptr);
}

void ChunkManager::set_raw_cache_factory(RawCacheFactory factory) {
	std::lock_guard<std::mutex> guard(lock);
	raw_cache_factory = std::move(factory);
}

absl::StatusOr<std::unique_ptr<RawCache>> ChunkManager::new_raw_cache(ChunkId const& chunk) {
	if(raw_cache_factory) {
		return raw_cache_factory(chunk);
	}
	return std::unique_ptr<RawCache>(new MemRawCache(chunk.len()));
}

absl::StatusOr<std::shared_ptr<ChunkCache>> ChunkManager::create_cache(ChunkId const& chunk) {
	std::lock_guard<std::mutex> guard(lock);
	auto iter = caches.find(chunk);
	if(iter != caches.end()) {
		return iter->second;
	}

	auto raw = new_raw_cache(chunk);
	if(!raw.ok()) {
		SPDLOG_ERROR("ChunkManager: Raw cache for {} error: {}", chunk.to_string(), raw.status().ToString());
		return raw.status();
	}

	auto stream = ChunkStreamCache::create(chunk, cfg.piece_size);
	auto status = stream->load(false, std::move(*raw));
	if(!status.ok()) {
		return status;
	}

	auto downloader = std::make_shared<ChunkDownloader>(stream, channel_manager, cfg.download_speed);
	auto cache = std::make_shared<ChunkCache>(std::move(stream), std::move(downloader));
	caches.emplace(chunk, cache);

	SPDLOG_DEBUG("ChunkManager: New cache {}", chunk.to_string());
	return cache;
}

absl::StatusOr<std::shared_ptr<ChunkCache>> ChunkManager::store_chunk(ChunkId const& chunk, uint8_t const* data, size_t size) {
	if(ChunkId::calculate(data, size) != chunk) {
		return make_error(ErrorCode::InvalidInput, "content does not match chunk id");
	}

	auto cache = create_cache(chunk);
	if(!cache.ok()) {
		return cache;
	}

	// Fill missing pieces through the regular write path
	auto& stream = (*cache)->stream();
	auto piece_size = stream->piece_size();
	for(uint32_t index = 0; index < stream->piece_count(); index++) {
		if(stream->exists(index)) {
			continue;
		}

		uint64_t start = uint64_t(index) * piece_size;
		auto len = std::min<uint64_t>(piece_size, size - start);
		PieceData piece{0, chunk, PieceDesc::range(index, piece_size), core::Buffer::copy_of(data + start, len)};
		auto res = stream->push_piece_data(piece);
		if(!res.ok()) {
			return res.status();
		}
	}

	SPDLOG_INFO("ChunkManager: Stored chunk {}", chunk.to_string());
	return cache;
}

std::shared_ptr<ChunkCache> ChunkManager::cache_of(ChunkId const& chunk) const {
	std::lock_guard<std::mutex> guard(lock);
	auto iter = caches.find(chunk);
	if(iter == caches.end()) {
		return nullptr;
	}
	return iter->second;
}

size_t ChunkManager::cache_count() const {
	std::lock_guard<std::mutex> guard(lock);
	return caches.size();
}

std::shared_ptr<ChunkStreamCache> ChunkManager::upload_cache_of(ChunkId const& chunk) {
	auto cache = cache_of(chunk);
	if(!cache) {
		return nullptr;
	}
	return cache->stream();
}

void ChunkManager::on_schedule(uint64_t when) {
	std::vector<std::shared_ptr<ChunkCache>> snapshot;
	{
		std::lock_guard<std::mutex> guard(lock);
		for(auto const& [chunk, cache] : caches) {
			snapshot.push_back(cache);
		}
	}

	for(auto& cache : snapshot) {
		cache->downloader()->on_schedule(when);
	}

	release_abandoned();
}

void ChunkManager::release_abandoned() {
	// Destroyed outside the lock
	std::vector<std::shared_ptr<ChunkCache>> released;

	std::lock_guard<std::mutex> guard(lock);
	for(auto iter = caches.begin(); iter != caches.end();) {
		auto const& cache = iter->second;
		if(cache->stream()->finished() || cache->downloader()->context_count() > 0) {
			iter++;
			continue;
		}

		SPDLOG_DEBUG("ChunkManager: Release abandoned cache {}", iter->first.to_string());
		released.push_back(std::move(iter->second));
		iter = caches.erase(iter);
	}
}

} // namespace ndn
} // namespace chunkflow
