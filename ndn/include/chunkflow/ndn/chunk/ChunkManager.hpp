/*! \file ChunkManager.hpp
	\brief One cache per chunk, for downloads and uploads
*/

#ifndef CHUNKFLOW_NDN_CHUNKMANAGER_HPP
#define CHUNKFLOW_NDN_CHUNKMANAGER_HPP

#include <chunkflow/ndn/Config.hpp>
#include <chunkflow/ndn/channel/Channel.hpp>
#include <chunkflow/ndn/channel/ChannelManager.hpp>
#include <chunkflow/ndn/chunk/ChunkDownloader.hpp>
#include <chunkflow/ndn/chunk/ChunkStreamCache.hpp>
#include <chunkflow/ndn/chunk/RawCache.hpp>

#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace chunkflow {
namespace ndn {

/// A chunk, its stream cache and the downloader filling it
class ChunkCache {
private:
	std::shared_ptr<ChunkStreamCache> stream_cache;
	std::shared_ptr<ChunkDownloader> chunk_downloader;

public:
	ChunkCache(std::shared_ptr<ChunkStreamCache> stream_cache, std::shared_ptr<ChunkDownloader> downloader) :
	stream_cache(std::move(stream_cache)), chunk_downloader(std::move(downloader)) {}

	ChunkId const& chunk() const {
		return stream_cache->chunk();
	}

	std::shared_ptr<ChunkStreamCache> const& stream() const {
		return stream_cache;
	}

	std::shared_ptr<ChunkDownloader> const& downloader() const {
		return chunk_downloader;
	}
};

//! Owner of every chunk cache of a stack
/*!
	Registers itself as the upload source of the channel manager, so interests for
	held chunks are served from the same caches downloads fill. An unfinished cache
	whose downloader has no context left is released on the next schedule, it
	lives on while referenced.
*/
class ChunkManager : public UploadSource {
public:
	/// Storage for a new cache, MemRawCache when unset
	using RawCacheFactory = std::function<absl::StatusOr<std::unique_ptr<RawCache>>(ChunkId const&)>;

private:
	ChannelManager& channel_manager;
	NdnConfig cfg;

	mutable std::mutex lock;
	std::map<ChunkId, std::shared_ptr<ChunkCache>> caches;
	RawCacheFactory raw_cache_factory;

	absl::StatusOr<std::unique_ptr<RawCache>> new_raw_cache(ChunkId const& chunk);
	void release_abandoned();

public:
	ChunkManager(ChannelManager& channel_manager, NdnConfig const& config);
	~ChunkManager();

	void set_raw_cache_factory(RawCacheFactory factory);

	/// Get or create the cache of chunk
	absl::StatusOr<std::shared_ptr<ChunkCache>> create_cache(ChunkId const& chunk);
	//! Hold the content of chunk
	/*!
		\return InvalidInput if data does not hash to chunk
	*/
	absl::StatusOr<std::shared_ptr<ChunkCache>> store_chunk(ChunkId const& chunk, uint8_t const* data, size_t size);
	std::shared_ptr<ChunkCache> cache_of(ChunkId const& chunk) const;
	size_t cache_count() const;

	std::shared_ptr<ChunkStreamCache> upload_cache_of(ChunkId const& chunk) override;

	/// Drive every downloader, then release abandoned caches
	void on_schedule(uint64_t when);
};

} // namespace ndn
} // namespace chunkflow

#endif // CHUNKFLOW_NDN_CHUNKMANAGER_HPP
