/*! \file ChunkStreamCache.hpp
	\brief Per chunk coordinator of a raw cache and its income index queue
*/

#ifndef CHUNKFLOW_NDN_CHUNKSTREAMCACHE_HPP
#define CHUNKFLOW_NDN_CHUNKSTREAMCACHE_HPP

#include <chunkflow/asyncio/core/Timer.hpp>
#include <chunkflow/core/Buffer.hpp>
#include <chunkflow/ndn/chunk/RawCache.hpp>
#include <chunkflow/ndn/protocol/IndexQueue.hpp>
#include <chunkflow/ndn/protocol/Messages.hpp>
#include <chunkflow/ndn/protocol/PieceDesc.hpp>
#include <chunkflow/ndn/types/ChunkId.hpp>

#include <absl/status/statusor.h>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace chunkflow {
namespace ndn {

//! Shared cache of one chunk
/*!
	Binds a RawCache, installed once by load, to an IncomeIndexQueue. Pieces are
	reserved before their bytes are written and committed after, so concurrent
	receipt of the same piece performs a single write.

	Waiting operations (async_exists, async_read) belong on the event loop thread,
	the remaining operations may be called from any thread.
*/
class ChunkStreamCache : public std::enable_shared_from_this<ChunkStreamCache> {
public:
	using ExistsCallback = std::function<void(absl::StatusOr<bool>)>;
	using ReadCallback = std::function<void(absl::StatusOr<core::Buffer>)>;

private:
	struct ExistsWaiter {
		ExistsCallback cb;
		std::unique_ptr<asyncio::Timer> timer;
	};

	ChunkId chunk_id;
	uint16_t piece_sz;

	mutable std::shared_mutex lock;
	IncomeIndexQueue indices;
	std::unique_ptr<RawCache> raw;
	std::multimap<uint32_t, std::shared_ptr<ExistsWaiter>> waiters;

	ChunkStreamCache(ChunkId const& chunk, uint16_t piece_size);

	/// Installed raw cache, or ErrorState before load
	absl::StatusOr<RawCache*> raw_cache() const;
	/// Byte range of desc and its index range, nullopt if not a piece of this cache
	std::optional<std::pair<IndexRange, ByteRange>> piece_range(PieceDesc const& desc) const;
	/// Remove waiters of committed indices, caller holds the lock
	std::vector<std::shared_ptr<ExistsWaiter>> take_ready_waiters();
	static void wake(std::vector<std::shared_ptr<ExistsWaiter>>& ready);
	void async_read_from(RawCache* raw, ByteRange range, ReadCallback cb);

public:
	static std::shared_ptr<ChunkStreamCache> create(ChunkId const& chunk, uint16_t piece_size);

	ChunkStreamCache(ChunkStreamCache const&) = delete;
	ChunkStreamCache& operator=(ChunkStreamCache const&) = delete;

	ChunkId const& chunk() const {
		return chunk_id;
	}

	uint16_t piece_size() const {
		return piece_sz;
	}

	//! Install the raw cache
	/*!
		\param finished the raw cache already holds the whole chunk
		\throws std::logic_error if a raw cache is already installed
		\return InvalidInput if the raw cache cannot hold the chunk
	*/
	absl::Status load(bool finished, std::unique_ptr<RawCache> raw_cache);
	bool loaded() const;

	//! Write one piece
	/*!
		Out of window pieces are invalid, duplicates exist, neither touches storage.
		A failed write releases the reservation and is reported as an error.
	*/
	absl::StatusOr<PushIndexResult> push_piece_data(PieceData const& piece);

	bool exists(uint32_t index) const;
	/// cb(true) once index is committed, NotFound after timeout ms
	void async_exists(uint32_t index, std::optional<uint64_t> timeout, ExistsCallback cb);

	//! Read the bytes of committed pieces into out
	/*!
		\return bytes read, NotFound if a piece is missing, InvalidInput on short
		storage, UnSupport if the storage requires async access
	*/
	absl::StatusOr<size_t> sync_try_read(PieceDesc const& desc, uint8_t* out, size_t len);
	/// Async form of sync_try_read, the buffer holds the piece bytes
	void async_try_read(PieceDesc const& desc, ReadCallback cb);
	/// Wait for the pieces of desc, then read them
	void async_read(PieceDesc const& desc, std::optional<uint64_t> timeout, ReadCallback cb);

	bool finished() const;
	uint32_t committed_count() const;
	uint32_t piece_count() const;
	/// Missing pieces of the window of desc, nullopt if complete
	std::optional<RequireIndex> require_index(PieceDesc const& desc) const;
};

} // namespace ndn
} // namespace chunkflow

#endif // CHUNKFLOW_NDN_CHUNKSTREAMCACHE_HPP
