/*! \file ChunkDownloader.hpp
*/

#ifndef CHUNKFLOW_NDN_CHUNKDOWNLOADER_HPP
#define CHUNKFLOW_NDN_CHUNKDOWNLOADER_HPP

#include <chunkflow/core/HistorySpeed.hpp>
#include <chunkflow/ndn/channel/ChannelManager.hpp>
#include <chunkflow/ndn/chunk/ChunkStreamCache.hpp>
#include <chunkflow/ndn/download/DownloadContext.hpp>

#include <memory>
#include <mutex>
#include <optional>

namespace chunkflow {
namespace ndn {

//! Drives the download of one chunk cache
/*!
	While the cache is unfinished and contexts are registered, keeps one download
	session over the whole chunk from a source of the contexts. A failed session
	moves on to the next source, round robin.
*/
class ChunkDownloader {
private:
	std::shared_ptr<ChunkStreamCache> stream_cache;
	ChannelManager& channel_manager;
	DownloadContextSet contexts;

	mutable std::mutex lock;
	std::shared_ptr<Channel> session_channel;
	std::shared_ptr<DownloadSession> session;
	size_t next_source = 0;

	core::HistorySpeed history;
	uint32_t cur = 0;
	std::optional<uint32_t> limit;
	uint32_t last_committed = 0;
	std::optional<uint64_t> last_calc;

	/// Forget the session, the remote is told to stop if cancel is set
	void drop_session(bool cancel);
	/// Sample bytes per second committed since the last call, on_schedule only
	uint32_t calc_speed(uint64_t when);

public:
	ChunkDownloader(
		std::shared_ptr<ChunkStreamCache> cache,
		ChannelManager& channel_manager,
		core::HistorySpeedConfig const& speed_config
	);
	~ChunkDownloader();

	std::shared_ptr<ChunkStreamCache> const& cache() const {
		return stream_cache;
	}

	DownloadContextSet::ContextId add_context(std::shared_ptr<DownloadContext> context);
	bool remove_context(DownloadContextSet::ContextId id);
	size_t context_count() const;

	/// Start, rotate or stop the session, then update speeds
	void on_schedule(uint64_t when);

	/// Speed sampled by the last on_schedule
	uint32_t cur_speed() const;
	uint32_t history_speed() const;
	/// How far current speed is above the history
	int64_t drain_score() const;
	//! Ask to slow down to expect bytes per second
	/*!
		The limit is advisory. Returns the speed freed, max(cur - expect, 0).
	*/
	uint32_t on_drain(uint32_t expect);
	std::optional<uint32_t> speed_limit() const;

	/// Bytes committed so far
	uint64_t downloaded() const;
	bool has_session() const;
};

} // namespace ndn
} // namespace chunkflow

#endif // CHUNKFLOW_NDN_CHUNKDOWNLOADER_HPP
