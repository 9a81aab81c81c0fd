#include "chunkflow/ndn/chunk/ChunkDownloader.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace chunkflow {
namespace ndn {

ChunkDownloader::ChunkDownloader(
	std::shared_ptr<ChunkStreamCache> cache,
	ChannelManager& channel_manager,
	core::HistorySpeedConfig const& speed_config
) : stream_cache(std::move(cache)),
	channel_manager(channel_manager),
	history(0, speed_config) {}

ChunkDownloader::~ChunkDownloader() {
	std::lock_guard<std::mutex> guard(lock);
	drop_session(true);
}

void ChunkDownloader::drop_session(bool cancel) {
	if(cancel && session && session->state() == DownloadSession::State::Downloading) {
		session_channel->cancel_download(session->session_id());
	}
	session.reset();
	session_channel.reset();
}

DownloadContextSet::ContextId ChunkDownloader::add_context(std::shared_ptr<DownloadContext> context) {
	return contexts.add_context(std::move(context));
}

bool ChunkDownloader::remove_context(DownloadContextSet::ContextId id) {
	return contexts.remove_context(id);
}

size_t ChunkDownloader::context_count() const {
	return contexts.size();
}

void ChunkDownloader::on_schedule(uint64_t when) {
	{
		std::lock_guard<std::mutex> guard(lock);
		auto chunk = stream_cache->chunk().to_string();

		if(stream_cache->finished()) {
			drop_session(false);
		} else if(contexts.empty()) {
			if(session) {
				SPDLOG_DEBUG("ChunkDownloader {{ Chunk: {} }}: No context left, stop session", chunk);
			}
			drop_session(true);
		} else {
			if(session && session->state() != DownloadSession::State::Downloading) {
				SPDLOG_INFO(
					"ChunkDownloader {{ Chunk: {} }}: Session from {} ended: {}",
					chunk,
					session->remote().to_string(),
					session->error().ToString()
				);
				drop_session(false);
				next_source++;
			}

			if(!session) {
				auto sources = contexts.sources(stream_cache->chunk());
				if(!sources.empty()) {
					auto const& source = sources[next_source % sources.size()];
					session_channel = channel_manager.create_channel(source);
					session = session_channel->download(
						stream_cache->chunk(),
						PieceDesc::full_stream(stream_cache->chunk().len(), stream_cache->piece_size()),
						stream_cache
					);
					SPDLOG_DEBUG(
						"ChunkDownloader {{ Chunk: {} }}: Download from {}",
						chunk,
						source.id.to_string()
					);
				} else {
					SPDLOG_WARN("ChunkDownloader {{ Chunk: {} }}: No source to download from", chunk);
				}
			}
		}
	}

	calc_speed(when);
}

uint64_t ChunkDownloader::downloaded() const {
	uint64_t bytes = uint64_t(stream_cache->committed_count()) * stream_cache->piece_size();
	return std::min<uint64_t>(bytes, stream_cache->chunk().len());
}

uint32_t ChunkDownloader::calc_speed(uint64_t when) {
	auto committed = stream_cache->committed_count();

	std::lock_guard<std::mutex> guard(lock);
	auto delta = uint64_t(committed - std::min(committed, last_committed)) * stream_cache->piece_size();
	if(last_calc.has_value() && when > *last_calc) {
		cur = static_cast<uint32_t>(delta * 1000 / (when - *last_calc));
	} else {
		cur = 0;
	}
	last_calc = when;
	last_committed = committed;

	history.update(session || delta > 0 ? std::optional<uint32_t>(cur) : std::nullopt, when);
	return cur;
}

uint32_t ChunkDownloader::cur_speed() const {
	std::lock_guard<std::mutex> guard(lock);
	return cur;
}

uint32_t ChunkDownloader::history_speed() const {
	std::lock_guard<std::mutex> guard(lock);
	return history.average();
}

int64_t ChunkDownloader::drain_score() const {
	std::lock_guard<std::mutex> guard(lock);
	return int64_t(cur) - int64_t(history.average());
}

uint32_t ChunkDownloader::on_drain(uint32_t expect) {
	std::lock_guard<std::mutex> guard(lock);
	limit = expect;
	return cur > expect ? cur - expect : 0;
}

std::optional<uint32_t> ChunkDownloader::speed_limit() const {
	std::lock_guard<std::mutex> guard(lock);
	return limit;
}

bool ChunkDownloader::has_session() const {
	std::lock_guard<std::mutex> guard(lock);
	return session != nullptr;
}

} // namespace ndn
} // namespace chunkflow
