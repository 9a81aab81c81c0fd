#include "chunkflow/ndn/NdnStack.hpp"

#include <chunkflow/asyncio/core/EventLoop.hpp>

#include <spdlog/spdlog.h>

namespace chunkflow {
namespace ndn {

NdnStack::NdnStack(DeviceId const& local, NdnConfig const& config) :
local(local),
cfg(config),
udp_tunnel(local, peer_table),
channels(peer_table, udp_tunnel, config),
chunks(channels, config),
timer(this) {}

NdnStack::~NdnStack() {
	stop();
}

int NdnStack::start(core::SocketAddress const& addr) {
	int res = udp_tunnel.bind(addr);
	if(res < 0) {
		return res;
	}

	channels.start();
	timer.template start<NdnStack, &NdnStack::on_tick>(cfg.timer_interval, cfg.timer_interval);

	SPDLOG_INFO("NdnStack {{ Id: {} }}: Started on {}", local.to_string(), addr.to_string());
	return 0;
}

void NdnStack::stop() {
	timer.stop();
	channels.stop();
	udp_tunnel.close();
}

void NdnStack::on_tick() {
	auto now = asyncio::EventLoop::now();
	channels.on_time_escape(now);

	if(!last_schedule.has_value() || now - *last_schedule >= cfg.schedule_interval) {
		last_schedule = now;
		channels.on_schedule(now);
		chunks.on_schedule(now);
	}
}

absl::StatusOr<std::shared_ptr<ChunkTask>> NdnStack::download_chunk(
	ChunkId const& chunk,
	std::shared_ptr<DownloadContext> context
) {
	auto task = ChunkTask::create(chunks, chunk, std::move(context));
	if(task.ok()) {
		// Schedule right away rather than on the next interval
		auto cache = chunks.cache_of(chunk);
		if(cache) {
			cache->downloader()->on_schedule(asyncio::EventLoop::now());
		}
	}
	return task;
}

} // namespace ndn
} // namespace chunkflow
