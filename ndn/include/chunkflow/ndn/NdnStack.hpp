/*! \file NdnStack.hpp
	\brief Owning context of a node: peers, tunnel, channels and chunks
*/

#ifndef CHUNKFLOW_NDN_NDNSTACK_HPP
#define CHUNKFLOW_NDN_NDNSTACK_HPP

#include <chunkflow/asyncio/core/Timer.hpp>
#include <chunkflow/ndn/Config.hpp>
#include <chunkflow/ndn/channel/ChannelManager.hpp>
#include <chunkflow/ndn/channel/PeerTable.hpp>
#include <chunkflow/ndn/channel/UdpTunnel.hpp>
#include <chunkflow/ndn/chunk/ChunkManager.hpp>
#include <chunkflow/ndn/download/ChunkTask.hpp>

#include <optional>

namespace chunkflow {
namespace ndn {

//! Wires a UDP tunnel, the channel manager and the chunk manager to a timer
/*!
	Every timer_interval ms channels send and resend, every schedule_interval ms
	speeds are aggregated and downloads are scheduled.
*/
class NdnStack {
private:
	DeviceId local;
	NdnConfig cfg;

	PeerTable peer_table;
	UdpTunnel udp_tunnel;
	ChannelManager channels;
	ChunkManager chunks;

	asyncio::Timer timer;
	std::optional<uint64_t> last_schedule;

	void on_tick();

public:
	NdnStack(DeviceId const& local, NdnConfig const& config);
	~NdnStack();

	NdnStack(NdnStack const&) = delete;
	NdnStack& operator=(NdnStack const&) = delete;

	/// Bind the tunnel and start the timer, libuv error code on failure
	[[nodiscard]] int start(core::SocketAddress const& addr);
	void stop();

	DeviceId const& local_id() const {
		return local;
	}

	PeerTable& peers() {
		return peer_table;
	}

	ChannelManager& channel_manager() {
		return channels;
	}

	ChunkManager& chunk_manager() {
		return chunks;
	}

	/// Start downloading chunk from the sources of context
	absl::StatusOr<std::shared_ptr<ChunkTask>> download_chunk(
		ChunkId const& chunk,
		std::shared_ptr<DownloadContext> context
	);
};

} // namespace ndn
} // namespace chunkflow

#endif // CHUNKFLOW_NDN_NDNSTACK_HPP
