/*! \file ChannelManager.hpp
*/

#ifndef CHUNKFLOW_NDN_CHANNELMANAGER_HPP
#define CHUNKFLOW_NDN_CHANNELMANAGER_HPP

#include <chunkflow/core/HistorySpeed.hpp>
#include <chunkflow/ndn/Config.hpp>
#include <chunkflow/ndn/channel/Channel.hpp>
#include <chunkflow/ndn/channel/Tunnel.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace chunkflow {
namespace ndn {

//! Registry of channels keyed by remote device id
/*!
	Routes inbound datagrams of the command tunnel to their channel, and aggregates
	download and upload speed over all channels. An unknown sender gets a channel
	only with a well formed Interest. Channels without sessions for idle_timeout
	are retired. One lock guards the registry and the aggregates.
*/
class ChannelManager {
private:
	PeerResolver& resolver;
	DatagramTunnel& tunnel;
	NdnConfig cfg;
	UploadSource* upload_source = nullptr;

	mutable std::mutex lock;
	std::map<DeviceId, std::shared_ptr<Channel>> channels;
	core::HistorySpeed download_history;
	core::HistorySpeed upload_history;
	uint32_t cur_download = 0;
	uint32_t cur_upload = 0;

	/// Receive loop is armed while this is alive
	std::shared_ptr<bool> recv_token;

	void arm_recv(std::weak_ptr<bool> token);
	/// Channel of an unknown sender, nullptr if datagram cannot open one
	std::shared_ptr<Channel> accept_channel(Datagram const& datagram);
	void retire_idle(uint64_t now);

	ChannelManager(ChannelManager const&) = delete;
	ChannelManager& operator=(ChannelManager const&) = delete;

public:
	ChannelManager(PeerResolver& resolver, DatagramTunnel& tunnel, NdnConfig const& config);
	~ChannelManager();

	/// Channels created afterwards serve interests from source
	void set_upload_source(UploadSource* source);

	NdnConfig const& config() const {
		return cfg;
	}

	/// Lookup only
	std::shared_ptr<Channel> channel_of(DeviceId const& remote) const;
	//! Get or create the channel of a peer
	/*!
		A new channel starts from a fair share of the aggregated history,
		history / (channel count + 1).
	*/
	std::shared_ptr<Channel> create_channel(PeerDesc const& remote);
	std::vector<std::shared_ptr<Channel>> all_channels() const;
	size_t channel_count() const;

	/// Route one inbound datagram, failures are logged and dropped
	void on_datagram(Datagram&& datagram);

	/// Aggregate channel speeds, called every schedule interval
	void on_schedule(uint64_t when);
	/// Drive every channel and retire idle ones, called every timer tick
	void on_time_escape(uint64_t now);

	/// Start consuming the tunnel, batch after batch
	void start();
	void stop();

	uint32_t cur_download_speed() const;
	uint32_t cur_upload_speed() const;
	uint32_t history_download_speed() const;
	uint32_t history_upload_speed() const;
};

} // namespace ndn
} // namespace chunkflow

#endif // CHUNKFLOW_NDN_CHANNELMANAGER_HPP
