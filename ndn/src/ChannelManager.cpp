#include "chunkflow/ndn/channel/ChannelManager.hpp"

#include <chunkflow/core/Error.hpp>
#include <chunkflow/ndn/protocol/Messages.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace chunkflow {
namespace ndn {

using core::ErrorCode;

ChannelManager::ChannelManager(PeerResolver& resolver, DatagramTunnel& tunnel, NdnConfig const& config) :
resolver(resolver),
tunnel(tunnel),
cfg(config),
download_history(0, config.channel.history_speed),
upload_history(0, config.channel.history_speed) {}

ChannelManager::~ChannelManager() {
	stop();
}

void ChannelManager::set_upload_source(UploadSource* source) {
	std::lock_guard<std::mutex> guard(lock);
	upload_source = source;
}

//---------------- Registry begin ----------------//

std::shared_ptr<Channel> ChannelManager::channel_of(DeviceId const& remote) const {
	std::lock_guard<std::mutex> guard(lock);
	auto iter = channels.find(remote);
	if(iter == channels.end()) {
		return nullptr;
	}
	return iter->second;
}

std::shared_ptr<Channel> ChannelManager::create_channel(PeerDesc const& remote) {
	std::lock_guard<std::mutex> guard(lock);
	auto iter = channels.find(remote.id);
	if(iter != channels.end()) {
		return iter->second;
	}

	auto share = static_cast<uint32_t>(channels.size() + 1);
	auto channel = std::make_shared<Channel>(
		remote,
		tunnel,
		upload_source,
		cfg.channel,
		core::HistorySpeed(download_history.average() / share, cfg.channel.history_speed),
		core::HistorySpeed(upload_history.average() / share, cfg.channel.history_speed)
	);
	channels.emplace(remote.id, channel);

	SPDLOG_INFO(
		"ChannelManager: New channel {{ Remote: {}, Endpoint: {} }}",
		remote.id.to_string(),
		remote.endpoint.to_string()
	);

	return channel;
}

std::vector<std::shared_ptr<Channel>> ChannelManager::all_channels() const {
	std::lock_guard<std::mutex> guard(lock);
	std::vector<std::shared_ptr<Channel>> res;
	res.reserve(channels.size());
	for(auto const& [id, channel] : channels) {
		res.push_back(channel);
	}
	return res;
}

size_t ChannelManager::channel_count() const {
	std::lock_guard<std::mutex> guard(lock);
	return channels.size();
}

//---------------- Registry end ----------------//

//---------------- Inbound begin ----------------//

std::shared_ptr<Channel> ChannelManager::accept_channel(Datagram const& datagram) {
	// Anything but an Interest belongs to a session of an existing channel
	auto code = command_of(datagram.payload);
	if(!code.has_value() || *code != CommandCode::Interest) {
		SPDLOG_DEBUG(
			"ChannelManager {{ Remote: {} }}: Drop datagram of unknown sender",
			datagram.source.to_string()
		);
		return nullptr;
	}

	auto interest = Interest::decode(datagram.payload);
	if(!interest.ok()) {
		SPDLOG_WARN(
			"ChannelManager {{ Remote: {} }}: Drop datagram of unknown sender: {}",
			datagram.source.to_string(),
			interest.status().ToString()
		);
		return nullptr;
	}

	auto peer = resolver.peer_of(datagram.source);
	return create_channel(peer.has_value() ? *peer : PeerDesc{datagram.source, datagram.endpoint});
}

void ChannelManager::on_datagram(Datagram&& datagram) {
	auto channel = channel_of(datagram.source);
	if(!channel) {
		channel = accept_channel(datagram);
		if(!channel) {
			return;
		}
	}

	auto source = datagram.source;
	auto status = channel->on_datagram(std::move(datagram));
	if(status.ok()) {
		return;
	}

	if(core::error_code(status) == ErrorCode::NotFound) {
		// Late pieces of closed sessions are common
		SPDLOG_DEBUG(
			"ChannelManager {{ Remote: {} }}: Drop datagram: {}",
			source.to_string(),
			status.ToString()
		);
	} else {
		SPDLOG_WARN(
			"ChannelManager {{ Remote: {} }}: Drop datagram: {}",
			source.to_string(),
			status.ToString()
		);
	}
}

void ChannelManager::arm_recv(std::weak_ptr<bool> token) {
	tunnel.recv_batch([this, token](absl::StatusOr<std::vector<Datagram>> batch) {
		if(token.expired()) {
			return;
		}

		if(!batch.ok()) {
			SPDLOG_WARN("ChannelManager: Recv error: {}", batch.status().ToString());
		} else {
			for(auto& datagram : *batch) {
				on_datagram(std::move(datagram));
			}
		}

		if(!token.expired()) {
			arm_recv(token);
		}
	});
}

void ChannelManager::start() {
	if(recv_token) {
		return;
	}
	recv_token = std::make_shared<bool>(true);
	arm_recv(recv_token);
}

void ChannelManager::stop() {
	recv_token.reset();
}

//---------------- Inbound end ----------------//

//---------------- Schedule begin ----------------//

void ChannelManager::on_schedule(uint64_t when) {
	std::lock_guard<std::mutex> guard(lock);

	uint64_t total_download = 0;
	uint64_t total_upload = 0;
	bool any_download = false;
	bool any_upload = false;
	for(auto const& [id, channel] : channels) {
		auto [download, upload] = channel->calc_speed(when);
		total_download += download;
		total_upload += upload;
		any_download = any_download || channel->had_download();
		any_upload = any_upload || channel->had_upload();
	}

	cur_download = static_cast<uint32_t>(std::min<uint64_t>(total_download, UINT32_MAX));
	cur_upload = static_cast<uint32_t>(std::min<uint64_t>(total_upload, UINT32_MAX));

	download_history.update(any_download ? std::optional<uint32_t>(cur_download) : std::nullopt, when);
	upload_history.update(any_upload ? std::optional<uint32_t>(cur_upload) : std::nullopt, when);

	SPDLOG_DEBUG(
		"ChannelManager: Schedule at {}: download {}/{} B/s, upload {}/{} B/s",
		when,
		cur_download,
		download_history.average(),
		cur_upload,
		upload_history.average()
	);
}

void ChannelManager::on_time_escape(uint64_t now) {
	for(auto& channel : all_channels()) {
		channel->on_time_escape(now);
	}
	retire_idle(now);
}

void ChannelManager::retire_idle(uint64_t now) {
	std::lock_guard<std::mutex> guard(lock);
	for(auto iter = channels.begin(); iter != channels.end();) {
		if(!iter->second->idle_at(now)) {
			iter++;
			continue;
		}

		SPDLOG_DEBUG("ChannelManager: Retire idle channel {{ Remote: {} }}", iter->first.to_string());
		iter = channels.erase(iter);
	}
}

//---------------- Schedule end ----------------//

uint32_t ChannelManager::cur_download_speed() const {
	std::lock_guard<std::mutex> guard(lock);
	return cur_download;
}

uint32_t ChannelManager::cur_upload_speed() const {
	std::lock_guard<std::mutex> guard(lock);
	return cur_upload;
}

uint32_t ChannelManager::history_download_speed() const {
	std::lock_guard<std::mutex> guard(lock);
	return download_history.average();
}

uint32_t ChannelManager::history_upload_speed() const {
	std::lock_guard<std::mutex> guard(lock);
	return upload_history.average();
}

} // namespace ndn
} // namespace chunkflow
