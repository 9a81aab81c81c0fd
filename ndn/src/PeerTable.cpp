#include "chunkflow/ndn/channel/PeerTable.hpp"

namespace chunkflow {
namespace ndn {

void PeerTable::add(PeerDesc const& peer) {
	std::lock_guard<std::mutex> guard(lock);
	peers[peer.id] = peer;
}

void PeerTable::remove(DeviceId const& device) {
	std::lock_guard<std::mutex> guard(lock);
	peers.erase(device);
}

std::optional<PeerDesc> PeerTable::peer_of(DeviceId const& device) const {
	std::lock_guard<std::mutex> guard(lock);
	auto iter = peers.find(device);
	if(iter == peers.end()) {
		return std::nullopt;
	}
	return iter->second;
}

std::vector<PeerDesc> PeerTable::all() const {
	std::lock_guard<std::mutex> guard(lock);
	std::vector<PeerDesc> res;
	res.reserve(peers.size());
	for(auto const& [id, peer] : peers) {
		res.push_back(peer);
	}
	return res;
}

size_t PeerTable::size() const {
	std::lock_guard<std::mutex> guard(lock);
	return peers.size();
}

std::optional<PeerDesc> PeerTable::parse_peer(std::string const& peer_string) {
	auto pos = peer_string.find('@');
	if(pos == std::string::npos || pos == 0) {
		return std::nullopt;
	}

	auto endpoint = core::SocketAddress::from_string(peer_string.substr(pos + 1));
	if(!endpoint.has_value()) {
		return std::nullopt;
	}

	return PeerDesc{DeviceId::from_name(peer_string.substr(0, pos)), *endpoint};
}

} // namespace ndn
} // namespace chunkflow
