/*! \file PeerTable.hpp
*/

#ifndef CHUNKFLOW_NDN_PEERTABLE_HPP
#define CHUNKFLOW_NDN_PEERTABLE_HPP

#include <chunkflow/ndn/channel/Tunnel.hpp>

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace chunkflow {
namespace ndn {

/// Known peers and their endpoints
class PeerTable : public PeerResolver {
private:
	mutable std::mutex lock;
	std::map<DeviceId, PeerDesc> peers;

public:
	/// Insert or update the endpoint of a peer
	void add(PeerDesc const& peer);
	void remove(DeviceId const& device);

	std::optional<PeerDesc> peer_of(DeviceId const& device) const override;
	std::vector<PeerDesc> all() const;
	size_t size() const;

	//! Parse "name@ip:port"
	/*!
		The device id is derived from the name, see DeviceId::from_name
	*/
	static std::optional<PeerDesc> parse_peer(std::string const& peer_string);
};

} // namespace ndn
} // namespace chunkflow

#endif // CHUNKFLOW_NDN_PEERTABLE_HPP
