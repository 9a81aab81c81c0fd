/*! \file Tunnel.hpp
	\brief Command datagram transport and peer resolution contracts
*/

#ifndef CHUNKFLOW_NDN_TUNNEL_HPP
#define CHUNKFLOW_NDN_TUNNEL_HPP

#include <chunkflow/core/Buffer.hpp>
#include <chunkflow/ndn/types/DeviceId.hpp>

#include <absl/status/statusor.h>

#include <functional>
#include <optional>
#include <vector>

namespace chunkflow {
namespace ndn {

struct Datagram {
	DeviceId source;
	core::Buffer payload;
	/// Where the datagram came from, unspecified for tunnels without addresses
	core::SocketAddress endpoint = core::SocketAddress();
};

//! Unreliable datagrams between peers
class DatagramTunnel {
public:
	using RecvCallback = std::function<void(absl::StatusOr<std::vector<Datagram>>)>;

	virtual ~DatagramTunnel() = default;

	//! Queue payload for remote, NotFound if remote cannot be reached
	/*!
		The endpoint of remote is a fallback, tunnels prefer the endpoint they
		know for its id.
	*/
	virtual absl::Status send(PeerDesc const& remote, core::Buffer&& payload) = 0;
	/// cb receives the next batch, or a transient error. One shot, re-arm to keep receiving.
	virtual void recv_batch(RecvCallback cb) = 0;
};

/// Resolve the descriptor of a known peer
class PeerResolver {
public:
	virtual ~PeerResolver() = default;

	virtual std::optional<PeerDesc> peer_of(DeviceId const& device) const = 0;
};

} // namespace ndn
} // namespace chunkflow

#endif // CHUNKFLOW_NDN_TUNNEL_HPP
