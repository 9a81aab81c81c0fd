/*! \file UdpTunnel.hpp
*/

#ifndef CHUNKFLOW_NDN_UDPTUNNEL_HPP
#define CHUNKFLOW_NDN_UDPTUNNEL_HPP

#include <chunkflow/core/SocketAddress.hpp>
#include <chunkflow/ndn/channel/PeerTable.hpp>
#include <chunkflow/ndn/channel/Tunnel.hpp>

#include <uv.h>

#include <deque>

namespace chunkflow {
namespace ndn {

//! DatagramTunnel over a libuv UDP socket
/*!
	Every datagram is prefixed with the 32 byte id of its sender. A known peer
	that shows up from a new endpoint is updated in the peer table, unknown
	senders are left to the channel layer. Loop thread only.
*/
class UdpTunnel : public DatagramTunnel {
private:
	DeviceId local;
	PeerTable& peer_table;
	uv_udp_t* socket = nullptr;

	std::deque<Datagram> received;
	RecvCallback recv_cb;

	static void naive_alloc_cb(uv_handle_t*, size_t suggested_size, uv_buf_t* buf);
	static void udp_recv_cb(uv_udp_t* handle, ssize_t nread, uv_buf_t const* buf, sockaddr const* addr, unsigned);
	static void send_cb(uv_udp_send_t* req, int status);

	void deliver();

public:
	UdpTunnel(DeviceId const& local, PeerTable& peer_table);
	~UdpTunnel();

	UdpTunnel(UdpTunnel const&) = delete;
	UdpTunnel& operator=(UdpTunnel const&) = delete;

	DeviceId const& local_id() const {
		return local;
	}

	/// Bind and start receiving, libuv error code on failure
	[[nodiscard]] int bind(core::SocketAddress const& addr);
	void close();

	absl::Status send(PeerDesc const& remote, core::Buffer&& payload) override;
	void recv_batch(RecvCallback cb) override;
};

} // namespace ndn
} // namespace chunkflow

#endif // CHUNKFLOW_NDN_UDPTUNNEL_HPP
