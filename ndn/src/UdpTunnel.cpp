#include "chunkflow/ndn/channel/UdpTunnel.hpp"

#include <chunkflow/core/Error.hpp>

#include <spdlog/spdlog.h>

namespace chunkflow {
namespace ndn {

using core::ErrorCode;
using core::make_error;

namespace {

struct SendReq {
	uv_udp_send_t req;
	core::Buffer buf;

	SendReq(core::Buffer&& buf) : req(), buf(std::move(buf)) {}
};

void close_cb(uv_handle_t* handle) {
	delete (uv_udp_t*)handle;
}

} // namespace

UdpTunnel::UdpTunnel(DeviceId const& local, PeerTable& peer_table) :
local(local), peer_table(peer_table) {}

UdpTunnel::~UdpTunnel() {
	close();
}

int UdpTunnel::bind(core::SocketAddress const& addr) {
	if(socket != nullptr) {
		return UV_EALREADY;
	}

	socket = new uv_udp_t();
	socket->data = this;

	int res = uv_udp_init(uv_default_loop(), socket);
	if(res < 0) {
		SPDLOG_ERROR("UdpTunnel {{ Addr: {} }}: Init error: {}", addr.to_string(), uv_strerror(res));
		delete socket;
		socket = nullptr;
		return res;
	}

	res = uv_udp_bind(socket, addr.as_sockaddr(), 0);
	if(res < 0) {
		SPDLOG_ERROR("UdpTunnel {{ Addr: {} }}: Bind error: {}", addr.to_string(), uv_strerror(res));
		close();
		return res;
	}

	res = uv_udp_recv_start(socket, naive_alloc_cb, udp_recv_cb);
	if(res < 0) {
		SPDLOG_ERROR("UdpTunnel {{ Addr: {} }}: Start recv error: {}", addr.to_string(), uv_strerror(res));
		close();
		return res;
	}

	SPDLOG_INFO("UdpTunnel {{ Addr: {}, Id: {} }}: Listening", addr.to_string(), local.to_string());
	return 0;
}

void UdpTunnel::close() {
	if(socket == nullptr) {
		return;
	}

	uv_udp_recv_stop(socket);
	socket->data = nullptr;
	uv_close((uv_handle_t*)socket, close_cb);
	socket = nullptr;
}

void UdpTunnel::naive_alloc_cb(uv_handle_t*, size_t suggested_size, uv_buf_t* buf) {
	buf->base = new char[suggested_size];
	buf->len = suggested_size;
}

void UdpTunnel::udp_recv_cb(uv_udp_t* handle, ssize_t nread, uv_buf_t const* buf, sockaddr const* addr, unsigned) {
	auto* tunnel = (UdpTunnel*)handle->data;

	if(nread < 0) {
		delete[] buf->base;
		if(tunnel == nullptr) {
			return;
		}
		SPDLOG_ERROR("UdpTunnel {{ Id: {} }}: Recv callback error: {}", tunnel->local.to_string(), uv_strerror(nread));
		if(tunnel->recv_cb) {
			auto cb = std::move(tunnel->recv_cb);
			tunnel->recv_cb = nullptr;
			cb(make_error(ErrorCode::Unknown, uv_strerror(nread)));
		}
		return;
	}

	// nread == 0 with a null addr means nothing more to read
	if(nread == 0 || tunnel == nullptr || addr == nullptr) {
		delete[] buf->base;
		return;
	}

	core::Buffer bytes((uint8_t*)buf->base, nread);
	auto source = DeviceId::deserialize(bytes, 0);
	if(!source.has_value() || !bytes.cover(DeviceId::SIZE)) {
		SPDLOG_WARN("UdpTunnel {{ Id: {} }}: Drop datagram without sender id", tunnel->local.to_string());
		return;
	}

	core::SocketAddress endpoint(*addr);
	auto known = tunnel->peer_table.peer_of(*source);
	if(known.has_value() && known->endpoint != endpoint) {
		SPDLOG_INFO(
			"UdpTunnel {{ Id: {} }}: Peer {} moved to {}",
			tunnel->local.to_string(),
			source->to_string(),
			endpoint.to_string()
		);
		tunnel->peer_table.add(PeerDesc{*source, endpoint});
	}

	tunnel->received.push_back(Datagram{*source, std::move(bytes), endpoint});
	tunnel->deliver();
}

void UdpTunnel::deliver() {
	if(!recv_cb || received.empty()) {
		return;
	}

	std::vector<Datagram> batch;
	batch.reserve(received.size());
	while(!received.empty()) {
		batch.push_back(std::move(received.front()));
		received.pop_front();
	}

	auto cb = std::move(recv_cb);
	recv_cb = nullptr;
	cb(std::move(batch));
}

void UdpTunnel::recv_batch(RecvCallback cb) {
	recv_cb = std::move(cb);
	deliver();
}

void UdpTunnel::send_cb(uv_udp_send_t* _req, int status) {
	auto* req = (SendReq*)_req;
	if(status < 0) {
		SPDLOG_ERROR("UdpTunnel: Send callback error: {}", uv_strerror(status));
	}
	delete req;
}

absl::Status UdpTunnel::send(PeerDesc const& remote, core::Buffer&& payload) {
	if(socket == nullptr) {
		return make_error(ErrorCode::ErrorState, "tunnel not bound");
	}

	auto peer = peer_table.peer_of(remote.id);
	if(!peer.has_value()) {
		if(remote.endpoint == core::SocketAddress()) {
			return make_error(ErrorCode::NotFound, "unknown peer");
		}
		peer = remote;
	}

	core::Buffer datagram(DeviceId::SIZE + payload.size());
	local.serialize(datagram, 0);
	datagram.write_unsafe(DeviceId::SIZE, payload.data(), payload.size());

	auto* req = new SendReq(std::move(datagram));
	auto uv_buf = uv_buf_init((char*)req->buf.data(), req->buf.size());
	int res = uv_udp_send(&req->req, socket, &uv_buf, 1, peer->endpoint.as_sockaddr(), send_cb);
	if(res < 0) {
		SPDLOG_ERROR(
			"UdpTunnel {{ Id: {} }}: Send error: {}, To: {}",
			local.to_string(),
			uv_strerror(res),
			peer->endpoint.to_string()
		);
		delete req;
		return make_error(ErrorCode::Unknown, uv_strerror(res));
	}

	return absl::OkStatus();
}

} // namespace ndn
} // namespace chunkflow
