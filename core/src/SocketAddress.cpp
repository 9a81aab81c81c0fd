#include "chunkflow/core/SocketAddress.hpp"

#include <cstring>
#include <arpa/inet.h>

namespace chunkflow {
namespace core {

SocketAddress::SocketAddress() {
	std::memset(&addr, 0, sizeof(addr));
	addr.sin_family = AF_INET;
}

SocketAddress::SocketAddress(sockaddr_in const& addr) : SocketAddress() {
	this->addr.sin_addr = addr.sin_addr;
	this->addr.sin_port = addr.sin_port;
}

SocketAddress::SocketAddress(sockaddr const& addr) : SocketAddress() {
	if(addr.sa_family == AF_INET) {
		auto const& in = reinterpret_cast<sockaddr_in const&>(addr);
		this->addr.sin_addr = in.sin_addr;
		this->addr.sin_port = in.sin_port;
	}
}

std::optional<SocketAddress> SocketAddress::from_string(std::string const& addr_string) {
	auto pos = addr_string.rfind(':');
	if(pos == std::string::npos) {
		return std::nullopt;
	}

	SocketAddress res;
	if(inet_pton(AF_INET, addr_string.substr(0, pos).c_str(), &res.addr.sin_addr) != 1) {
		return std::nullopt;
	}

	auto port_string = addr_string.substr(pos + 1);
	if(port_string.empty() || port_string.size() > 5 ||
		port_string.find_first_not_of("0123456789") != std::string::npos) {
		return std::nullopt;
	}
	auto port = std::stoul(port_string);
	if(port > 65535) {
		return std::nullopt;
	}
	res.addr.sin_port = htons(static_cast<uint16_t>(port));

	return res;
}

std::string SocketAddress::to_string() const {
	char buf[INET_ADDRSTRLEN];
	inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf));

	return std::string(buf).append(":").append(std::to_string(get_port()));
}

uint16_t SocketAddress::get_port() const {
	return ntohs(addr.sin_port);
}

void SocketAddress::set_port(uint16_t port) {
	addr.sin_port = htons(port);
}

SocketAddress SocketAddress::loopback_ipv4(uint16_t port) {
	SocketAddress res;
	res.addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
	res.set_port(port);
	return res;
}

// Compare only the meaningful fields, padding bytes may differ
bool SocketAddress::operator==(SocketAddress const& other) const {
	return addr.sin_addr.s_addr == other.addr.sin_addr.s_addr &&
		addr.sin_port == other.addr.sin_port;
}

bool SocketAddress::operator<(SocketAddress const& other) const {
	auto lhs = ntohl(addr.sin_addr.s_addr);
	auto rhs = ntohl(other.addr.sin_addr.s_addr);
	if(lhs != rhs) {
		return lhs < rhs;
	}
	return get_port() < other.get_port();
}

} // namespace core
} // namespace chunkflow
