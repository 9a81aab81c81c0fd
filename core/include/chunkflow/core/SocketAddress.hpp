#ifndef CHUNKFLOW_CORE_SOCKETADDRESS_HPP
#define CHUNKFLOW_CORE_SOCKETADDRESS_HPP

#include <stdint.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <functional>
#include <optional>
#include <string>

namespace chunkflow {
namespace core {

/// Wraps an IPv4 sockaddr_in and adds convenience methods
class SocketAddress {
private:
	sockaddr_in addr;

public:
	/// Initialize zero address by default
	SocketAddress();

	/// Copy from a sockaddr_in
	SocketAddress(sockaddr_in const& addr);
	/// Copy from a sockaddr, only AF_INET is understood
	SocketAddress(sockaddr const& addr);

	/// Build from "ip:port", nullopt if malformed
	static std::optional<SocketAddress> from_string(std::string const& addr_string);
	/// Return the address and port in standard notation
	std::string to_string() const;

	/// Return the port
	uint16_t get_port() const;
	/// Set the port
	void set_port(uint16_t port);

	/// Loopback IPv4 address
	static SocketAddress loopback_ipv4(uint16_t port);

	sockaddr const* as_sockaddr() const {
		return reinterpret_cast<sockaddr const*>(&addr);
	}

	bool operator==(SocketAddress const& other) const;
	bool operator!=(SocketAddress const& other) const {
		return !(*this == other);
	}
	bool operator<(SocketAddress const& other) const;

	friend struct std::hash<SocketAddress>;
};

} // namespace core
} // namespace chunkflow

namespace std {
	/// Hash function for SocketAddress so it can be used as a key
	template <>
	struct hash<chunkflow::core::SocketAddress>
	{
		size_t operator()(chunkflow::core::SocketAddress const& addr) const
		{
			return std::hash<uint32_t>()(addr.addr.sin_addr.s_addr) ^ std::hash<uint16_t>()(addr.addr.sin_port);
		}
	};
}

#endif // CHUNKFLOW_CORE_SOCKETADDRESS_HPP
