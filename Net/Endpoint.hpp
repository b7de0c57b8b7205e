#ifndef NET_ENDPOINT_HPP
#define NET_ENDPOINT_HPP

#include"Net/IPAddr.hpp"
#include<ostream>
#include<string>
#include<sys/socket.h>
#include<utility>

namespace Net { class Endpoint; }
std::ostream& operator<<(std::ostream&, Net::Endpoint const&);

namespace Net {

/** class Net::Endpoint
 *
 * @brief an IP address and TCP port, used for local
 * binds and for reporting socket addresses.
 */
class Endpoint {
public:
	Net::IPAddr addr;
	int port;

	/* 127.0.0.1:0 */
	Endpoint() : addr(), port(0) { }
	Endpoint(Net::IPAddr addr_, int port_)
		: addr(std::move(addr_)), port(port_) { }

	/* `ADDR:PORT`, with IPv6 addresses in brackets.
	 * Port may be 0.
	 * Throws std::invalid_argument.
	 */
	static
	Endpoint parse(std::string const&);

	static
	Endpoint from_sockaddr(sockaddr const* sa, socklen_t len);
	/* Returns the number of bytes of ss filled in.  */
	socklen_t to_sockaddr(sockaddr_storage& ss) const;

	int family() const { return addr.is_ipv4() ? AF_INET : AF_INET6; }

	bool operator==(Endpoint const& o) const {
		return addr == o.addr && port == o.port;
	}
	bool operator!=(Endpoint const& o) const {
		return !(*this == o);
	}

	/* `1.2.3.4:80` or `[::1]:80`.  */
	explicit
	operator std::string() const;
};

}

#endif /* !defined(NET_ENDPOINT_HPP) */
