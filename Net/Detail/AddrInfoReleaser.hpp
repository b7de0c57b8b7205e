#ifndef NET_DETAIL_ADDRINFORELEASER_HPP
#define NET_DETAIL_ADDRINFORELEASER_HPP

#include<string>

extern "C" { struct addrinfo; }

namespace Net { namespace Detail {

/* RAII class to release addrinfo structures.  */
class AddrInfoReleaser {
private:
	addrinfo* addrs;

public:
	AddrInfoReleaser() : addrs(nullptr) { }
	AddrInfoReleaser(AddrInfoReleaser const&) =delete;
	AddrInfoReleaser(AddrInfoReleaser&& o) {
		addrs = o.addrs;
		o.addrs = nullptr;
	}
	~AddrInfoReleaser();
	addrinfo*& get() { return addrs; }
};

/* getaddrinfo(3) for a TCP host:port.
 * family is AF_UNSPEC, AF_INET or AF_INET6.
 * Returns the getaddrinfo result code; on success the
 * list is owned by `out`.
 */
int resolve_tcp( std::string const& host, int port
	       , int family
	       , AddrInfoReleaser& out
	       );

}}

#endif /* NET_DETAIL_ADDRINFORELEASER_HPP */
