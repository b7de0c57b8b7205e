#ifndef NET_PROXYDESCRIPTOR_HPP
#define NET_PROXYDESCRIPTOR_HPP

#include<ostream>
#include<string>

namespace Net { class ProxyDescriptor; }
std::ostream& operator<<(std::ostream&, Net::ProxyDescriptor const&);

namespace Net {

enum ProxyKind {
	/* HTTP CONNECT tunnel.  */
	Http,
	/* SOCKS5, no authentication.  */
	Socks5
};

char const* proxy_kind_name(ProxyKind k);

/** class Net::ProxyDescriptor
 *
 * @brief the address of a proxy server and the
 * protocol to speak with it.
 * Always valid once constructed.
 */
class ProxyDescriptor {
private:
	ProxyKind kind_;
	std::string host_;
	int port_;

public:
	ProxyDescriptor() =delete;
	/* Throws Net::InvalidConfiguration if the host is
	 * empty, the port is outside 1..65535, or the kind
	 * is unknown.
	 */
	ProxyDescriptor(ProxyKind kind, std::string host, int port);

	/* Parse `socks5://host:port`, `socks5h://...`,
	 * `socks://...`, `http://host:port`, or a bare
	 * `host[:port]`, which means SOCKS5 on the Tor default
	 * port 9050.
	 * IPv6 literals go in brackets.
	 * Throws Net::InvalidConfiguration.
	 */
	static
	ProxyDescriptor parse(std::string const&);

	ProxyKind kind() const { return kind_; }
	std::string const& host() const { return host_; }
	int port() const { return port_; }

	bool operator==(ProxyDescriptor const& o) const {
		return kind_ == o.kind_ && host_ == o.host_ && port_ == o.port_;
	}
	bool operator!=(ProxyDescriptor const& o) const {
		return !(*this == o);
	}

	/* `scheme://host:port`, parseable back.  */
	explicit
	operator std::string() const;
};

}

#endif /* !defined(NET_PROXYDESCRIPTOR_HPP) */
