#ifndef NET_HOSTADDR_HPP
#define NET_HOSTADDR_HPP

#include<memory>
#include<ostream>
#include<string>

namespace Net { class IPAddr; }
namespace Net { class HostAddr; }
std::ostream& operator<<(std::ostream&, Net::HostAddr const&);

namespace Net {

/** class Net::HostAddr
 *
 * @brief the target of a connection: either a host
 * name as the caller spelled it, or an already
 * resolved IP address.
 *
 * @desc A name is kept as given even if it happens to
 * be a numeric address, so that the TLS identity is
 * exactly what the caller asked for.
 */
class HostAddr {
private:
	class Impl;
	std::shared_ptr<Impl> pimpl;

	explicit
	HostAddr(std::shared_ptr<Impl> pimpl_);

public:
	/* Set to IP 127.0.0.1 */
	HostAddr();

	HostAddr(HostAddr const&) =default;
	HostAddr(HostAddr&&) =default;
	HostAddr& operator=(HostAddr const&) =default;
	HostAddr& operator=(HostAddr&&) =default;

	/* Explicit factories.  */
	static
	HostAddr from_name(std::string);
	static
	HostAddr from_ip_addr(IPAddr);

	/* Destructuring.  */
	bool is_ip_addr() const { return !is_name(); }
	void to_ip_addr(IPAddr& ip) const;
	bool is_ip_addr(IPAddr& ip) const {
		auto rv = is_ip_addr();
		if (rv)
			to_ip_addr(ip);
		return rv;
	}
	bool is_name() const;
	void to_name(std::string& name) const;
	bool is_name(std::string& name) const {
		auto rv = is_name();
		if (rv)
			to_name(name);
		return rv;
	}

	/* The name a TLS peer should present a certificate
	 * for.
	 * For a name this is the name itself.
	 * For an IP address this is a reverse lookup of the
	 * address, which may block on DNS, and falls back to
	 * the numeric form if the address has no name.
	 */
	std::string identity() const;

	/* What to put on the wire in a proxy request: the
	 * name, or the numeric address.
	 */
	explicit
	operator std::string() const;

	/* Equality and inequality check.  */
	bool operator==(Net::HostAddr const& o) const;
	bool operator!=(Net::HostAddr const& o) const {
		return !(*this == o);
	}
};

}

#endif /* !defined(NET_HOSTADDR_HPP) */
