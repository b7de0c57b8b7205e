#include"Net/IPAddr.hpp"
#include<arpa/inet.h>
#include<netdb.h>
#include<netinet/in.h>
#include<string.h>
#include<sys/socket.h>
#include<sys/types.h>

namespace Net {

class IPAddr::Impl {
private:
	std::vector<std::uint8_t> data;
	bool ipv4;

public:
	bool try_construct(int family, std::string const& s) {
		data.resize( family == AF_INET ? sizeof(struct in_addr)
					       : sizeof(struct in6_addr)
			   );
		if (inet_pton(family, s.c_str(), (void*) &data[0]) != 1)
			return false;
		ipv4 = (family == AF_INET);
		return true;
	}
	void construct_by_raw(std::vector<std::uint8_t> const& raw) {
		if (raw.size() == sizeof(struct in_addr))
			ipv4 = true;
		else if (raw.size() == sizeof(struct in6_addr))
			ipv4 = false;
		else
			throw IPAddrInvalid( "<" + std::to_string(raw.size())
					   + " raw bytes>"
					   );
		data = raw;
	}

	bool is_ipv4() const {
		return ipv4;
	}
	std::vector<std::uint8_t> const& raw_data() const {
		return data;
	}
	bool operator==(Impl const& o) const {
		if (this == &o)
			return true;
		return data == o.data;
	}

	std::string reverse_lookup() const {
		auto ss = sockaddr_storage();
		memset(&ss, 0, sizeof(ss));
		auto len = socklen_t();
		if (ipv4) {
			auto sa = reinterpret_cast<sockaddr_in*>(&ss);
			sa->sin_family = AF_INET;
			memcpy(&sa->sin_addr, &data[0], data.size());
			len = sizeof(sockaddr_in);
		} else {
			auto sa = reinterpret_cast<sockaddr_in6*>(&ss);
			sa->sin6_family = AF_INET6;
			memcpy(&sa->sin6_addr, &data[0], data.size());
			len = sizeof(sockaddr_in6);
		}

		char host[NI_MAXHOST];
		/* Without NI_NAMEREQD, getnameinfo falls back to
		 * the numeric form by itself.
		 */
		auto res = getnameinfo( reinterpret_cast<sockaddr*>(&ss), len
				      , host, sizeof(host)
				      , nullptr, 0
				      , 0
				      );
		if (res != 0)
			return std::string(*this);
		return std::string(host);
	}

	operator std::string() const {
		if (ipv4) {
			char buff[INET_ADDRSTRLEN + 1];
			inet_ntop(AF_INET, (void*) &data[0], buff, sizeof(buff));
			return std::string(buff);
		} else {
			char buff[INET6_ADDRSTRLEN + 1];
			inet_ntop(AF_INET6, (void*) &data[0], buff, sizeof(buff));
			return std::string(buff);
		}
	}
};

IPAddr::IPAddr() : pimpl(std::make_shared<Impl>()) {
	pimpl->try_construct(AF_INET, "127.0.0.1");
}
IPAddr::IPAddr(std::shared_ptr<Impl> pimpl_) : pimpl(std::move(pimpl_)) { }

IPAddr IPAddr::v4(std::string const& ip) {
	auto pimpl = std::make_shared<Impl>();
	if (!pimpl->try_construct(AF_INET, ip))
		throw IPAddrInvalid(ip);
	return IPAddr(std::move(pimpl));
}
IPAddr IPAddr::v6(std::string const& ip) {
	auto pimpl = std::make_shared<Impl>();
	if (!pimpl->try_construct(AF_INET6, ip))
		throw IPAddrInvalid(ip);
	return IPAddr(std::move(pimpl));
}
IPAddr IPAddr::parse(std::string const& ip) {
	auto pimpl = std::make_shared<Impl>();
	if ( !pimpl->try_construct(AF_INET, ip)
	  && !pimpl->try_construct(AF_INET6, ip)
	   )
		throw IPAddrInvalid(ip);
	return IPAddr(std::move(pimpl));
}
IPAddr IPAddr::from_raw(std::vector<std::uint8_t> const& raw) {
	auto pimpl = std::make_shared<Impl>();
	pimpl->construct_by_raw(raw);
	return IPAddr(std::move(pimpl));
}

bool IPAddr::is_numeric(std::string const& s) {
	auto impl = Impl();
	return impl.try_construct(AF_INET, s)
	    || impl.try_construct(AF_INET6, s)
	     ;
}

bool IPAddr::is_ipv4() const {
	return pimpl->is_ipv4();
}
std::vector<std::uint8_t> const& IPAddr::raw_data() const {
	return pimpl->raw_data();
}
bool IPAddr::operator==(IPAddr const& o) const {
	return *pimpl == *o.pimpl;
}
std::string IPAddr::reverse_lookup() const {
	return pimpl->reverse_lookup();
}
IPAddr::operator std::string() const {
	return std::string(*pimpl);
}

}

std::ostream& operator<<(std::ostream& os, Net::IPAddr const& ip) {
	return os << std::string(ip);
}
