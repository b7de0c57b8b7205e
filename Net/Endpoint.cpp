#include"Net/Endpoint.hpp"
#include"Util/Str.hpp"
#include<stdexcept>
#include<netinet/in.h>
#include<string.h>

namespace Net {

Endpoint Endpoint::parse(std::string const& s) {
	auto colon = s.rfind(':');
	if (colon == std::string::npos || colon == 0)
		throw std::invalid_argument("Endpoint needs ADDR:PORT: " + s);
	auto addr_s = s.substr(0, colon);
	auto port = int();
	if (!Util::Str::parse_int(s.substr(colon + 1), port, 0, 65535))
		throw std::invalid_argument("Bad port in endpoint: " + s);

	if (addr_s[0] == '[') {
		if (addr_s.size() < 2 || addr_s[addr_s.size() - 1] != ']')
			throw std::invalid_argument("Unterminated '[' in endpoint: " + s);
		return Endpoint(IPAddr::v6(addr_s.substr(1, addr_s.size() - 2)), port);
	}
	return Endpoint(IPAddr::v4(addr_s), port);
}

Endpoint Endpoint::from_sockaddr(sockaddr const* sa, socklen_t len) {
	if (sa->sa_family == AF_INET && len >= socklen_t(sizeof(sockaddr_in))) {
		auto sin = reinterpret_cast<sockaddr_in const*>(sa);
		auto raw = std::vector<std::uint8_t>(4);
		memcpy(&raw[0], &sin->sin_addr, raw.size());
		return Endpoint(IPAddr::from_raw(raw), int(ntohs(sin->sin_port)));
	}
	if (sa->sa_family == AF_INET6 && len >= socklen_t(sizeof(sockaddr_in6))) {
		auto sin6 = reinterpret_cast<sockaddr_in6 const*>(sa);
		auto raw = std::vector<std::uint8_t>(16);
		memcpy(&raw[0], &sin6->sin6_addr, raw.size());
		return Endpoint(IPAddr::from_raw(raw), int(ntohs(sin6->sin6_port)));
	}
	throw IPAddrInvalid("<unsupported address family>");
}

socklen_t Endpoint::to_sockaddr(sockaddr_storage& ss) const {
	memset(&ss, 0, sizeof(ss));
	auto& raw = addr.raw_data();
	if (addr.is_ipv4()) {
		auto sin = reinterpret_cast<sockaddr_in*>(&ss);
		sin->sin_family = AF_INET;
		sin->sin_port = htons(std::uint16_t(port));
		memcpy(&sin->sin_addr, &raw[0], raw.size());
		return sizeof(sockaddr_in);
	} else {
		auto sin6 = reinterpret_cast<sockaddr_in6*>(&ss);
		sin6->sin6_family = AF_INET6;
		sin6->sin6_port = htons(std::uint16_t(port));
		memcpy(&sin6->sin6_addr, &raw[0], raw.size());
		return sizeof(sockaddr_in6);
	}
}

Endpoint::operator std::string() const {
	if (addr.is_ipv4())
		return std::string(addr) + ":" + std::to_string(port);
	return "[" + std::string(addr) + "]:" + std::to_string(port);
}

}

std::ostream& operator<<(std::ostream& os, Net::Endpoint const& ep) {
	return os << std::string(ep);
}
