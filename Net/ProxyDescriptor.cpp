#include"Net/Error.hpp"
#include"Net/ProxyDescriptor.hpp"
#include"Util/Str.hpp"
#include<algorithm>

namespace {

auto const default_tor_port = 9050;
auto const default_socks_port = 1080;
auto const default_http_port = 8080;

/* Split `host[:port]`, where host may be a bracketed
 * IPv6 literal.
 * port is left untouched if absent.
 */
void split_host_port( std::string const& orig
		    , std::string const& s
		    , std::string& host
		    , int& port
		    ) {
	auto port_s = std::string();
	auto has_port = false;

	if (!s.empty() && s[0] == '[') {
		auto close = s.find(']');
		if (close == std::string::npos)
			throw Net::InvalidConfiguration( "unterminated '[' in proxy: "
						       + orig
						       );
		host = s.substr(1, close - 1);
		auto rest = s.substr(close + 1);
		if (!rest.empty()) {
			if (rest[0] != ':')
				throw Net::InvalidConfiguration( "junk after ']' in proxy: "
							       + orig
							       );
			port_s = rest.substr(1);
			has_port = true;
		}
	} else {
		auto colons = std::count(s.begin(), s.end(), ':');
		if (colons > 1)
			throw Net::InvalidConfiguration( "IPv6 proxy address must be "
						         "in brackets: "
						       + orig
						       );
		auto colon = s.find(':');
		if (colon == std::string::npos) {
			host = s;
		} else {
			host = s.substr(0, colon);
			port_s = s.substr(colon + 1);
			has_port = true;
		}
	}

	if (has_port && !Util::Str::parse_int(port_s, port, 1, 65535))
		throw Net::InvalidConfiguration( "bad port in proxy: "
					       + orig
					       );
}

}

namespace Net {

char const* proxy_kind_name(ProxyKind k) {
	switch (k) {
	case Http: return "http";
	case Socks5: return "socks5";
	}
	return "unknown";
}

ProxyDescriptor::ProxyDescriptor( ProxyKind kind
				, std::string host
				, int port
				) : kind_(kind)
				  , host_(std::move(host))
				  , port_(port) {
	if (kind_ != Http && kind_ != Socks5)
		throw InvalidConfiguration( "unknown proxy kind "
					  + std::to_string(int(kind_))
					  );
	if (host_.empty())
		throw InvalidConfiguration("proxy host must not be empty");
	if (port_ < 1 || port_ > 65535)
		throw InvalidConfiguration( "proxy port out of range: "
					  + std::to_string(port_)
					  );
}

ProxyDescriptor ProxyDescriptor::parse(std::string const& orig) {
	auto s = Util::Str::trim(orig);
	if (s.empty())
		throw InvalidConfiguration("empty proxy");

	auto kind = Socks5;
	auto port = default_tor_port;

	auto sep = s.find("://");
	if (sep != std::string::npos) {
		auto scheme = Util::Str::to_lower(s.substr(0, sep));
		if (scheme == "socks5" || scheme == "socks5h" || scheme == "socks") {
			kind = Socks5;
			port = default_socks_port;
		} else if (scheme == "http") {
			kind = Http;
			port = default_http_port;
		} else
			throw InvalidConfiguration( "unsupported proxy scheme '"
						  + scheme
						  + "'"
						  );
		s = s.substr(sep + 3);
		/* Tolerate a trailing slash, as in URLs.  */
		if (!s.empty() && s[s.size() - 1] == '/')
			s.resize(s.size() - 1);
	}
	if (s.find('@') != std::string::npos)
		throw InvalidConfiguration("proxy authentication is not supported");

	auto host = std::string();
	split_host_port(orig, s, host, port);

	return ProxyDescriptor(kind, std::move(host), port);
}

ProxyDescriptor::operator std::string() const {
	auto host = host_;
	if (host.find(':') != std::string::npos)
		host = "[" + host + "]";
	return std::string(proxy_kind_name(kind_))
	     + "://" + host
	     + ":" + std::to_string(port_)
	     ;
}

}

std::ostream& operator<<(std::ostream& os, Net::ProxyDescriptor const& p) {
	return os << std::string(p);
}
