#include<cstdint>
#include<errno.h>
#include<string.h>
#include<vector>
#include"Net/Error.hpp"
#include"Net/HostAddr.hpp"
#include"Net/IPAddr.hpp"
#include"Net/ProxyHandshake.hpp"
#include"Net/SocketFd.hpp"
#include"Util/Deadline.hpp"
#include"Util/Rw.hpp"
#include"Util/Str.hpp"

namespace {

/* Longest HTTP reply header we are willing to buffer.  */
auto const max_http_header = std::size_t(8192);

void io_failed(char const* proto, char const* what) {
	auto err = errno;
	if (err == 0)
		throw Net::ConnectionError( std::string(proto) + ": proxy closed "
					    "connection during " + what
					  );
	if (err == ETIMEDOUT)
		throw Net::ConnectionError( std::string(proto) + ": timed out during "
				          + what
					  , err
					  );
	throw Net::ConnectionError( std::string(proto) + ": " + what
				  , err
				  );
}

void writebuff( Net::SocketFd const& fd
	      , std::vector<std::uint8_t> const& data
	      , Util::Deadline const& deadline
	      , char const* proto
	      , char const* what
	      ) {
	if (!Util::Rw::write_all( fd.get()
				, &data[0]
				, data.size()
				, deadline
				))
		io_failed(proto, what);
}
void readbuff( Net::SocketFd const& fd
	     , std::vector<std::uint8_t>& data
	     , Util::Deadline const& deadline
	     , char const* proto
	     , char const* what
	     ) {
	if (data.empty())
		return;
	auto size = data.size();
	if (!Util::Rw::read_all( fd.get()
			       , &data[0]
			       , size
			       , deadline
			       ))
		io_failed(proto, what);
}

enum HostType
{ IPv4
, IPv6
, Name
};

/* Names that happen to be numeric are still sent as
 * addresses; the proxy would only parse them back.
 */
void analyze_host( Net::HostAddr const& host
		 , HostType& addr_type
		 , std::vector<std::uint8_t>& addr_data
		 ) {
	auto ip = Net::IPAddr();
	if (!host.is_ip_addr(ip)) {
		auto name = std::string();
		host.to_name(name);
		if (!Net::IPAddr::is_numeric(name)) {
			if (name.size() > 255)
				throw Net::ConnectionError( "SOCKS5: host name longer than "
							    "255 bytes"
							  );
			addr_type = Name;
			addr_data.resize(name.size() + 1);
			addr_data[0] = std::uint8_t(name.size());
			memcpy(&addr_data[1], name.data(), name.size());
			return;
		}
		ip = Net::IPAddr::parse(name);
	}

	addr_type = ip.is_ipv4() ? IPv4 : IPv6;
	addr_data = ip.raw_data();
}

char const* socks5_reply_message(std::uint8_t rep) {
	switch (rep) {
	case 0x01: return "general SOCKS server failure";
	case 0x02: return "connection not allowed by ruleset";
	case 0x03: return "network unreachable";
	case 0x04: return "host unreachable";
	case 0x05: return "connection refused";
	case 0x06: return "TTL expired";
	case 0x07: return "command not supported";
	case 0x08: return "address type not supported";
	default: return "unassigned reply code";
	}
}
int socks5_reply_errno(std::uint8_t rep) {
	switch (rep) {
	case 0x01: return ENETDOWN;
	case 0x02: return EACCES;
	case 0x03: return ENETUNREACH;
	case 0x04: return EHOSTUNREACH;
	case 0x05: return ECONNREFUSED;
	case 0x06: return ETIMEDOUT;
	case 0x07: return EINVAL;
	case 0x08: return EAFNOSUPPORT;
	default: return EPROTO;
	}
}

}

namespace Net {

void socks5_handshake( Net::SocketFd const& fd
		     , Net::HostAddr const& host, int port
		     , Util::Deadline const& deadline
		     ) {
	auto const proto = "SOCKS5";

	auto hosttype = HostType();
	auto hostaddr = std::vector<std::uint8_t>();
	analyze_host(host, hosttype, hostaddr);

	auto buffer = std::vector<std::uint8_t>();

	/* Greeting.  */
	buffer.resize(3);
	buffer[0] = 0x05; /* SOCKS5.  */
	buffer[1] = 0x01; /* One authentication method.  */
	buffer[2] = 0x00; /* Unauthenticated method.  */
	writebuff(fd, buffer, deadline, proto, "greeting");

	/* Server-selected authentication.  */
	buffer.resize(2);
	readbuff(fd, buffer, deadline, proto, "method selection");
	if (buffer[0] != 0x05)
		throw ConnectionError( "SOCKS5: proxy replied with version "
				     + std::to_string(int(buffer[0]))
				     , EPROTO
				     );
	if (buffer[1] != 0x00)
		throw ConnectionError( "SOCKS5: proxy requires authentication"
				     , EACCES
				     );

	/* Request.  */
	buffer.resize(4);
	buffer[0] = 0x05; /* SOCKS5.  */
	buffer[1] = 0x01; /* CONNECT.  */
	buffer[2] = 0x00; /* RSV.  */
	switch (hosttype) {
	/* ATYP.  */
	case IPv4: buffer[3] = 0x01; break;
	case Name: buffer[3] = 0x03; break;
	case IPv6: buffer[3] = 0x04; break;
	}
	buffer.insert(buffer.end(), hostaddr.begin(), hostaddr.end());
	/* Port.  */
	buffer.push_back(std::uint8_t((port >> 8) & 0xFF));
	buffer.push_back(std::uint8_t((port >> 0) & 0xFF));
	writebuff(fd, buffer, deadline, proto, "request");

	/* Response.  */
	buffer.resize(4);
	readbuff(fd, buffer, deadline, proto, "reply");
	/* Check VER and RSV.  */
	if (buffer[0] != 0x05 || buffer[2] != 0x0)
		throw ConnectionError("SOCKS5: malformed reply", EPROTO);
	/* REP.  */
	if (buffer[1] != 0x0)
		throw ConnectionError( std::string("SOCKS5: proxy could not reach ")
				     + std::string(host) + ":" + std::to_string(port)
				     + ": " + socks5_reply_message(buffer[1])
				     , socks5_reply_errno(buffer[1])
				     );
	/* Parse ATYP.  */
	switch (buffer[3]) {
	case 0x01:
		buffer.resize(4);
		break;
	case 0x03:
		buffer.resize(1);
		readbuff(fd, buffer, deadline, proto, "bound address");
		buffer.resize(std::size_t(buffer[0]));
		break;
	case 0x04:
		buffer.resize(16);
		break;
	default:
		throw ConnectionError("SOCKS5: unknown bound address type", EPROTO);
	}
	/* BND.ADDR.  */
	readbuff(fd, buffer, deadline, proto, "bound address");
	/* BND.PORT.  */
	buffer.resize(2);
	readbuff(fd, buffer, deadline, proto, "bound port");

	/* Completed!  */
}

void http_connect_handshake( Net::SocketFd const& fd
			   , Net::HostAddr const& host, int port
			   , Util::Deadline const& deadline
			   ) {
	auto const proto = "HTTP CONNECT";

	auto authority = std::string(host);
	if (authority.find(':') != std::string::npos)
		authority = "[" + authority + "]";
	authority += ":" + std::to_string(port);

	auto request = std::string("CONNECT ") + authority + " HTTP/1.1\r\n"
		     + "Host: " + authority + "\r\n"
		     + "\r\n"
		     ;
	auto buffer = std::vector<std::uint8_t>(request.begin(), request.end());
	writebuff(fd, buffer, deadline, proto, "request");

	/* Read one byte at a time: anything after the blank
	 * line already belongs to the tunnel.
	 */
	auto header = std::string();
	buffer.resize(1);
	for (;;) {
		readbuff(fd, buffer, deadline, proto, "reply");
		header.push_back(char(buffer[0]));
		auto n = header.size();
		if (n >= 4 && header.compare(n - 4, 4, "\r\n\r\n") == 0)
			break;
		/* Tolerate bare LF line endings.  */
		if (n >= 2 && header.compare(n - 2, 2, "\n\n") == 0)
			break;
		if (n >= max_http_header)
			throw ConnectionError("HTTP CONNECT: reply header too long", EPROTO);
	}

	auto status_line = Util::Str::trim(header.substr(0, header.find('\n')));
	/* `HTTP/1.x NNN reason`  */
	auto sp = status_line.find(' ');
	auto code = int();
	if ( status_line.compare(0, 5, "HTTP/") != 0
	  || sp == std::string::npos
	  || !Util::Str::parse_int(status_line.substr(sp + 1, 3), code, 100, 599)
	   )
		throw ConnectionError( "HTTP CONNECT: malformed status line: "
				     + status_line
				     , EPROTO
				     );
	if (code < 200 || code > 299)
		throw ConnectionError( "HTTP CONNECT: proxy refused tunnel to "
				     + authority + ": " + status_line
				     , code == 407 ? EACCES : ECONNREFUSED
				     );
}

}
