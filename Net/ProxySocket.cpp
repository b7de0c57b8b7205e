#include<errno.h>
#include<sys/socket.h>
#include"Net/DirectConnector.hpp"
#include"Net/Error.hpp"
#include"Net/HostAddr.hpp"
#include"Net/ProxyHandshake.hpp"
#include"Net/ProxySocket.hpp"
#include"Util/Deadline.hpp"
#include"Util/log.hpp"

namespace Net {

ProxySocket::ProxySocket(ProxyDescriptor proxy)
	: proxy_(std::move(proxy))
	, bound()
	, bound_family(AF_UNSPEC)
	, local()
	, conn()
	{ }

void ProxySocket::bind(Net::Endpoint const& local_) {
	if (is_connected())
		throw ConnectionError("Cannot bind: socket is already connected");
	if (bound)
		throw ConnectionError("Cannot bind: socket is already bound");
	if (local_.port < 0 || local_.port > 65535)
		throw ConnectionError( "Cannot bind: local port out of range: "
				     + std::to_string(local_.port)
				     );

	auto fd = Fd(socket(local_.family(), SOCK_STREAM, 0));
	if (!fd)
		throw ConnectionError("Cannot bind: socket", errno);

	auto ss = sockaddr_storage();
	auto len = local_.to_sockaddr(ss);
	if (::bind(fd.get(), reinterpret_cast<sockaddr*>(&ss), len) < 0)
		throw ConnectionError( "Cannot bind to " + std::string(local_)
				     , errno
				     );

	/* Learn the actual port if an ephemeral one was
	 * requested.
	 */
	auto got = sockaddr_storage();
	auto got_len = socklen_t(sizeof(got));
	if (getsockname(fd.get(), reinterpret_cast<sockaddr*>(&got), &got_len) < 0)
		throw ConnectionError("Cannot bind: getsockname", errno);

	local = Net::Endpoint::from_sockaddr( reinterpret_cast<sockaddr*>(&got)
					    , got_len
					    );
	bound_family = local_.family();
	bound = std::move(fd);
}

void ProxySocket::connect( Net::HostAddr const& target, int port
			 , std::chrono::milliseconds timeout
			 ) {
	if (is_connected())
		throw ConnectionError("Cannot connect: socket is already connected");

	auto deadline = Util::Deadline::after(timeout);

	Util::log( Util::Trace, "connecting to %s:%d via %s"
		 , std::string(target).c_str(), port
		 , std::string(proxy_).c_str()
		 );

	/* If anything below throws, fd closes itself.  */
	auto fd = DirectConnector().connect( proxy_.host(), proxy_.port()
					   , deadline
					   , std::move(bound)
					   , bound_family
					   );
	switch (proxy_.kind()) {
	case Socks5:
		socks5_handshake(fd, target, port, deadline);
		break;
	case Http:
		http_connect_handshake(fd, target, port, deadline);
		break;
	}

	if (!fd.set_nonblocking(false))
		throw ConnectionError("Cannot connect: fcntl", errno);

	local = fd.local_endpoint();
	conn = std::move(fd);
}

Net::Endpoint ProxySocket::local_endpoint() const {
	if (!is_bound())
		throw ConnectionError("Socket is neither bound nor connected");
	return local;
}

Net::SocketFd ProxySocket::release() {
	if (!is_connected())
		throw ConnectionError("Socket is not connected");
	return std::move(conn);
}

void ProxySocket::close() {
	auto ok = true;
	auto err = int();
	if (bound && !bound.close()) {
		ok = false;
		err = errno;
	}
	if (conn && !conn.close()) {
		ok = false;
		err = errno;
	}
	if (!ok)
		throw ConnectionError("close", err);
}

}
