#include<errno.h>
#include<netdb.h>
#include<poll.h>
#include<string.h>
#include<sys/socket.h>
#include<sys/types.h>
#include"Net/Detail/AddrInfoReleaser.hpp"
#include"Net/DirectConnector.hpp"
#include"Net/Error.hpp"
#include"Net/Fd.hpp"
#include"Net/SocketFd.hpp"
#include"Util/Deadline.hpp"
#include"Util/Rw.hpp"
#include"Util/log.hpp"

namespace {

/* Returns 0 on success, or the errno of the failure.  */
int connect_one( Net::Fd& sfd
	       , addrinfo const* p
	       , Util::Deadline const& deadline
	       ) {
	if (!sfd.set_nonblocking(true))
		return errno;

	auto cres = int();
	do {
		cres = ::connect( sfd.get()
				, p->ai_addr
				, p->ai_addrlen
				);
	} while (cres < 0 && errno == EINTR);
	if (cres == 0)
		return 0;
	if (errno != EINPROGRESS)
		return errno;

	if (!Util::Rw::wait_for(sfd.get(), POLLOUT, deadline))
		return errno;

	auto err = int();
	auto len = socklen_t(sizeof(err));
	if (getsockopt(sfd.get(), SOL_SOCKET, SO_ERROR, &err, &len) < 0)
		return errno;
	return err;
}

}

namespace Net {

Net::SocketFd
DirectConnector::connect( std::string const& host, int port
			, Util::Deadline const& deadline
			, Net::Fd bound
			, int bound_family
			) {
	auto family = bound ? bound_family : AF_UNSPEC;

	auto addrs = Detail::AddrInfoReleaser();
	auto res = Detail::resolve_tcp(host, port, family, addrs);
	if (res != 0)
		throw ConnectionError( "Cannot resolve proxy " + host
				     + ": " + gai_strerror(res)
				     );

	auto last_err = int(EHOSTUNREACH);
	for (auto p = addrs.get(); p; p = p->ai_next) {
		if (deadline.expired()) {
			last_err = ETIMEDOUT;
			break;
		}

		auto sfd = Fd();
		if (bound)
			sfd = std::move(bound);
		else
			sfd = Fd(socket( p->ai_family
				       , p->ai_socktype
				       , p->ai_protocol
				       ));
		/* If bad, try next.  */
		if (!sfd) {
			last_err = errno;
			continue;
		}

		auto err = connect_one(sfd, p, deadline);
		if (err == 0)
			return SocketFd(std::move(sfd));

		Util::log( Util::Trace
			 , "connect to proxy %s:%d failed: %s"
			 , host.c_str(), port, strerror(err)
			 );
		last_err = err;

		/* A pre-bound socket is spent once its connect
		 * fails.
		 */
		if (family != AF_UNSPEC)
			break;
	}

	/* Everything failed.  */
	throw ConnectionError( "Cannot connect to proxy " + host
			     + ":" + std::to_string(port)
			     , last_err
			     );
}

}
