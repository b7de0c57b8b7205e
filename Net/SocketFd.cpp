#include<errno.h>
#include<string.h>
#include<sys/socket.h>
#include<unistd.h>
#include"Net/Endpoint.hpp"
#include"Net/Error.hpp"
#include"Net/SocketFd.hpp"

namespace Net {

SocketFd::~SocketFd() {
	if (!fd)
		return;

	/* Save the errno; it is possible we are shutting down FDs
	 * due to failures, so make sure the reported failure is
	 * the one that is saved in the current errno.
	 */
	auto my_errno = errno;

	char unused[256];
	auto sys_res = ssize_t();

	/* Tell remote side that we will stop sending data and
	 * trigger an EOF there.
	 */
	sys_res = shutdown(fd.get(), SHUT_WR);
	if (sys_res < 0) {
		errno = my_errno;
		/* Normal ~Fd() will close the socket file descriptor.  */
		return;
	}

	/* Drain what has already arrived, so the close does not
	 * turn into a RST that discards our own last writes.
	 * Never wait for more: a peer that keeps the
	 * connection open must not hang us.
	 */
	for (;;) {
		do {
			sys_res = recv(fd.get(), unused, sizeof(unused), MSG_DONTWAIT);
		} while (sys_res < 0 && errno == EINTR);
		if (sys_res <= 0)
			break;
	}
	errno = my_errno;
}

void SocketFd::write(std::vector<std::uint8_t> const& data) {
	auto size = data.size();
	if (size == 0)
		return;
	auto ptr = &data[0];
	do {
		auto res = ssize_t();
		do {
			res = send( fd.get()
				  , ptr, size
				  , MSG_NOSIGNAL
				  );
		} while (res < 0 && errno == EINTR);
		if (res < 0)
			throw ConnectionError("Net::SocketFd::write: send", errno);
		ptr += res;
		size -= res;
	} while (size > 0);
}

std::vector<std::uint8_t> SocketFd::read_some(std::size_t size) {
	auto ret = std::vector<std::uint8_t>(size);
	if (size == 0)
		return ret;
	auto res = ssize_t();
	do {
		res = ::read(fd.get(), &ret[0], size);
	} while (res < 0 && errno == EINTR);
	if (res < 0)
		throw ConnectionError("Net::SocketFd::read_some: read", errno);
	ret.resize(std::size_t(res));
	return ret;
}

Net::Endpoint SocketFd::local_endpoint() const {
	auto ss = sockaddr_storage();
	auto len = socklen_t(sizeof(ss));
	if (getsockname(fd.get(), reinterpret_cast<sockaddr*>(&ss), &len) < 0)
		throw ConnectionError("getsockname", errno);
	return Net::Endpoint::from_sockaddr( reinterpret_cast<sockaddr*>(&ss)
					   , len
					   );
}

}
