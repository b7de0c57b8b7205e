#include<errno.h>
#include<poll.h>
#include<sys/socket.h>
#include<unistd.h>
#include"Util/Deadline.hpp"
#include"Util/Rw.hpp"

namespace Util { namespace Rw {

bool wait_for(int fd, short events, Util::Deadline const& deadline) {
	for (;;) {
		auto pfd = pollfd();
		pfd.fd = fd;
		pfd.events = events;
		pfd.revents = 0;

		auto timeout = deadline.poll_timeout();
		auto res = poll(&pfd, 1, timeout);
		if (res < 0 && errno == EINTR)
			continue;
		if (res < 0)
			return false;
		if (res == 0) {
			errno = ETIMEDOUT;
			return false;
		}
		/* Errors and hangups are reported by the following
		 * read or write.
		 */
		return true;
	}
}

bool write_all( int fd, void const* p, std::size_t s
	      , Util::Deadline const& deadline
	      ) {
	while (s > 0) {
		auto res = send(fd, p, s, MSG_NOSIGNAL);
		if (res < 0 && errno == EINTR)
			continue;
		if (res < 0 && (errno == EWOULDBLOCK || errno == EAGAIN)) {
			if (!wait_for(fd, POLLOUT, deadline))
				return false;
			continue;
		}
		if (res < 0)
			return false;

		s -= size_t(res);
		p = (void const*)(((char const*) p) + res);
	}
	return true;
}

bool read_all( int fd, void* p, std::size_t& size
	     , Util::Deadline const& deadline
	     ) {
	auto s = size;
	size = 0;
	while (s > 0) {
		/* Wait first so that a blocking socket still
		 * honors the deadline.
		 */
		if (!deadline.is_never() && !wait_for(fd, POLLIN, deadline))
			return false;

		auto res = read(fd, p, s);
		if (res < 0 && errno == EINTR)
			continue;
		if (res < 0 && (errno == EWOULDBLOCK || errno == EAGAIN)) {
			if (!wait_for(fd, POLLIN, deadline))
				return false;
			continue;
		}
		if (res < 0)
			return false;
		if (res == 0) {
			/* EOF.  */
			errno = 0;
			return false;
		}

		size += size_t(res);
		s -= size_t(res);
		p = (void*)(((char*) p) + res);
	}
	return true;
}

}}
