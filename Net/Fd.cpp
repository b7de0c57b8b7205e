#include"Net/Fd.hpp"
#include<errno.h>
#include<fcntl.h>
#include<unistd.h>

namespace Net {

Fd::~Fd() {
	if (fd >= 0) {
		/* Ignore errors.  */
		auto err = errno;
		::close(fd);
		errno = err;
	}
}

bool Fd::close() {
	if (fd < 0)
		return true;
	auto res = ::close(release());
	/* Linux releases the descriptor even on EINTR, so
	 * never retry.
	 */
	return res == 0 || errno == EINTR;
}

bool Fd::set_nonblocking(bool flag) {
	auto flags = fcntl(fd, F_GETFL);
	if (flags < 0)
		return false;
	if (flag)
		flags |= O_NONBLOCK;
	else
		flags &= ~O_NONBLOCK;
	return fcntl(fd, F_SETFL, flags) == 0;
}

}
