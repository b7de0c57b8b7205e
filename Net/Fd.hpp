#ifndef NET_FD_HPP
#define NET_FD_HPP

#include<cstddef>
#include<utility>

namespace Net {

/** class Net::Fd
 *
 * @brief RAII class for file descriptor.
 * This class is appropriate for sockets that are still
 * being set up, and for local connections.
 * Connected sockets should be promoted to
 * `Net::SocketFd`.
 */
class Fd {
private:
	int fd;

public:
	Fd(std::nullptr_t _ = nullptr) : fd(-1) { }
	~Fd();

	explicit Fd(int fd_) : fd(fd_) { }
	/* Not copyable!  */
	Fd(Fd const&) =delete;
	/* Moveable.  */
	Fd(Fd&& o) : fd(o.release()) { }

	Fd& operator=(Fd&& o) {
		auto tmp = Fd(std::move(o));
		swap(tmp);
		return *this;
	}

	int get() const { return fd; }
	int release() {
		auto ret = fd;
		fd = -1;
		return ret;
	}
	void swap(Fd& o) {
		auto tmp = o.fd;
		o.fd = fd;
		fd = tmp;
	}
	void reset(int fd_ = -1) {
		auto tmp = Fd(fd_);
		swap(tmp);
	}

	/* Close immediately.
	 * The descriptor is given up even if close(2) fails;
	 * returns false with errno set in that case.
	 */
	bool close();

	/* Toggle O_NONBLOCK.
	 * Returns false with errno set on failure.
	 */
	bool set_nonblocking(bool flag);

	explicit
	operator bool() const {
		return (fd >= 0);
	}
	bool operator!() const {
		return !((bool) *this);
	}
};

}

#endif /* !defined(NET_FD_HPP) */
