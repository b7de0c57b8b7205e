#ifndef NET_SOCKETSTREAM_HPP
#define NET_SOCKETSTREAM_HPP

#include"Net/SocketFd.hpp"
#include"Net/Stream.hpp"

namespace Net {

/** class Net::SocketStream
 *
 * @brief a plain, unencrypted `Net::Stream` over a
 * connected socket.
 */
class SocketStream : public Stream {
private:
	Net::SocketFd fd;

public:
	SocketStream() =delete;
	explicit
	SocketStream(Net::SocketFd fd_) : fd(std::move(fd_)) { }

	void write(std::vector<std::uint8_t> const& data) override;
	std::vector<std::uint8_t> read(std::size_t max) override;
	void close() override;
	int get() const override { return fd.get(); }
	bool is_secure() const override { return false; }
};

}

#endif /* !defined(NET_SOCKETSTREAM_HPP) */
