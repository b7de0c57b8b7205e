#include"Net/Error.hpp"
#include"Net/SocketStream.hpp"
#include<errno.h>

namespace Net {

void SocketStream::write(std::vector<std::uint8_t> const& data) {
	if (!fd)
		throw ConnectionError("write on closed stream", EBADF);
	fd.write(data);
}

std::vector<std::uint8_t> SocketStream::read(std::size_t max) {
	if (!fd)
		throw ConnectionError("read on closed stream", EBADF);
	return fd.read_some(max);
}

void SocketStream::close() {
	if (!fd)
		return;
	if (!fd.close())
		throw ConnectionError("close", errno);
}

}
