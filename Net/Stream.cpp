#include"Net/Endpoint.hpp"
#include"Net/Error.hpp"
#include"Net/Stream.hpp"
#include<errno.h>
#include<sys/socket.h>

namespace Net {

std::vector<std::uint8_t> Stream::read_exactly(std::size_t size) {
	auto ret = std::vector<std::uint8_t>();
	ret.reserve(size);
	while (ret.size() < size) {
		auto chunk = read(size - ret.size());
		if (chunk.empty())
			break;
		ret.insert(ret.end(), chunk.begin(), chunk.end());
	}
	return ret;
}

Net::Endpoint Stream::local_endpoint() const {
	auto fd = get();
	if (fd < 0)
		throw ConnectionError("Stream is closed");

	auto ss = sockaddr_storage();
	auto len = socklen_t(sizeof(ss));
	if (getsockname(fd, reinterpret_cast<sockaddr*>(&ss), &len) < 0)
		throw ConnectionError("getsockname", errno);
	return Net::Endpoint::from_sockaddr( reinterpret_cast<sockaddr*>(&ss)
					   , len
					   );
}

}
