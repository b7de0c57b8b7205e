#ifndef NET_STREAM_HPP
#define NET_STREAM_HPP

#include<cstddef>
#include<cstdint>
#include<vector>

namespace Net { class Endpoint; }

namespace Net {

/** class Net::Stream
 *
 * @brief a connected, bidirectional byte stream, such
 * as a tunnel through a proxy, possibly with TLS on
 * top.
 *
 * @desc Blocking.  I/O failures throw
 * Net::ConnectionError.
 * Destroying the stream closes it.
 */
class Stream {
public:
	virtual ~Stream() { }

	virtual
	void write(std::vector<std::uint8_t> const& data) =0;

	/* Block until at least one byte is available, then
	 * return up to `max` bytes.
	 * Returns empty at EOF.
	 */
	virtual
	std::vector<std::uint8_t> read(std::size_t max) =0;

	/* Read exactly `size` bytes, or fewer at EOF.  */
	std::vector<std::uint8_t> read_exactly(std::size_t size);

	/* Close now, reporting failures.
	 * Further I/O is an error.
	 */
	virtual
	void close() =0;

	/* Underlying socket, or -1 once closed.  */
	virtual
	int get() const =0;

	virtual
	bool is_secure() const =0;

	Net::Endpoint local_endpoint() const;
};

}

#endif /* !defined(NET_STREAM_HPP) */
