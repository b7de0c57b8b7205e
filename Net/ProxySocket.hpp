#ifndef NET_PROXYSOCKET_HPP
#define NET_PROXYSOCKET_HPP

#include"Net/Endpoint.hpp"
#include"Net/Fd.hpp"
#include"Net/ProxyDescriptor.hpp"
#include"Net/SocketFd.hpp"
#include<chrono>

namespace Net { class HostAddr; }

namespace Net {

/** class Net::ProxySocket
 *
 * @brief a TCP socket whose connections go through a
 * proxy server.
 *
 * @desc Starts out unbound and unconnected; no OS
 * socket exists until `bind` or `connect`.
 * All failures throw Net::ConnectionError, and a
 * failed `connect` leaves the socket closed.
 * Not copyable; moving transfers the OS socket.
 */
class ProxySocket {
private:
	ProxyDescriptor proxy_;
	/* Bound but not yet connected.  */
	Net::Fd bound;
	int bound_family;
	Net::Endpoint local;
	/* Connected through the proxy.  */
	Net::SocketFd conn;

public:
	ProxySocket() =delete;
	ProxySocket(ProxySocket const&) =delete;
	ProxySocket(ProxySocket&&) =default;
	ProxySocket& operator=(ProxySocket&&) =default;

	explicit
	ProxySocket(ProxyDescriptor proxy);

	/* Bind to a local address before connecting.
	 * Port 0 picks an ephemeral port.
	 */
	void bind(Net::Endpoint const& local);

	/* Connect to target:port through the proxy.
	 * A zero timeout means wait as long as the system
	 * does.
	 * On success the socket is in blocking mode.
	 */
	void connect( Net::HostAddr const& target, int port
		    , std::chrono::milliseconds timeout
		    );

	bool is_bound() const { return (bool) bound || (bool) conn; }
	bool is_connected() const { return (bool) conn; }
	/* Throws Net::ConnectionError if neither bound nor
	 * connected.
	 */
	Net::Endpoint local_endpoint() const;
	ProxyDescriptor const& proxy() const { return proxy_; }

	/* Give up the connected socket to the caller.
	 * Throws Net::ConnectionError if not connected.
	 */
	Net::SocketFd release();

	/* Close now.  Throws Net::ConnectionError if close(2)
	 * reports a failure; the socket is gone either way.
	 */
	void close();
};

}

#endif /* !defined(NET_PROXYSOCKET_HPP) */
