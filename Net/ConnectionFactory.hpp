#ifndef NET_CONNECTIONFACTORY_HPP
#define NET_CONNECTIONFACTORY_HPP

#include"Net/Endpoint.hpp"
#include"Net/HostAddr.hpp"
#include"Net/ProxyDescriptor.hpp"
#include"Net/ProxySocket.hpp"
#include"Net/TlsWrapper.hpp"
#include<chrono>
#include<memory>
#include<string>

namespace Net { class IPAddr; }
namespace Net { class Stream; }

namespace Net {

/** struct Net::ConnectRequest
 *
 * @brief where to connect, and optionally which local
 * address to connect from.
 */
struct ConnectRequest {
	Net::HostAddr target;
	int port;
	bool has_local;
	Net::Endpoint local;

	ConnectRequest( Net::HostAddr target_, int port_
		      ) : target(std::move(target_))
			, port(port_)
			, has_local(false)
			, local()
			{ }
	ConnectRequest( Net::HostAddr target_, int port_
		      , Net::Endpoint local_
		      ) : target(std::move(target_))
			, port(port_)
			, has_local(true)
			, local(std::move(local_))
			{ }
};

/** class Net::ConnectionFactory
 *
 * @brief makes outgoing TCP connections that tunnel
 * through a fixed HTTP or SOCKS5 proxy, optionally
 * with TLS to the final target.
 *
 * @desc The factory only holds its configuration, so
 * one instance may serve several threads.
 * `connect` blocks until the tunnel (and TLS session,
 * if any) is up, or the timeout runs out.
 *
 * When the target is given as an `IPAddr` and TLS is
 * configured, the name handed to the TLS layer comes
 * from a reverse DNS lookup of the address (or the
 * numeric form if it has no name), so connecting may
 * block on DNS.
 */
class ConnectionFactory {
private:
	ProxyDescriptor proxy;
	std::chrono::milliseconds timeout;
	TlsOption tls;

public:
	ConnectionFactory() =delete;

	/* Throws Net::InvalidConfiguration on an empty host
	 * or a port outside 1..65535.
	 * A timeout of zero or less means no timeout.
	 */
	ConnectionFactory( std::string proxy_host, int proxy_port
			 , ProxyKind kind
			 , std::chrono::milliseconds timeout
			 , TlsOption tls = TlsOption::none()
			 );
	ConnectionFactory( ProxyDescriptor proxy
			 , std::chrono::milliseconds timeout
			 , TlsOption tls = TlsOption::none()
			 );

	ProxyDescriptor const& get_proxy() const { return proxy; }
	std::chrono::milliseconds get_timeout() const { return timeout; }
	bool is_tls() const { return tls.is_tls(); }

	/* An unbound, unconnected socket for the caller to
	 * drive.
	 * Throws Net::UnsupportedConfiguration when TLS is
	 * configured, since the factory cannot add TLS to a
	 * socket it does not connect.
	 */
	Net::ProxySocket create_socket() const;

	/* Throws Net::ConnectionError.  No socket is left
	 * open on failure.
	 */
	std::unique_ptr<Net::Stream>
	connect(ConnectRequest const& req) const;

	std::unique_ptr<Net::Stream>
	connect(std::string const& host, int port) const;
	std::unique_ptr<Net::Stream>
	connect( std::string const& host, int port
	       , Net::Endpoint const& local
	       ) const;
	std::unique_ptr<Net::Stream>
	connect(Net::IPAddr const& addr, int port) const;
	std::unique_ptr<Net::Stream>
	connect( Net::IPAddr const& addr, int port
	       , Net::Endpoint const& local
	       ) const;
};

}

#endif /* !defined(NET_CONNECTIONFACTORY_HPP) */
