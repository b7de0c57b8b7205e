#include"Net/ConnectionFactory.hpp"
#include"Net/Error.hpp"
#include"Net/IPAddr.hpp"
#include"Net/SocketStream.hpp"
#include"Net/Stream.hpp"
#include"Util/Str.hpp"
#include"Util/log.hpp"
#include<errno.h>
#include<exception>
#include<memory>
#include<string.h>

namespace {

std::chrono::milliseconds normalize(std::chrono::milliseconds t) {
	if (t.count() < 0)
		return std::chrono::milliseconds(0);
	return t;
}

}

namespace Net {

ConnectionFactory::ConnectionFactory( std::string proxy_host, int proxy_port
				    , ProxyKind kind
				    , std::chrono::milliseconds timeout_
				    , TlsOption tls_
				    ) : proxy(kind, std::move(proxy_host), proxy_port)
				      , timeout(normalize(timeout_))
				      , tls(std::move(tls_))
				      { }
ConnectionFactory::ConnectionFactory( ProxyDescriptor proxy_
				    , std::chrono::milliseconds timeout_
				    , TlsOption tls_
				    ) : proxy(std::move(proxy_))
				      , timeout(normalize(timeout_))
				      , tls(std::move(tls_))
				      { }

Net::ProxySocket ConnectionFactory::create_socket() const {
	if (tls.is_tls())
		throw UnsupportedConfiguration(
			"Cannot create an unconnected socket when TLS is configured"
		);
	return Net::ProxySocket(proxy);
}

std::unique_ptr<Net::Stream>
ConnectionFactory::connect(ConnectRequest const& req) const {
	auto target = std::string(req.target);
	if (req.target.is_name() && target.empty())
		throw ConnectionError("Cannot connect: empty target host");
	if (req.port < 1 || req.port > 65535)
		throw ConnectionError(Util::Str::fmt(
			"Cannot connect: target port out of range: %d", req.port
		));
	if (req.has_local && (req.local.port < 0 || req.local.port > 65535))
		throw ConnectionError(Util::Str::fmt(
			"Cannot connect: local port out of range: %d", req.local.port
		));

	Util::log( Util::Debug, "connecting to %s:%d via %s%s"
		 , target.c_str(), req.port
		 , std::string(proxy).c_str()
		 , tls.is_tls() ? " with TLS" : ""
		 );

	/* Closes itself on every failure below.  */
	auto sock = Net::ProxySocket(proxy);
	try {
		if (req.has_local)
			sock.bind(req.local);
		sock.connect(req.target, req.port, timeout);
	} catch (ConnectionError const& e) {
		Util::log( Util::Info, "connection to %s:%d via %s failed: %s"
			 , target.c_str(), req.port
			 , std::string(proxy).c_str()
			 , e.what()
			 );
		throw;
	}

	auto raw = sock.release();
	if (tls.is_none()) {
		Util::log( Util::Debug, "connected to %s:%d via %s"
			 , target.c_str(), req.port
			 , std::string(proxy).c_str()
			 );
		return std::make_unique<Net::SocketStream>(std::move(raw));
	}

	auto identity = req.target.identity();
	auto tls_failed = [&](char const* what) {
		if (raw && !raw.close())
			Util::log( Util::Debug
				 , "closing socket to %s:%d after TLS failure: %s"
				 , target.c_str(), req.port
				 , strerror(errno)
				 );
		Util::log( Util::Info, "TLS to %s:%d via %s failed: %s"
			 , identity.c_str(), req.port
			 , std::string(proxy).c_str()
			 , what
			 );
	};
	auto stream = std::unique_ptr<Net::Stream>();
	try {
		stream = tls.wrapper().wrap(raw, identity, req.port, true);
	} catch (ConnectionError const& e) {
		tls_failed(e.what());
		throw;
	} catch (std::exception const& e) {
		tls_failed(e.what());
		throw ConnectionError(e.what());
	}
	if (!stream) {
		tls_failed("wrapper returned no stream");
		throw TlsError("wrapper returned no stream");
	}

	Util::log( Util::Debug, "connected to %s:%d via %s with TLS"
		 , identity.c_str(), req.port
		 , std::string(proxy).c_str()
		 );
	return stream;
}

std::unique_ptr<Net::Stream>
ConnectionFactory::connect(std::string const& host, int port) const {
	return connect(ConnectRequest(Net::HostAddr::from_name(host), port));
}
std::unique_ptr<Net::Stream>
ConnectionFactory::connect( std::string const& host, int port
			  , Net::Endpoint const& local
			  ) const {
	return connect(ConnectRequest( Net::HostAddr::from_name(host), port
				     , local
				     ));
}
std::unique_ptr<Net::Stream>
ConnectionFactory::connect(Net::IPAddr const& addr, int port) const {
	return connect(ConnectRequest(Net::HostAddr::from_ip_addr(addr), port));
}
std::unique_ptr<Net::Stream>
ConnectionFactory::connect( Net::IPAddr const& addr, int port
			  , Net::Endpoint const& local
			  ) const {
	return connect(ConnectRequest( Net::HostAddr::from_ip_addr(addr), port
				     , local
				     ));
}

}
