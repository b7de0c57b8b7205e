#include"Net/Error.hpp"
#include"Net/IPAddr.hpp"
#include"Net/OpenSslWrapper.hpp"
#include"Net/SocketFd.hpp"
#include"Net/Stream.hpp"
#include"Util/log.hpp"
#include<climits>
#include<errno.h>
#include<string.h>
#include<openssl/err.h>
#include<openssl/pem.h>
#include<openssl/ssl.h>
#include<openssl/x509.h>
#include<openssl/x509v3.h>

namespace {

/* Drain the OpenSSL error queue of this thread into a
 * message.
 */
std::string openssl_errors() {
	auto msg = std::string();
	for (;;) {
		auto e = ERR_get_error();
		if (e == 0)
			break;
		char buf[256];
		ERR_error_string_n(e, buf, sizeof(buf));
		if (!msg.empty())
			msg += "; ";
		msg += buf;
	}
	if (msg.empty())
		msg = "unknown error";
	return msg;
}

struct SslFree {
	void operator()(SSL* ssl) const { SSL_free(ssl); }
};
struct BioFree {
	void operator()(BIO* bio) const { BIO_free(bio); }
};
struct X509Free {
	void operator()(X509* x) const { X509_free(x); }
};

}

namespace Net {

class OpenSslWrapper::Impl {
private:
	SSL_CTX* ctx;
	bool verify_peer;

public:
	Impl() =delete;
	Impl(Impl const&) =delete;
	Impl(Impl&&) =delete;

	explicit
	Impl(bool verify_peer_) : ctx(nullptr), verify_peer(verify_peer_) {
		ctx = SSL_CTX_new(TLS_client_method());
		if (!ctx)
			throw TlsError("SSL_CTX_new: " + openssl_errors());
		if (!SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION)) {
			auto msg = openssl_errors();
			SSL_CTX_free(ctx);
			throw TlsError("SSL_CTX_set_min_proto_version: " + msg);
		}
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
		/* A peer that closes without close_notify reads as
		 * a plain EOF.
		 */
		SSL_CTX_set_options(ctx, SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif
		if (verify_peer) {
			if (!SSL_CTX_set_default_verify_paths(ctx))
				Util::log( Util::Warn
					 , "cannot load system trust store: %s"
					 , openssl_errors().c_str()
					 );
			SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
		} else
			SSL_CTX_set_verify(ctx, SSL_VERIFY_NONE, nullptr);
	}
	~Impl() {
		SSL_CTX_free(ctx);
	}

	SSL_CTX* get() const { return ctx; }
	bool verifies() const { return verify_peer; }

	void add_cert(X509* cert, std::string const& where) {
		auto store = SSL_CTX_get_cert_store(ctx);
		if (!X509_STORE_add_cert(store, cert))
			throw TlsError( "cannot trust certificate from " + where
				      + ": " + openssl_errors()
				      );
	}
};

namespace {

/* The stream handed back by OpenSslWrapper::wrap.  */
class OpenSslStream : public Stream {
private:
	/* Keeps the SSL_CTX alive.  */
	std::shared_ptr<void> ctx;
	std::unique_ptr<SSL, SslFree> ssl;
	/* Owned if auto_close.  */
	Net::SocketFd owned;
	int fd;

	void check_open(char const* what) const {
		if (!ssl)
			throw ConnectionError( std::string(what)
					     + " on closed stream"
					     , EBADF
					     );
	}

	void fail(char const* what, int res) {
		auto code = SSL_get_error(ssl.get(), res);
		if (code == SSL_ERROR_SYSCALL && errno != 0)
			throw ConnectionError(std::string("TLS: ") + what, errno);
		throw TlsError(std::string(what) + ": " + openssl_errors());
	}

public:
	OpenSslStream( std::shared_ptr<void> ctx_
		     , std::unique_ptr<SSL, SslFree> ssl_
		     , Net::SocketFd owned_
		     , int fd_
		     ) : ctx(std::move(ctx_))
		       , ssl(std::move(ssl_))
		       , owned(std::move(owned_))
		       , fd(fd_)
		       { }
	~OpenSslStream() {
		if (ssl)
			/* Best effort close_notify; the peer may be
			 * gone already.
			 */
			(void) SSL_shutdown(ssl.get());
		ERR_clear_error();
	}

	void write(std::vector<std::uint8_t> const& data) override {
		check_open("write");
		auto p = data.data();
		auto left = data.size();
		while (left > 0) {
			auto chunk = left > std::size_t(INT_MAX)
				   ? INT_MAX : int(left);
			errno = 0;
			auto res = SSL_write(ssl.get(), p, chunk);
			if (res <= 0)
				fail("SSL_write", res);
			p += res;
			left -= std::size_t(res);
		}
	}

	std::vector<std::uint8_t> read(std::size_t max) override {
		check_open("read");
		auto ret = std::vector<std::uint8_t>(max);
		if (max == 0)
			return ret;
		auto chunk = max > std::size_t(INT_MAX) ? INT_MAX : int(max);
		errno = 0;
		auto res = SSL_read(ssl.get(), &ret[0], chunk);
		if (res <= 0) {
			auto code = SSL_get_error(ssl.get(), res);
			if ( code == SSL_ERROR_ZERO_RETURN
			  || (code == SSL_ERROR_SYSCALL && errno == 0)
			   ) {
				ERR_clear_error();
				ret.clear();
				return ret;
			}
			fail("SSL_read", res);
		}
		ret.resize(std::size_t(res));
		return ret;
	}

	void close() override {
		if (!ssl)
			return;
		auto res = SSL_shutdown(ssl.get());
		if (res < 0)
			Util::log( Util::Debug
				 , "TLS close_notify not sent: %s"
				 , openssl_errors().c_str()
				 );
		ssl.reset();
		fd = -1;
		if (owned && !owned.close())
			throw ConnectionError("close", errno);
	}

	int get() const override { return fd; }
	bool is_secure() const override { return true; }
};

}

OpenSslWrapper::OpenSslWrapper(bool verify_peer)
	: pimpl(std::make_shared<Impl>(verify_peer)) { }
OpenSslWrapper::~OpenSslWrapper() =default;

void OpenSslWrapper::add_trusted_pem(std::string const& pem) {
	auto bio = std::unique_ptr<BIO, BioFree>(
		BIO_new_mem_buf(pem.data(), int(pem.size()))
	);
	if (!bio)
		throw TlsError("BIO_new_mem_buf: " + openssl_errors());

	auto count = 0;
	for (;;) {
		auto cert = std::unique_ptr<X509, X509Free>(
			PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr)
		);
		if (!cert)
			break;
		pimpl->add_cert(cert.get(), "PEM string");
		++count;
	}
	/* Reaching the end of the data leaves a "no start
	 * line" error behind.
	 */
	ERR_clear_error();
	if (count == 0)
		throw TlsError("no certificate found in PEM string");
}

void OpenSslWrapper::add_trusted_file(std::string const& path) {
	if (!SSL_CTX_load_verify_locations(pimpl->get(), path.c_str(), nullptr))
		throw TlsError( "cannot load certificates from " + path
			      + ": " + openssl_errors()
			      );
}

std::unique_ptr<Net::Stream>
OpenSslWrapper::wrap( Net::SocketFd& raw
		    , std::string const& host
		    , int port
		    , bool auto_close
		    ) {
	if (!raw)
		throw ConnectionError("TLS: socket is not connected", EBADF);

	/* Anything left from earlier failures on this thread
	 * would pollute our messages.
	 */
	ERR_clear_error();

	auto ssl = std::unique_ptr<SSL, SslFree>(SSL_new(pimpl->get()));
	if (!ssl)
		throw TlsError("SSL_new: " + openssl_errors());
	/* The socket BIO does not close the fd when freed.  */
	if (!SSL_set_fd(ssl.get(), raw.get()))
		throw TlsError("SSL_set_fd: " + openssl_errors());

	auto numeric = Net::IPAddr::is_numeric(host);
	if (!numeric && !host.empty()) {
		if (!SSL_set_tlsext_host_name(ssl.get(), host.c_str()))
			throw TlsError("cannot set SNI: " + openssl_errors());
	}
	if (pimpl->verifies()) {
		auto ok = numeric
			? X509_VERIFY_PARAM_set1_ip_asc( SSL_get0_param(ssl.get())
						       , host.c_str()
						       )
			: SSL_set1_host(ssl.get(), host.c_str())
			;
		if (!ok)
			throw TlsError( "cannot set expected peer name " + host
				      + ": " + openssl_errors()
				      );
	}

	Util::log( Util::Trace, "TLS handshake with %s:%d"
		 , host.c_str(), port
		 );

	errno = 0;
	auto res = SSL_connect(ssl.get());
	if (res != 1) {
		auto code = SSL_get_error(ssl.get(), res);
		auto verify = SSL_get_verify_result(ssl.get());
		auto msg = std::string("handshake with ") + host
			 + ":" + std::to_string(port) + " failed: ";
		if (verify != X509_V_OK)
			msg += std::string("certificate verification: ")
			     + X509_verify_cert_error_string(verify);
		else if (code == SSL_ERROR_SYSCALL && errno != 0)
			msg += strerror(errno);
		else if (code == SSL_ERROR_SYSCALL)
			msg += "peer closed connection";
		else
			msg += openssl_errors();
		ERR_clear_error();
		throw TlsError(msg);
	}

	auto fd = raw.get();
	auto owned = Net::SocketFd();
	if (auto_close)
		owned = std::move(raw);
	return std::make_unique<OpenSslStream>( pimpl
					      , std::move(ssl)
					      , std::move(owned)
					      , fd
					      );
}

}
