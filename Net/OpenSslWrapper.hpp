#ifndef NET_OPENSSLWRAPPER_HPP
#define NET_OPENSSLWRAPPER_HPP

#include"Net/TlsWrapper.hpp"
#include<memory>
#include<string>

namespace Net {

/** class Net::OpenSslWrapper
 *
 * @brief `Net::TlsWrapper` backed by OpenSSL.
 *
 * @desc Client side only, TLS 1.2 or later.
 * By default the peer certificate must chain to the
 * system trust store and match the host given to
 * `wrap` (as a DNS name, or as an IP address if the
 * host is numeric); SNI is sent for DNS names.
 *
 * Configure before use; once connections are being
 * made, `wrap` may be called from several threads at
 * once.
 *
 * OpenSSL writes to the socket with write(2), so the
 * process should ignore SIGPIPE.
 */
class OpenSslWrapper : public TlsWrapper {
private:
	class Impl;
	std::shared_ptr<Impl> pimpl;

public:
	/* Throws Net::TlsError if OpenSSL cannot create a
	 * context.
	 * With `verify_peer` false, any certificate is
	 * accepted; only use that for testing.
	 */
	explicit
	OpenSslWrapper(bool verify_peer = true);
	~OpenSslWrapper();

	/* Trust an extra CA or self-signed certificate,
	 * given in PEM.
	 * Throws Net::TlsError if it cannot be parsed.
	 */
	void add_trusted_pem(std::string const& pem);
	/* Trust the certificates in a PEM file.
	 * Throws Net::TlsError.
	 */
	void add_trusted_file(std::string const& path);

	std::unique_ptr<Net::Stream>
	wrap( Net::SocketFd& raw
	    , std::string const& host
	    , int port
	    , bool auto_close
	    ) override;
};

}

#endif /* !defined(NET_OPENSSLWRAPPER_HPP) */
