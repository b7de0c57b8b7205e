#ifndef NET_TLSWRAPPER_HPP
#define NET_TLSWRAPPER_HPP

#include<memory>
#include<string>
#include<utility>

namespace Net { class SocketFd; }
namespace Net { class Stream; }

namespace Net {

/** class Net::TlsWrapper
 *
 * @brief interface to an entity that can upgrade an
 * already-connected socket to TLS.
 *
 * @desc The socket may physically lead to a proxy;
 * `host` and `port` identify the peer at the far end
 * of the tunnel, and certificate checks must be made
 * against them.
 */
class TlsWrapper {
public:
	virtual ~TlsWrapper() { }

	/* Perform the handshake and return the secured
	 * stream.
	 *
	 * If `auto_close`, the returned stream takes `raw`
	 * (leaving it empty) and closes it when closed
	 * itself; otherwise `raw` stays with the caller and
	 * must outlive the stream.
	 *
	 * On failure throws (normally Net::TlsError) and
	 * leaves `raw` with the caller.
	 */
	virtual
	std::unique_ptr<Net::Stream>
	wrap( Net::SocketFd& raw
	    , std::string const& host
	    , int port
	    , bool auto_close
	    ) =0;
};

/** class Net::TlsOption
 *
 * @brief either plaintext beyond the proxy, or the
 * wrapper to secure connections with.
 */
class TlsOption {
private:
	std::shared_ptr<TlsWrapper> wrapper_;

	explicit
	TlsOption(std::shared_ptr<TlsWrapper> wrapper)
		: wrapper_(std::move(wrapper)) { }

public:
	/* Plaintext.  */
	TlsOption() : wrapper_() { }

	static
	TlsOption none() { return TlsOption(); }
	/* A null wrapper means plaintext.  */
	static
	TlsOption with(std::shared_ptr<TlsWrapper> wrapper) {
		return TlsOption(std::move(wrapper));
	}

	bool is_none() const { return !wrapper_; }
	bool is_tls() const { return (bool) wrapper_; }
	/* Only valid if `is_tls()`.  */
	TlsWrapper& wrapper() const { return *wrapper_; }
};

}

#endif /* !defined(NET_TLSWRAPPER_HPP) */
