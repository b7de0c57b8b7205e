#ifndef NET_ERROR_HPP
#define NET_ERROR_HPP

#include<stdexcept>
#include<string>
#include<string.h>

namespace Net {

/** class Net::InvalidConfiguration
 *
 * @brief thrown at construction time when a proxy
 * descriptor or connection factory is given settings
 * that cannot work.
 * No I/O has been attempted when this is thrown.
 */
class InvalidConfiguration : public std::invalid_argument {
public:
	explicit
	InvalidConfiguration(std::string const& msg
			    ) : std::invalid_argument( std::string("Invalid configuration: ")
						     + msg
						     )
			      { }
};

/** class Net::UnsupportedConfiguration
 *
 * @brief thrown when a request cannot be served with
 * the current configuration, e.g. asking for an
 * unconnected socket while TLS is configured.
 * Retrying will never help.
 */
class UnsupportedConfiguration : public std::logic_error {
public:
	explicit
	UnsupportedConfiguration(std::string const& msg
				) : std::logic_error(msg) { }
};

/** class Net::ConnectionError
 *
 * @brief thrown when binding, connecting, the proxy
 * handshake, or the TLS handshake fails, including on
 * timeout.
 * Any socket opened for the failed attempt has been
 * closed by the time this reaches the caller.
 */
class ConnectionError : public std::runtime_error {
private:
	int err;

	static
	std::string describe(std::string const& msg, int err) {
		if (err == 0)
			return msg;
		return msg + ": " + strerror(err);
	}

public:
	/* err is an errno value, or 0 if the failure did
	 * not come from a system call.
	 */
	explicit
	ConnectionError( std::string const& msg
		       , int err_ = 0
		       ) : std::runtime_error(describe(msg, err_))
			 , err(err_)
			 { }

	int error_code() const { return err; }
};

/** class Net::TlsError
 *
 * @brief thrown by TLS wrappers when the handshake or
 * later TLS I/O fails.
 */
class TlsError : public ConnectionError {
public:
	explicit
	TlsError(std::string const& msg
		) : ConnectionError("TLS: " + msg) { }
};

}

#endif /* !defined(NET_ERROR_HPP) */
