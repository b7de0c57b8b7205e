#ifndef NET_DIRECTCONNECTOR_HPP
#define NET_DIRECTCONNECTOR_HPP

#include"Net/Fd.hpp"
#include<string>

namespace Net { class SocketFd; }
namespace Util { class Deadline; }

namespace Net {

/* Connects directly to the specified host:port; used
 * to reach the proxy server itself.
 */
class DirectConnector {
public:
	/* Tries each address host resolves to, in order,
	 * until one accepts or the deadline passes.
	 *
	 * If `bound` is a socket already bound to a local
	 * address of family `bound_family`, only that socket
	 * is used and only the first address of that family
	 * is tried.
	 *
	 * Throws Net::ConnectionError.
	 * The returned socket is left non-blocking.
	 */
	Net::SocketFd
	connect( std::string const& host, int port
	       , Util::Deadline const& deadline
	       , Net::Fd bound = nullptr
	       , int bound_family = 0
	       );
};

}

#endif /* NET_DIRECTCONNECTOR_HPP */
