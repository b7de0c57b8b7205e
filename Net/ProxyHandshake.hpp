#ifndef NET_PROXYHANDSHAKE_HPP
#define NET_PROXYHANDSHAKE_HPP

namespace Net { class HostAddr; }
namespace Net { class SocketFd; }
namespace Util { class Deadline; }

namespace Net {

/* Each of these asks the proxy at the other end of
 * `fd` to open a tunnel to target:port, and returns
 * once the tunnel is usable, leaving no reply byte
 * unread.
 * They throw Net::ConnectionError on any failure,
 * including the deadline passing, and leave closing
 * the socket to the caller.
 */

/* RFC1928, offering only the "no authentication"
 * method.
 * Host names are sent for the proxy to resolve.
 */
void socks5_handshake( Net::SocketFd const& fd
		     , Net::HostAddr const& target, int port
		     , Util::Deadline const& deadline
		     );

/* HTTP/1.1 CONNECT.
 * Any 2xx reply opens the tunnel.
 */
void http_connect_handshake( Net::SocketFd const& fd
			   , Net::HostAddr const& target, int port
			   , Util::Deadline const& deadline
			   );

}

#endif /* !defined(NET_PROXYHANDSHAKE_HPP) */
