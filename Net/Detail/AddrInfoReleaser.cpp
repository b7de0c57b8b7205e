#include"Net/Detail/AddrInfoReleaser.hpp"
#include"Net/IPAddr.hpp"
#include<netdb.h>
#include<string.h>
#include<sys/socket.h>
#include<sys/types.h>

namespace Net { namespace Detail {

AddrInfoReleaser::~AddrInfoReleaser() {
	if (addrs)
		freeaddrinfo(addrs);
}

int resolve_tcp( std::string const& host, int port
	       , int family
	       , AddrInfoReleaser& out
	       ) {
	auto portstring = std::to_string(port);

	auto hint = addrinfo();
	memset(&hint, 0, sizeof(hint));
	hint.ai_family = family;
	hint.ai_socktype = SOCK_STREAM;   /* TCP interface.  */
	hint.ai_protocol = 0;             /* Any protocol.  */
	if (Net::IPAddr::is_numeric(host))
		hint.ai_flags = AI_NUMERICHOST;
	else if (family == AF_UNSPEC)
		/* Use IPv6 only if we have IPv6 ourselves.  */
		hint.ai_flags = AI_ADDRCONFIG;

	return getaddrinfo( host.c_str(), portstring.c_str()
			  , &hint
			  , &out.get()
			  );
}

}}
