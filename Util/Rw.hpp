#ifndef UTIL_RW_HPP
#define UTIL_RW_HPP

#include<cstdlib>

namespace Util { class Deadline; }

namespace Util { namespace Rw {

/* Wait until the fd reports one of the given poll(2)
 * events.
 * Return true if ready, false if not, with errno set
 * (ETIMEDOUT if the deadline passed).
 */
bool wait_for(int fd, short events, Util::Deadline const& deadline);

/* Return true if successful, false if not, with errno
 * set (ETIMEDOUT if the deadline passed).
 * Works on both blocking and non-blocking sockets.
 */
bool write_all( int fd, void const* p, std::size_t size
	      , Util::Deadline const& deadline
	      );

/* Return true if successful, false if not.
 * size is modified depending on actual number of
 * bytes read.
 * It is possible to fail with some number of
 * bytes already read.
 * At EOF errno is set to 0.
 */
bool read_all( int fd, void* p, std::size_t& size
	     , Util::Deadline const& deadline
	     );

}}

#endif /* !defined(UTIL_RW_HPP) */
