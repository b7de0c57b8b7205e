#ifndef UTIL_DEADLINE_HPP
#define UTIL_DEADLINE_HPP

#include<chrono>

namespace Util {

/** class Util::Deadline
 *
 * @brief a point in time after which blocking
 * operations give up.
 *
 * @desc A deadline built from a zero or negative
 * timeout never expires.
 */
class Deadline {
private:
	typedef std::chrono::steady_clock Clock;

	bool never_flag;
	Clock::time_point when;

	Deadline(bool never_flag_, Clock::time_point when_)
		: never_flag(never_flag_), when(when_) { }

public:
	/* Never expires.  */
	Deadline() : never_flag(true), when() { }

	static
	Deadline never() { return Deadline(); }
	static
	Deadline after(std::chrono::milliseconds timeout);

	bool is_never() const { return never_flag; }
	bool expired() const;

	/* Milliseconds remaining, rounded up, in the form
	 * poll(2) wants: -1 to wait forever, 0 if already
	 * expired.
	 */
	int poll_timeout() const;
};

}

#endif /* !defined(UTIL_DEADLINE_HPP) */
