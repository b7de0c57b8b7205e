#include"Util/Deadline.hpp"
#include<climits>

namespace Util {

Deadline Deadline::after(std::chrono::milliseconds timeout) {
	if (timeout.count() <= 0)
		return Deadline();
	return Deadline(false, Clock::now() + timeout);
}

bool Deadline::expired() const {
	if (never_flag)
		return false;
	return Clock::now() >= when;
}

int Deadline::poll_timeout() const {
	if (never_flag)
		return -1;

	auto now = Clock::now();
	if (now >= when)
		return 0;

	auto left = std::chrono::duration_cast<std::chrono::microseconds>(
		when - now
	).count();
	/* Round up.  */
	auto ms = (left + 999) / 1000;
	if (ms > INT_MAX)
		return INT_MAX;
	return int(ms);
}

}
