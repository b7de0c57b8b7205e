#include<algorithm>
#include<cctype>
#include<climits>
#include<memory>
#include<stdio.h>
#include"Util/Str.hpp"

namespace Util {
namespace Str {

namespace {

bool is_space(unsigned char c) {
	return std::isspace(c);
}

}

std::string trim(std::string const& s) {
	auto start = std::find_if_not(s.begin(), s.end(), is_space);
	/* If all spaces, empty string.  */
	if (start == s.end())
		return "";

	auto rend = std::find_if_not(s.rbegin(), s.rend(), is_space);
	auto end = rend.base();

	return std::string(start, end);
}

std::string to_lower(std::string s) {
	for (auto& c : s) {
		if ('A' <= c && c <= 'Z')
			c = char(c - 'A' + 'a');
	}
	return s;
}

bool parse_int(std::string const& s, int& out, int min, int max) {
	if (s.empty() || s.size() > 10)
		return false;

	auto neg = false;
	auto it = s.begin();
	if (*it == '-') {
		neg = true;
		++it;
		if (it == s.end())
			return false;
	}

	auto acc = (long long) 0;
	for (; it != s.end(); ++it) {
		if (*it < '0' || '9' < *it)
			return false;
		acc = acc * 10 + (*it - '0');
	}
	if (neg)
		acc = -acc;
	if (acc < min || max < acc)
		return false;

	out = int(acc);
	return true;
}

std::string vfmt(char const* tpl, va_list ap_orig) {
	va_list ap;

	/* First pass to measure, second pass to write.  */
	va_copy(ap, ap_orig);
	auto len = vsnprintf(nullptr, 0, tpl, ap);
	va_end(ap);
	if (len <= 0)
		return "";

	auto buf = std::unique_ptr<char[]>(new char[std::size_t(len) + 1]);
	va_copy(ap, ap_orig);
	vsnprintf(buf.get(), std::size_t(len) + 1, tpl, ap);
	va_end(ap);

	return std::string(buf.get(), std::size_t(len));
}

std::string fmt(char const* tpl, ...) {
	va_list ap;
	va_start(ap, tpl);
	auto rv = vfmt(tpl, ap);
	va_end(ap);
	return rv;
}

}
}
