#undef NDEBUG
#include"Util/Str.hpp"
#include<assert.h>

int main() {
	using namespace Util::Str;

	assert(fmt("foo") == "foo");
	assert(fmt("foo %d", 42) == "foo 42");
	assert(fmt("%s:%d", "host", 1080) == "host:1080");
	assert(fmt("%s", std::string(1000, 'x').c_str()).size() == 1000);

	assert(trim("  a b \t\n") == "a b");
	assert(trim("   ") == "");
	assert(trim("") == "");
	/* Bytes with the high bit set are not spaces.  */
	assert(trim(" \xe9OK\xa0\r\n") == "\xe9OK\xa0");
	assert(trim("\xff") == "\xff");

	assert(to_lower("SOCKS5") == "socks5");
	assert(to_lower("Http://X") == "http://x");

	auto i = int(7);
	assert(parse_int("1080", i, 1, 65535) && i == 1080);
	assert(parse_int("-5", i, -10, 10) && i == -5);
	assert(!parse_int("", i, 0, 10));
	assert(!parse_int("-", i, -10, 10));
	assert(!parse_int("12a", i, 0, 100));
	assert(!parse_int(" 1", i, 0, 100));
	assert(!parse_int("65536", i, 1, 65535));
	assert(!parse_int("0", i, 1, 65535));
	assert(!parse_int("99999999999", i, 0, 2147483647));
	/* Failures leave the output alone.  */
	i = 3;
	assert(!parse_int("x", i, 0, 10));
	assert(i == 3);

	return 0;
}
