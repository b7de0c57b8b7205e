#undef NDEBUG
#include"Net/IPAddr.hpp"
#include<assert.h>
#include<sstream>

int main() {
	using Net::IPAddr;
	assert(IPAddr() == IPAddr::v4("127.0.0.1"));
	assert(std::string(IPAddr()) == "127.0.0.1");
	assert(std::string(IPAddr::v6("::1")) == "::1");
	assert(IPAddr::v4("127.0.0.1") != IPAddr::v4("10.0.0.1"));
	assert(IPAddr::v6("2001:db8:0:0:0:0:0:4") == IPAddr::v6("2001:db8::4"));

	{
		auto os = std::ostringstream();
		os << IPAddr::v4("10.1.2.3");
		assert(os.str() == "10.1.2.3");
	}

	/* Autodetection.  */
	assert(IPAddr::parse("192.0.2.7").is_ipv4());
	assert(IPAddr::parse("2001:db8::1").is_ipv6());
	assert(IPAddr::parse("2001:db8::1") == IPAddr::v6("2001:db8::1"));

	assert(IPAddr::is_numeric("127.0.0.1"));
	assert(IPAddr::is_numeric("::1"));
	assert(!IPAddr::is_numeric("localhost"));
	assert(!IPAddr::is_numeric("example.com"));
	assert(!IPAddr::is_numeric(""));
	assert(!IPAddr::is_numeric("[::1]"));

	{
		auto raw = IPAddr::v4("192.168.1.2").raw_data();
		assert(raw.size() == 4);
		assert(raw[0] == 192);
		assert(raw[3] == 2);
		assert(IPAddr::from_raw(raw) == IPAddr::v4("192.168.1.2"));
	}
	{
		auto raw = IPAddr::v6("2001:db8::4").raw_data();
		assert(raw.size() == 16);
		assert(raw[0] == 0x20);
		assert(raw[1] == 0x01);
		assert(raw[15] == 0x04);
		assert(IPAddr::from_raw(raw).is_ipv6());
	}

	auto flag = false;
	try {
		(void) IPAddr::from_raw(std::vector<std::uint8_t>(5));
	} catch (Net::IPAddrInvalid const& _) {
		flag = true;
	}
	assert(flag);

	flag = false;
	try {
		(void) IPAddr::v4("::1");
	} catch (Net::IPAddrInvalid const& _) {
		flag = true;
	}
	assert(flag);

	flag = false;
	try {
		(void) IPAddr::parse("not an address");
	} catch (std::invalid_argument const& _) {
		flag = true;
	}
	assert(flag);

	assert(!IPAddr().reverse_lookup().empty());

	return 0;
}
