#undef NDEBUG
#include"Net/Error.hpp"
#include"Net/ProxyDescriptor.hpp"
#include<assert.h>
#include<sstream>

namespace {

bool invalid(std::string const& s) {
	try {
		(void) Net::ProxyDescriptor::parse(s);
	} catch (Net::InvalidConfiguration const& _) {
		return true;
	}
	return false;
}

}

int main() {
	using Net::ProxyDescriptor;

	{
		auto p = ProxyDescriptor::parse("socks5://127.0.0.1:9150");
		assert(p.kind() == Net::Socks5);
		assert(p.host() == "127.0.0.1");
		assert(p.port() == 9150);
	}
	{
		auto p = ProxyDescriptor::parse("HTTP://proxy.example:3128/");
		assert(p.kind() == Net::Http);
		assert(p.host() == "proxy.example");
		assert(p.port() == 3128);
	}
	/* Defaults.  */
	assert(ProxyDescriptor::parse("localhost").port() == 9050);
	assert(ProxyDescriptor::parse("localhost").kind() == Net::Socks5);
	assert(ProxyDescriptor::parse("localhost:9150").port() == 9150);
	assert(ProxyDescriptor::parse("socks5h://localhost").port() == 1080);
	assert(ProxyDescriptor::parse("socks://localhost").port() == 1080);
	assert(ProxyDescriptor::parse("http://localhost").port() == 8080);
	assert(ProxyDescriptor::parse("  socks5://h:1  ").host() == "h");

	{
		auto p = ProxyDescriptor::parse("http://[::1]:8888");
		assert(p.host() == "::1");
		assert(p.port() == 8888);
		assert(std::string(p) == "http://[::1]:8888");
	}
	{
		auto p = ProxyDescriptor::parse("[2001:db8::1]");
		assert(p.host() == "2001:db8::1");
		assert(p.port() == 9050);
	}

	assert( ProxyDescriptor::parse("socks5://a:1")
	     == ProxyDescriptor(Net::Socks5, "a", 1)
	      );
	assert( ProxyDescriptor::parse("socks5://a:1")
	     != ProxyDescriptor(Net::Http, "a", 1)
	      );
	assert(std::string(ProxyDescriptor(Net::Socks5, "a", 1)) == "socks5://a:1");
	{
		auto os = std::ostringstream();
		os << ProxyDescriptor(Net::Http, "p", 80);
		assert(os.str() == "http://p:80");
	}

	assert(invalid(""));
	assert(invalid("   "));
	assert(invalid("ftp://host:21"));
	assert(invalid("socks5://"));
	assert(invalid("socks5://host:0"));
	assert(invalid("socks5://host:65536"));
	assert(invalid("socks5://host:port"));
	assert(invalid("http://user:pw@host:8080"));
	assert(invalid("::1"));
	assert(invalid("[::1"));
	assert(invalid("[::1]x"));

	/* Direct construction validates too.  */
	auto flag = false;
	try {
		(void) ProxyDescriptor(Net::Http, "", 8080);
	} catch (Net::InvalidConfiguration const& _) {
		flag = true;
	}
	assert(flag);
	flag = false;
	try {
		(void) ProxyDescriptor(Net::Http, "h", 0);
	} catch (std::invalid_argument const& e) {
		flag = true;
		assert(std::string(e.what()).find("Invalid configuration") == 0);
	}
	assert(flag);

	return 0;
}
