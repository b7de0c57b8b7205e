#include"Net/ConnectionFactory.hpp"
#include"Net/Endpoint.hpp"
#include"Net/Error.hpp"
#include"Net/OpenSslWrapper.hpp"
#include"Net/Stream.hpp"
#include"Util/Str.hpp"
#include"Util/log.hpp"
#include<getopt.h>
#include<iostream>
#include<memory>
#include<signal.h>
#include<stdexcept>
#include<string>

namespace {

void usage(char const* argv0) {
	std::cerr << "Usage: " << argv0
		  << " [--tls] [--insecure] [--timeout=MS] [--bind=ADDR:PORT]"
		  << std::endl
		  << "       [--send=TEXT] [--verbose] PROXY HOST PORT"
		  << std::endl
		  << std::endl
		  << "PROXY is socks5://host:port, http://host:port, or host[:port]"
		  << std::endl
		  << "(SOCKS5, default port 9050)."
		  << std::endl
		  ;
}

struct option const options[] = {
	{"tls", no_argument, nullptr, 't'},
	{"insecure", no_argument, nullptr, 'k'},
	{"timeout", required_argument, nullptr, 'T'},
	{"bind", required_argument, nullptr, 'b'},
	{"send", required_argument, nullptr, 's'},
	{"verbose", no_argument, nullptr, 'v'},
	{"help", no_argument, nullptr, 'h'},
	{nullptr, 0, nullptr, 0}
};

}

int main(int argc, char** argv) {
	/* OpenSSL writes with write(2).  */
	signal(SIGPIPE, SIG_IGN);

	auto tls = false;
	auto insecure = false;
	auto timeout = 30000;
	auto has_bind = false;
	auto bind_s = std::string();
	auto send = std::string();

	for (;;) {
		auto c = getopt_long(argc, argv, "tkT:b:s:vh", options, nullptr);
		if (c == -1)
			break;
		switch (c) {
		case 't': tls = true; break;
		case 'k': insecure = true; break;
		case 'T':
			if (!Util::Str::parse_int(optarg, timeout, 0, 86400000)) {
				std::cerr << "Bad --timeout: " << optarg << std::endl;
				return 2;
			}
			break;
		case 'b': has_bind = true; bind_s = optarg; break;
		case 's': send = optarg; break;
		case 'v': Util::set_log_level(Util::Trace); break;
		case 'h': usage(argv[0]); return 0;
		default: usage(argv[0]); return 2;
		}
	}
	if (argc - optind != 3) {
		usage(argv[0]);
		return 2;
	}
	auto proxy_s = std::string(argv[optind]);
	auto host = std::string(argv[optind + 1]);
	auto port = int();
	if (!Util::Str::parse_int(argv[optind + 2], port, 1, 65535)) {
		std::cerr << "Bad PORT: " << argv[optind + 2] << std::endl;
		return 2;
	}

	auto local = Net::Endpoint();
	auto wrapper = std::shared_ptr<Net::OpenSslWrapper>();
	auto factory = std::unique_ptr<Net::ConnectionFactory>();
	try {
		if (has_bind)
			local = Net::Endpoint::parse(bind_s);
		auto tls_option = Net::TlsOption::none();
		if (tls) {
			wrapper = std::make_shared<Net::OpenSslWrapper>(!insecure);
			tls_option = Net::TlsOption::with(wrapper);
		}
		factory = std::make_unique<Net::ConnectionFactory>(
			Net::ProxyDescriptor::parse(proxy_s),
			std::chrono::milliseconds(timeout),
			tls_option
		);
	} catch (std::invalid_argument const& e) {
		std::cerr << e.what() << std::endl;
		return 2;
	} catch (Net::TlsError const& e) {
		std::cerr << "TLS setup failed: " << e.what() << std::endl;
		return 2;
	}

	auto stream = std::unique_ptr<Net::Stream>();
	try {
		stream = has_bind ? factory->connect(host, port, local)
				  : factory->connect(host, port)
				  ;
		std::cerr << "Connected to " << host << ":" << port
			  << " via " << factory->get_proxy()
			  << " from " << stream->local_endpoint()
			  << (stream->is_secure() ? " (TLS)" : "")
			  << std::endl;

		if (!send.empty())
			stream->write(std::vector<std::uint8_t>( send.begin()
							       , send.end()
							       ));
		for (;;) {
			auto data = stream->read(4096);
			if (data.empty())
				break;
			std::cout.write( reinterpret_cast<char const*>(&data[0])
				       , data.size()
				       );
		}
		std::cout.flush();
		stream->close();
	} catch (Net::ConnectionError const& e) {
		std::cerr << "Connection failed: " << e.what() << std::endl;
		return 1;
	}

	return 0;
}
