#include"Doubles.hpp"
#include<arpa/inet.h>
#include<chrono>
#include<cstdint>
#include<errno.h>
#include<netinet/in.h>
#include<openssl/err.h>
#include<openssl/evp.h>
#include<openssl/pem.h>
#include<openssl/ssl.h>
#include<openssl/x509.h>
#include<openssl/x509v3.h>
#include<poll.h>
#include<stdexcept>
#include<stdlib.h>
#include<string.h>
#include<sys/socket.h>
#include<unistd.h>

namespace Doubles {

Net::Fd listen_loopback(int& port) {
	auto fd = Net::Fd(socket(AF_INET, SOCK_STREAM, 0));
	if (!fd)
		throw std::runtime_error("socket");
	auto one = int(1);
	(void) setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

	auto sin = sockaddr_in();
	memset(&sin, 0, sizeof(sin));
	sin.sin_family = AF_INET;
	sin.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
	sin.sin_port = 0;
	if (bind(fd.get(), reinterpret_cast<sockaddr*>(&sin), sizeof(sin)) < 0)
		throw std::runtime_error("bind");
	if (listen(fd.get(), 64) < 0)
		throw std::runtime_error("listen");

	auto len = socklen_t(sizeof(sin));
	if (getsockname(fd.get(), reinterpret_cast<sockaddr*>(&sin), &len) < 0)
		throw std::runtime_error("getsockname");
	port = int(ntohs(sin.sin_port));
	return fd;
}

int dead_port() {
	auto port = int();
	auto fd = listen_loopback(port);
	return port;
}

bool recv_exact(int fd, void* p, std::size_t size) {
	auto q = static_cast<char*>(p);
	while (size > 0) {
		auto res = recv(fd, q, size, 0);
		if (res < 0 && errno == EINTR)
			continue;
		if (res <= 0)
			return false;
		q += res;
		size -= std::size_t(res);
	}
	return true;
}
bool send_all(int fd, void const* p, std::size_t size) {
	auto q = static_cast<char const*>(p);
	while (size > 0) {
		auto res = send(fd, q, size, MSG_NOSIGNAL);
		if (res < 0 && errno == EINTR)
			continue;
		if (res <= 0)
			return false;
		q += res;
		size -= std::size_t(res);
	}
	return true;
}
void drain(int fd) {
	char buf[256];
	for (;;) {
		auto res = recv(fd, buf, sizeof(buf), 0);
		if (res < 0 && errno == EINTR)
			continue;
		if (res <= 0)
			return;
	}
}

void relay(int a, int b) {
	char buf[4096];
	for (;;) {
		pollfd pfd[2];
		pfd[0].fd = a;
		pfd[0].events = POLLIN;
		pfd[0].revents = 0;
		pfd[1].fd = b;
		pfd[1].events = POLLIN;
		pfd[1].revents = 0;
		auto res = poll(pfd, 2, -1);
		if (res < 0 && errno == EINTR)
			continue;
		if (res < 0)
			return;
		for (auto i = 0; i < 2; ++i) {
			if (pfd[i].revents == 0)
				continue;
			auto from = pfd[i].fd;
			auto to = (i == 0) ? b : a;
			auto n = recv(from, buf, sizeof(buf), 0);
			if (n <= 0)
				return;
			if (!send_all(to, buf, std::size_t(n)))
				return;
		}
	}
}

/*-----------------------------------------------------------------------------
Server
-----------------------------------------------------------------------------*/

Server::Server() : listener()
		 , port_(0)
		 , acceptor()
		 , mtx()
		 , workers()
		 , live()
		 , stopping(false)
		 , opened_(0)
		 , closed_(0)
		 , last_peer_port_(0) {
	listener = listen_loopback(port_);
}
Server::~Server() {
	stop();
}

void Server::start() {
	acceptor = std::thread([this]() { accept_loop(); });
}

void Server::stop() {
	if (stopping.exchange(true))
		return;
	(void) shutdown(listener.get(), SHUT_RDWR);
	if (acceptor.joinable())
		acceptor.join();

	auto to_join = std::vector<std::thread>();
	{
		std::lock_guard<std::mutex> lock(mtx);
		for (auto fd : live)
			(void) shutdown(fd, SHUT_RDWR);
		to_join.swap(workers);
	}
	for (auto& t : to_join)
		t.join();
}

void Server::accept_loop() {
	for (;;) {
		auto peer = sockaddr_in();
		auto len = socklen_t(sizeof(peer));
		auto fd = accept( listener.get()
				, reinterpret_cast<sockaddr*>(&peer), &len
				);
		if (stopping) {
			if (fd >= 0)
				::close(fd);
			return;
		}
		if (fd < 0)
			continue;

		last_peer_port_ = int(ntohs(peer.sin_port));
		++opened_;
		std::lock_guard<std::mutex> lock(mtx);
		live.insert(fd);
		workers.emplace_back([this, fd]() {
			serve(fd);
			{
				std::lock_guard<std::mutex> lock(mtx);
				live.erase(fd);
				::close(fd);
			}
			++closed_;
		});
	}
}

/*-----------------------------------------------------------------------------
Target
-----------------------------------------------------------------------------*/

Target::Target(TargetMode mode_) : mode(mode_) {
	start();
}
Target::~Target() {
	stop();
}

void Target::serve(int fd) {
	if (mode == Hangup)
		return;
	char buf[4096];
	for (;;) {
		auto n = recv(fd, buf, sizeof(buf), 0);
		if (n <= 0)
			return;
		if (!send_all(fd, buf, std::size_t(n)))
			return;
	}
}

/*-----------------------------------------------------------------------------
Proxy
-----------------------------------------------------------------------------*/

namespace {

/* Connect to 127.0.0.1:port.  */
Net::Fd connect_loopback(int port) {
	auto fd = Net::Fd(socket(AF_INET, SOCK_STREAM, 0));
	if (!fd)
		return fd;
	auto sin = sockaddr_in();
	memset(&sin, 0, sizeof(sin));
	sin.sin_family = AF_INET;
	sin.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
	sin.sin_port = htons(std::uint16_t(port));
	if (connect(fd.get(), reinterpret_cast<sockaddr*>(&sin), sizeof(sin)) < 0)
		return Net::Fd();
	return fd;
}

bool send_str(int fd, std::string const& s) {
	return send_all(fd, s.data(), s.size());
}

}

Proxy::Proxy( Net::ProxyKind kind_
	    , ProxyMode mode_
	    , int delay_ms_
	    ) : kind(kind_)
	      , mode(mode_)
	      , delay_ms(delay_ms_)
	      , record_mtx()
	      , last_host_()
	      , last_port_(0)
	      , last_atyp_(0) {
	start();
}
Proxy::~Proxy() {
	stop();
}

Net::ProxyDescriptor Proxy::descriptor() const {
	return Net::ProxyDescriptor(kind, "127.0.0.1", port());
}

std::string Proxy::last_host() {
	std::lock_guard<std::mutex> lock(record_mtx);
	return last_host_;
}
int Proxy::last_port() {
	std::lock_guard<std::mutex> lock(record_mtx);
	return last_port_;
}
int Proxy::last_atyp() {
	std::lock_guard<std::mutex> lock(record_mtx);
	return last_atyp_;
}
void Proxy::record(std::string host, int port, int atyp) {
	std::lock_guard<std::mutex> lock(record_mtx);
	last_host_ = std::move(host);
	last_port_ = port;
	last_atyp_ = atyp;
}

void Proxy::pause() {
	if (mode != Delay)
		return;
	for (auto waited = 0; waited < delay_ms && !is_stopping(); waited += 10)
		std::this_thread::sleep_for(std::chrono::milliseconds(10));
}

void Proxy::serve(int fd) {
	if (kind == Net::Socks5)
		serve_socks5(fd);
	else
		serve_http(fd);
}

void Proxy::serve_socks5(int fd) {
	std::uint8_t hdr[2];
	if (!recv_exact(fd, hdr, 2) || hdr[0] != 0x05)
		return;
	auto methods = std::vector<std::uint8_t>(hdr[1]);
	if (!methods.empty() && !recv_exact(fd, &methods[0], methods.size()))
		return;
	if (mode == Silent) {
		drain(fd);
		return;
	}
	pause();
	std::uint8_t const choice[] = {0x05, 0x00};
	if (!send_all(fd, choice, sizeof(choice)))
		return;

	std::uint8_t req[4];
	if (!recv_exact(fd, req, 4))
		return;
	auto atyp = int(req[3]);
	auto host = std::string();
	if (atyp == 0x01 || atyp == 0x04) {
		auto family = (atyp == 0x01) ? AF_INET : AF_INET6;
		std::uint8_t raw[16];
		if (!recv_exact(fd, raw, atyp == 0x01 ? 4 : 16))
			return;
		char buf[INET6_ADDRSTRLEN];
		if (!inet_ntop(family, raw, buf, sizeof(buf)))
			return;
		host = buf;
	} else if (atyp == 0x03) {
		std::uint8_t len;
		if (!recv_exact(fd, &len, 1))
			return;
		host.resize(len);
		if (len > 0 && !recv_exact(fd, &host[0], len))
			return;
	} else
		return;
	std::uint8_t port_b[2];
	if (!recv_exact(fd, port_b, 2))
		return;
	auto port = (int(port_b[0]) << 8) | int(port_b[1]);
	record(host, port, atyp);

	std::uint8_t reply[] = {0x05, 0x00, 0x00, 0x01, 127, 0, 0, 1, 0, 0};
	if (mode == Refuse) {
		reply[1] = 0x02;
		(void) send_all(fd, reply, sizeof(reply));
		drain(fd);
		return;
	}
	auto out = connect_loopback(port);
	if (!out) {
		reply[1] = 0x05;
		(void) send_all(fd, reply, sizeof(reply));
		drain(fd);
		return;
	}
	if (!send_all(fd, reply, sizeof(reply)))
		return;
	relay(fd, out.get());
}

void Proxy::serve_http(int fd) {
	auto head = std::string();
	while (head.size() < 8192) {
		char c;
		if (!recv_exact(fd, &c, 1))
			return;
		head.push_back(c);
		if ( head.size() >= 4
		  && head.compare(head.size() - 4, 4, "\r\n\r\n") == 0
		   )
			break;
	}
	if (mode == Silent) {
		drain(fd);
		return;
	}
	pause();

	/* CONNECT host:port HTTP/1.1 */
	auto line = head.substr(0, head.find("\r\n"));
	auto sp1 = line.find(' ');
	auto sp2 = line.rfind(' ');
	if (sp1 == std::string::npos || sp2 == sp1)
		return;
	auto authority = line.substr(sp1 + 1, sp2 - sp1 - 1);
	auto colon = authority.rfind(':');
	if (line.substr(0, sp1) != "CONNECT" || colon == std::string::npos) {
		(void) send_str(fd, "HTTP/1.1 400 Bad Request\r\n\r\n");
		return;
	}
	auto host = authority.substr(0, colon);
	if (host.size() >= 2 && host[0] == '[')
		host = host.substr(1, host.size() - 2);
	auto port = atoi(authority.substr(colon + 1).c_str());
	record(host, port, 0);

	if (mode == Refuse) {
		(void) send_str(fd, "HTTP/1.1 403 Forbidden\r\n"
				    "Content-Length: 0\r\n"
				    "\r\n");
		drain(fd);
		return;
	}
	auto out = connect_loopback(port);
	if (!out) {
		(void) send_str(fd, "HTTP/1.1 502 Bad Gateway\r\n\r\n");
		drain(fd);
		return;
	}
	if (!send_str(fd, "HTTP/1.1 200 Connection established\r\n"
			  "Proxy-Agent: doubles\r\n"
			  "\r\n"))
		return;
	relay(fd, out.get());
}

/*-----------------------------------------------------------------------------
TlsTarget
-----------------------------------------------------------------------------*/

class TlsTarget::Impl {
public:
	EVP_PKEY* key;
	X509* cert;
	SSL_CTX* ctx;
	std::string pem;
	std::atomic<int> handshakes;

	Impl() : key(nullptr), cert(nullptr), ctx(nullptr), pem(), handshakes(0) {
		key = EVP_EC_gen("P-256");
		if (!key)
			throw std::runtime_error("EVP_EC_gen");

		cert = X509_new();
		X509_set_version(cert, 2);
		ASN1_INTEGER_set(X509_get_serialNumber(cert), 1);
		X509_gmtime_adj(X509_getm_notBefore(cert), -3600);
		X509_gmtime_adj(X509_getm_notAfter(cert), 86400);
		X509_set_pubkey(cert, key);
		auto name = X509_get_subject_name(cert);
		X509_NAME_add_entry_by_txt( name, "CN", MBSTRING_ASC
					  , reinterpret_cast<unsigned char const*>("localhost")
					  , -1, -1, 0
					  );
		X509_set_issuer_name(cert, name);

		auto v3 = X509V3_CTX();
		X509V3_set_ctx_nodb(&v3);
		X509V3_set_ctx(&v3, cert, cert, nullptr, nullptr, 0);
		auto san = X509V3_EXT_conf_nid( nullptr, &v3, NID_subject_alt_name
					      , "DNS:localhost,IP:127.0.0.1"
					      );
		if (!san)
			throw std::runtime_error("subjectAltName");
		X509_add_ext(cert, san, -1);
		X509_EXTENSION_free(san);

		if (!X509_sign(cert, key, EVP_sha256()))
			throw std::runtime_error("X509_sign");

		auto bio = BIO_new(BIO_s_mem());
		PEM_write_bio_X509(bio, cert);
		BUF_MEM* mem = nullptr;
		BIO_get_mem_ptr(bio, &mem);
		pem.assign(mem->data, mem->length);
		BIO_free(bio);

		ctx = SSL_CTX_new(TLS_server_method());
		if ( !ctx
		  || !SSL_CTX_use_certificate(ctx, cert)
		  || !SSL_CTX_use_PrivateKey(ctx, key)
		   )
			throw std::runtime_error("server SSL_CTX");
	}
	~Impl() {
		SSL_CTX_free(ctx);
		X509_free(cert);
		EVP_PKEY_free(key);
	}
};

TlsTarget::TlsTarget() : pimpl(std::make_unique<Impl>()) {
	start();
}
TlsTarget::~TlsTarget() {
	stop();
}

std::string TlsTarget::cert_pem() const {
	return pimpl->pem;
}
int TlsTarget::handshakes() const {
	return pimpl->handshakes;
}

void TlsTarget::serve(int fd) {
	auto ssl = SSL_new(pimpl->ctx);
	if (!ssl)
		return;
	SSL_set_fd(ssl, fd);
	if (SSL_accept(ssl) != 1) {
		ERR_clear_error();
		SSL_free(ssl);
		return;
	}
	++pimpl->handshakes;
	char buf[4096];
	for (;;) {
		auto n = SSL_read(ssl, buf, sizeof(buf));
		if (n <= 0)
			break;
		if (SSL_write(ssl, buf, n) <= 0)
			break;
	}
	(void) SSL_shutdown(ssl);
	ERR_clear_error();
	SSL_free(ssl);
}

}
