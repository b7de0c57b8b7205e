#include"Net/HostAddr.hpp"
#include"Net/IPAddr.hpp"
#include<assert.h>

namespace Net {

class HostAddr::Impl {
private:
	bool is_name_flag;
	std::string name;
	Net::IPAddr ip;

public:
	Impl() : is_name_flag(false), name(), ip() { }
	Impl(Impl const&) =delete;
	Impl(Impl&&) =delete;

	explicit
	Impl(std::string name_) : is_name_flag(true)
				, name(std::move(name_))
				, ip()
				{ }
	explicit
	Impl(Net::IPAddr ip_) : is_name_flag(false)
			      , name()
			      , ip(std::move(ip_))
			      { }

	bool is_name() const {
		return is_name_flag;
	}
	std::string const& get_name() const {
		assert(is_name());
		return name;
	}
	Net::IPAddr const& get_ip() const {
		assert(!is_name());
		return ip;
	}

	bool operator==(Impl const& o) const {
		if (this == &o)
			return true;
		if (is_name_flag != o.is_name_flag)
			return false;
		if (is_name_flag)
			return name == o.name;
		return ip == o.ip;
	}
};

HostAddr::HostAddr() : pimpl(std::make_shared<Impl>()) { }
HostAddr::HostAddr(std::shared_ptr<Impl> pimpl_) : pimpl(std::move(pimpl_)) { }

HostAddr HostAddr::from_name(std::string name) {
	return HostAddr(std::make_shared<Impl>(std::move(name)));
}
HostAddr HostAddr::from_ip_addr(IPAddr ip) {
	return HostAddr(std::make_shared<Impl>(std::move(ip)));
}

void HostAddr::to_ip_addr(IPAddr& ip) const {
	ip = pimpl->get_ip();
}
bool HostAddr::is_name() const {
	return pimpl->is_name();
}
void HostAddr::to_name(std::string& name) const {
	name = pimpl->get_name();
}

std::string HostAddr::identity() const {
	if (pimpl->is_name())
		return pimpl->get_name();
	return pimpl->get_ip().reverse_lookup();
}

HostAddr::operator std::string() const {
	if (pimpl->is_name())
		return pimpl->get_name();
	return std::string(pimpl->get_ip());
}

bool HostAddr::operator==(HostAddr const& o) const {
	return *pimpl == *o.pimpl;
}

}

std::ostream& operator<<(std::ostream& os, Net::HostAddr const& h) {
	return os << std::string(h);
}
