#include"Util/Str.hpp"
#include"Util/log.hpp"
#include<iostream>
#include<mutex>
#include<stdarg.h>

namespace {

std::mutex log_mtx;
Util::LogSink log_sink;
Util::LogLevel log_threshold = Util::Warn;

void default_sink(Util::LogLevel l, std::string const& msg) {
	{
		auto lock = std::unique_lock<std::mutex>(log_mtx);
		if (l < log_threshold)
			return;
	}
	std::cerr << "proxiedsock: " << Util::log_level_name(l)
		  << ": " << msg
		  << std::endl;
}

}

namespace Util {

char const* log_level_name(LogLevel l) {
	switch (l) {
	case Trace: return "trace";
	case Debug: return "debug";
	case Info: return "info";
	case Warn: return "warn";
	case Error: return "error";
	}
	return "unknown";
}

void log(LogLevel l, const char *fmt, ...) {
	va_list ap;

	auto msg = std::string();

	va_start(ap, fmt);
	msg = Util::Str::vfmt(fmt, ap);
	va_end(ap);

	/* Sink is invoked without holding the lock.  */
	auto sink = LogSink();
	{
		auto lock = std::unique_lock<std::mutex>(log_mtx);
		sink = log_sink;
	}
	if (sink)
		sink(l, msg);
	else
		default_sink(l, msg);
}

void set_log_sink(LogSink sink) {
	auto lock = std::unique_lock<std::mutex>(log_mtx);
	log_sink = std::move(sink);
}

void set_log_level(LogLevel l) {
	auto lock = std::unique_lock<std::mutex>(log_mtx);
	log_threshold = l;
}

}
