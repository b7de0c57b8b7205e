#ifndef UTIL_LOG_HPP
#define UTIL_LOG_HPP

#include<functional>
#include<string>

namespace Util {

enum LogLevel {
	Trace,
	Debug,
	Info,
	Warn,
	Error
};

/* Receives every message, already formatted, regardless
 * of the level set by `set_log_level`.
 */
typedef std::function<void (LogLevel, std::string const&)> LogSink;

void log(LogLevel l, const char *fmt, ...)
#if HAVE_ATTRIBUTE_FORMAT
	__attribute__ ((format (printf, 2, 3)))
#endif
;

/* Replace the process-wide sink.
 * An empty function restores the default sink, which
 * prints to `std::cerr`.
 */
void set_log_sink(LogSink sink);
/* Minimum level printed by the default sink.
 * Initially `Warn`.
 */
void set_log_level(LogLevel l);

char const* log_level_name(LogLevel l);

}

#endif /* !defined(UTIL_LOG_HPP) */
