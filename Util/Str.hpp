#ifndef UTIL_STR_HPP
#define UTIL_STR_HPP

/*
 * Minor string utilities.
 */

#include<stdarg.h>
#include<string>

namespace Util {
namespace Str {

std::string trim(std::string const& s);

/* ASCII-only lowercase, for scheme and header names.  */
std::string to_lower(std::string s);

/* Parse a decimal integer that must make up the entire
 * string and lie within [min, max].
 * Return false if not.
 */
bool parse_int(std::string const& s, int& out, int min, int max);

/* Like `sprintf`.  */
std::string fmt(char const *tpl, ...)
#if HAVE_ATTRIBUTE_FORMAT
	__attribute__ ((format (printf, 1, 2)))
#endif
;
std::string vfmt(char const *tpl, va_list ap);

}}

#endif /* !defined(UTIL_STR_HPP) */
