#ifndef UTIL_STR_HPP
#define UTIL_STR_HPP

/*
 * Minor string utilities.
 */

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdarg.h>
#include<stdexcept>
#include<string>
#include<vector>

namespace Util {
namespace Str {

/* Two-digit lowercase hex of a byte.  */
std::string hexbyte(std::uint8_t);
/* Hex string of a buffer.  */
std::string hexdump(void const* p, std::size_t s);

struct HexParseFailure : public Util::BacktraceException<std::runtime_error> {
	HexParseFailure(std::string msg)
		: Util::BacktraceException<std::runtime_error>("hexread: " + msg) { }
};
/* Parses an even-length hex string into bytes.  */
std::vector<std::uint8_t> hexread(std::string const&);

/* Even number of hex digits, nothing else.  */
bool ishex(std::string const&);

std::string trim(std::string const& s);

/* Like `sprintf`, but into a `std::string`.  */
std::string fmt(char const *tpl, ...)
#if defined(__GNUC__)
	__attribute__ ((format (printf, 1, 2)))
#endif
;
std::string vfmt(char const *tpl, va_list ap);

}}

#endif /* !defined(UTIL_STR_HPP) */
