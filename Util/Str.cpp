#include"Util/Str.hpp"
#include<algorithm>
#include<cctype>
#include<stdio.h>

namespace {

char const hexdigits[] = "0123456789abcdef";

std::uint8_t parse_nibble(char c) {
	if ('0' <= c && c <= '9')
		return std::uint8_t(c - '0');
	if ('a' <= c && c <= 'f')
		return std::uint8_t(c - 'a' + 10);
	if ('A' <= c && c <= 'F')
		return std::uint8_t(c - 'A' + 10);
	throw Util::Str::HexParseFailure(
		std::string("Non-hex character: ") + std::string(1, c)
	);
}

}

namespace Util {
namespace Str {

std::string hexbyte(std::uint8_t v) {
	auto rv = std::string(2, '0');
	rv[0] = hexdigits[(v >> 4) & 0xF];
	rv[1] = hexdigits[v & 0xF];
	return rv;
}

std::string hexdump(void const* vp, std::size_t s) {
	auto p = (std::uint8_t const*) vp;
	auto rv = std::string();
	rv.reserve(s * 2);
	for (auto i = std::size_t(0); i < s; ++i)
		rv += hexbyte(p[i]);
	return rv;
}

std::vector<std::uint8_t> hexread(std::string const& s) {
	if ((s.length() % 2) != 0)
		throw HexParseFailure("String length must be even.");

	auto buf = std::vector<std::uint8_t>(s.length() / 2);
	for (auto i = std::size_t(0); i < buf.size(); ++i)
		buf[i] = (parse_nibble(s[i * 2]) << 4)
		       | parse_nibble(s[i * 2 + 1])
		       ;
	return buf;
}

bool ishex(std::string const& s) {
	if ((s.size() % 2) != 0)
		return false;
	return std::all_of(s.begin(), s.end(), [](char c) {
		return isxdigit((unsigned char) c) != 0;
	});
}

std::string trim(std::string const& s) {
	auto is_space = [](char c) {
		return isspace((unsigned char) c) != 0;
	};
	auto start = std::find_if_not(s.begin(), s.end(), is_space);
	if (start == s.end())
		return "";
	auto end = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
	return std::string(start, end);
}

std::string fmt(char const *tpl, ...) {
	va_list ap;
	va_start(ap, tpl);
	auto rv = vfmt(tpl, ap);
	va_end(ap);
	return rv;
}

std::string vfmt(char const *tpl, va_list ap) {
	va_list ap2;
	va_copy(ap2, ap);
	auto len = vsnprintf(nullptr, 0, tpl, ap2);
	va_end(ap2);
	if (len < 0)
		return std::string(tpl);

	auto buf = std::vector<char>(std::size_t(len) + 1);
	vsnprintf(&buf[0], buf.size(), tpl, ap);
	return std::string(&buf[0], std::size_t(len));
}

}
}
