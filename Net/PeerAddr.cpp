#include"Net/PeerAddr.hpp"
#include<algorithm>
#include<arpa/inet.h>
#include<cctype>
#include<netinet/in.h>

namespace {

bool parse_port(std::string const& s, std::uint16_t& port) {
	if (s.empty() || s.size() > 5)
		return false;
	auto v = std::uint32_t(0);
	for (auto c : s) {
		if (!std::isdigit((unsigned char) c))
			return false;
		v = v * 10 + std::uint32_t(c - '0');
	}
	if (v == 0 || v > 65535)
		return false;
	port = std::uint16_t(v);
	return true;
}

bool looks_numeric(std::string const& s) {
	return std::all_of(s.begin(), s.end(), [](char c) {
		return c == '.' || std::isdigit((unsigned char) c);
	});
}

/* RFC 1123 hostname.  Onion addresses fit this
 * shape as well.  */
bool valid_hostname(std::string const& s) {
	if (s.empty() || s.size() > 253)
		return false;
	auto label_len = std::size_t(0);
	auto prev = '.';
	for (auto c : s) {
		if (c == '.') {
			if (label_len == 0 || prev == '-')
				return false;
			label_len = 0;
		} else if (std::isalnum((unsigned char) c) || c == '-') {
			if (label_len == 0 && c == '-')
				return false;
			if (++label_len > 63)
				return false;
		} else
			return false;
		prev = c;
	}
	return prev != '-' && prev != '.';
}

}

namespace Net {

PeerAddr PeerAddr::parse(std::string const& s) {
	if (s.empty())
		throw PeerAddrError(s, "empty");

	auto host = std::string();
	auto port_str = std::string();
	auto kind = Name;

	if (s[0] == '[') {
		auto close = s.find(']');
		if (close == std::string::npos)
			throw PeerAddrError(s, "unterminated '['");
		if (close + 1 >= s.size() || s[close + 1] != ':')
			throw PeerAddrError(s, "missing port");
		host = s.substr(1, close - 1);
		port_str = s.substr(close + 2);

		struct in6_addr a6;
		if (inet_pton(AF_INET6, host.c_str(), &a6) != 1)
			throw PeerAddrError(s, "bad IPv6 address");
		kind = IPv6;
	} else {
		auto colon = s.rfind(':');
		if (colon == std::string::npos)
			throw PeerAddrError(s, "missing port");
		host = s.substr(0, colon);
		port_str = s.substr(colon + 1);
		if (host.find(':') != std::string::npos)
			throw PeerAddrError(s, "IPv6 addresses need brackets");

		if (looks_numeric(host)) {
			struct in_addr a4;
			if (inet_pton(AF_INET, host.c_str(), &a4) != 1)
				throw PeerAddrError(s, "bad IPv4 address");
			kind = IPv4;
		} else {
			if (!valid_hostname(host))
				throw PeerAddrError(s, "bad hostname");
			kind = Name;
		}
	}

	auto port = std::uint16_t();
	if (!parse_port(port_str, port))
		throw PeerAddrError(s, "bad port");

	return PeerAddr(kind, std::move(host), port);
}

bool PeerAddr::is_onion() const {
	auto const suffix = std::string(".onion");
	return kind_ == Name
	    && host_.size() > suffix.size()
	    && host_.compare( host_.size() - suffix.size(), suffix.size()
			    , suffix
			    ) == 0
	     ;
}

PeerAddr::operator std::string() const {
	if (kind_ == IPv6)
		return "[" + host_ + "]:" + std::to_string(port_);
	return host_ + ":" + std::to_string(port_);
}

}
