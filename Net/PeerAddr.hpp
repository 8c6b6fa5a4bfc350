#ifndef NET_PEERADDR_HPP
#define NET_PEERADDR_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<ostream>
#include<stdexcept>
#include<string>

namespace Net {

/** class Net::PeerAddrError
 *
 * @brief thrown when a `host:port` string
 * cannot be parsed.
 */
class PeerAddrError : public Util::BacktraceException<std::invalid_argument> {
public:
	std::string input;
	PeerAddrError( std::string const& input_
		     , std::string const& why
		     ) : Util::BacktraceException<std::invalid_argument>(
				"Invalid peer address '" + input_ + "': " + why
			 )
		       , input(input_)
		       { }
};

/** class Net::PeerAddr
 *
 * @brief a network location to dial a peer at.
 *
 * @desc Accepted forms are `a.b.c.d:port`,
 * `[ipv6]:port` and `name:port`, where a name is
 * a DNS hostname or a `.onion` address.
 * Ports are decimal in 1..65535.
 * Parsing is purely syntactic; no resolution is
 * done here.
 */
class PeerAddr {
public:
	enum Kind { IPv4, IPv6, Name };

private:
	Kind kind_;
	std::string host_;
	std::uint16_t port_;

	PeerAddr(Kind k, std::string h, std::uint16_t p)
		: kind_(k), host_(std::move(h)), port_(p) { }

public:
	PeerAddr() =delete;
	PeerAddr(PeerAddr const&) =default;
	PeerAddr(PeerAddr&&) =default;
	PeerAddr& operator=(PeerAddr const&) =default;
	PeerAddr& operator=(PeerAddr&&) =default;

	/* Throws PeerAddrError.  */
	static
	PeerAddr parse(std::string const&);

	Kind kind() const { return kind_; }
	/* Without brackets for IPv6.  */
	std::string const& host() const { return host_; }
	std::uint16_t port() const { return port_; }
	bool is_onion() const;

	explicit
	operator std::string() const;

	bool operator==(PeerAddr const& o) const {
		return kind_ == o.kind_
		    && host_ == o.host_
		    && port_ == o.port_
		     ;
	}
	bool operator!=(PeerAddr const& o) const {
		return !(*this == o);
	}
};

inline
std::ostream& operator<<(std::ostream& os, PeerAddr const& a) {
	return os << std::string(a);
}

}

#endif /* !defined(NET_PEERADDR_HPP) */
