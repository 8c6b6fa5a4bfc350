#ifndef LN_CHANNELID_HPP
#define LN_CHANNELID_HPP

#include<cstdint>
#include<iostream>
#include<memory>
#include<string>

namespace Ln {

/** class Ln::ChannelId
 *
 * @brief a 32-byte channel identifier.
 *
 * @desc Before funding this is the temporary
 * channel id chosen by the opener, and is what
 * the protocol engine hands back when a channel
 * open is initiated.
 */
class ChannelId {
private:
	struct Impl {
		std::uint8_t data[32];
	};
	std::shared_ptr<Impl const> pimpl;

public:
	ChannelId() =default;
	ChannelId(ChannelId const&) =default;
	ChannelId(ChannelId&&) =default;
	ChannelId& operator=(ChannelId const&) =default;
	ChannelId& operator=(ChannelId&&) =default;
	~ChannelId() =default;

	static
	bool valid_string(std::string const&);
	/* 64 hex digits.  */
	explicit
	ChannelId(std::string const&);
	static
	ChannelId from_buffer(std::uint8_t const data[32]);

	explicit
	operator std::string() const;

	void to_buffer(std::uint8_t data[32]) const;

	explicit
	operator bool() const;
	bool operator!() const { return !bool(*this); }

	bool operator==(ChannelId const&) const;
	bool operator!=(ChannelId const& o) const {
		return !(*this == o);
	}
	bool operator<(ChannelId const&) const;
};

inline
std::ostream& operator<<(std::ostream& os, ChannelId const& i) {
	return os << std::string(i);
}

}

#endif /* !defined(LN_CHANNELID_HPP) */
