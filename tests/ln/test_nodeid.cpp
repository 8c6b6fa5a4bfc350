#undef NDEBUG
#include"Ln/ChannelId.hpp"
#include"Ln/NodeId.hpp"
#include<assert.h>
#include<stdexcept>
#include<string>

int main() {
	auto const s = std::string(
		"02c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5"
	);
	assert(Ln::NodeId::valid_string(s));
	assert(!Ln::NodeId::valid_string(s.substr(1)));
	assert(!Ln::NodeId::valid_string("04" + s.substr(2)));
	assert(!Ln::NodeId::valid_string(s.substr(0, 64) + "zz"));

	auto n = Ln::NodeId(s);
	assert(n);
	assert(std::string(n) == s);
	assert(n == Ln::NodeId(s));
	assert(!Ln::NodeId());
	assert(Ln::NodeId() == Ln::NodeId(std::string(66, '0')));
	assert(Ln::NodeId() < n);

	std::uint8_t buf[33];
	n.to_buffer(buf);
	assert(buf[0] == 0x02 && buf[32] == 0xe5);

	auto thrown = false;
	try {
		Ln::NodeId tmp("02");
	} catch (std::range_error const&) {
		thrown = true;
	}
	assert(thrown);

	/* Channel ids.  */
	auto const cs = std::string(64, 'a');
	auto c = Ln::ChannelId(cs);
	assert(c);
	assert(std::string(c) == cs);
	assert(!Ln::ChannelId());
	assert(c != Ln::ChannelId());
	std::uint8_t cbuf[32];
	c.to_buffer(cbuf);
	assert(Ln::ChannelId::from_buffer(cbuf) == c);
	assert(!Ln::ChannelId::valid_string(cs.substr(1)));

	return 0;
}
