#include"Ln/ChannelId.hpp"
#include"Util/Str.hpp"
#include<algorithm>
#include<stdexcept>
#include<string.h>

namespace {

std::uint8_t const zero[32] = {0};

}

namespace Ln {

bool ChannelId::valid_string(std::string const& s) {
	return s.size() == 64 && Util::Str::ishex(s);
}

ChannelId::ChannelId(std::string const& s) {
	if (!valid_string(s))
		throw std::invalid_argument(
			std::string("Ln::ChannelId: not channel ID: ") + s
		);
	auto bytes = Util::Str::hexread(s);
	auto tmp = std::make_shared<Impl>();
	std::copy(bytes.begin(), bytes.end(), tmp->data);
	pimpl = std::move(tmp);
}

ChannelId ChannelId::from_buffer(std::uint8_t const data[32]) {
	auto tmp = std::make_shared<Impl>();
	std::copy(data, data + 32, tmp->data);
	auto rv = ChannelId();
	rv.pimpl = std::move(tmp);
	return rv;
}

ChannelId::operator std::string() const {
	return Util::Str::hexdump(pimpl ? pimpl->data : zero, 32);
}

void ChannelId::to_buffer(std::uint8_t data[32]) const {
	auto src = pimpl ? pimpl->data : zero;
	std::copy(src, src + 32, data);
}

ChannelId::operator bool() const {
	if (!pimpl)
		return false;
	return memcmp(pimpl->data, zero, 32) != 0;
}

bool ChannelId::operator==(ChannelId const& o) const {
	auto a = pimpl ? pimpl->data : zero;
	auto b = o.pimpl ? o.pimpl->data : zero;
	return memcmp(a, b, 32) == 0;
}
bool ChannelId::operator<(ChannelId const& o) const {
	auto a = pimpl ? pimpl->data : zero;
	auto b = o.pimpl ? o.pimpl->data : zero;
	return memcmp(a, b, 32) < 0;
}

}
