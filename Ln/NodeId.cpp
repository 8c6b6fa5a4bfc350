#include"Ln/NodeId.hpp"
#include"Util/Str.hpp"
#include<algorithm>
#include<stdexcept>
#include<string.h>

namespace {

std::uint8_t const zero[33] = {0};

bool all_zeros(std::string const& s) {
	return std::all_of( s.begin(), s.end()
			  , [](char c) { return c == '0'; }
			  );
}

}

namespace Ln {

NodeId::NodeId(std::string const& s) {
	if (!valid_string(s))
		throw std::range_error(
			std::string("Ln::NodeId: not node ID: ") + s
		);
	if (all_zeros(s))
		return;

	auto val = Util::Str::hexread(s);
	auto tmp = std::make_shared<Impl>();
	std::copy(val.begin(), val.end(), tmp->raw);
	pimpl = std::move(tmp);
}

bool NodeId::valid_string(std::string const& s) {
	if (s.size() != 66 || !Util::Str::ishex(s))
		return false;
	if (all_zeros(s))
		return true;
	return s[0] == '0' && (s[1] == '2' || s[1] == '3');
}

NodeId::operator std::string() const {
	if (!pimpl)
		return Util::Str::hexdump(zero, sizeof(zero));
	return Util::Str::hexdump(pimpl->raw, sizeof(pimpl->raw));
}

void NodeId::to_buffer(std::uint8_t buffer[33]) const {
	auto src = pimpl ? pimpl->raw : zero;
	std::copy(src, src + 33, buffer);
}

bool NodeId::operator==(NodeId const& o) const {
	if (pimpl == o.pimpl)
		return true;
	auto a = pimpl ? pimpl->raw : zero;
	auto b = o.pimpl ? o.pimpl->raw : zero;
	/* Node IDs are public, so a variable-time
	 * compare is fine.  */
	return memcmp(a, b, 33) == 0;
}
bool NodeId::operator<(NodeId const& o) const {
	auto a = pimpl ? pimpl->raw : zero;
	auto b = o.pimpl ? o.pimpl->raw : zero;
	return memcmp(a, b, 33) < 0;
}

std::ostream& operator<<(std::ostream& os, NodeId const& n) {
	return os << std::string(n);
}

}
