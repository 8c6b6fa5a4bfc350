#include"Sha256/Hash.hpp"
#include"Util/Str.hpp"
#include<algorithm>
#include<sodium/utils.h>
#include<stdexcept>

namespace {

std::uint8_t const zero[32] = {0};

}

namespace Sha256 {

bool Hash::valid_string(std::string const& s) {
	return s.size() == 64 && Util::Str::ishex(s);
}
Hash::Hash(std::string const& s) {
	if (!valid_string(s))
		throw Util::BacktraceException<std::invalid_argument>(
			"Sha256::Hash: hashes must be 64 hex digits."
		);
	auto bytes = Util::Str::hexread(s);
	pimpl = std::make_shared<Impl>();
	std::copy(bytes.begin(), bytes.end(), pimpl->d);
}

Hash::operator std::string() const {
	return Util::Str::hexdump(pimpl ? pimpl->d : zero, 32);
}
Hash::operator bool() const {
	if (!pimpl)
		return false;
	return !sodium_is_zero(pimpl->d, 32);
}
bool Hash::operator==(Hash const& i) const {
	auto a = pimpl ? pimpl->d : zero;
	auto b = i.pimpl ? i.pimpl->d : zero;
	return sodium_memcmp(a, b, 32) == 0;
}

void Hash::to_buffer(std::uint8_t d[32]) const {
	auto src = pimpl ? pimpl->d : zero;
	std::copy(src, src + 32, d);
}
void Hash::from_buffer(std::uint8_t const d[32]) {
	/* Hashes share their Impl on copy, so never
	 * write through an existing one.  */
	auto tmp = std::make_shared<Impl>();
	std::copy(d, d + 32, tmp->d);
	pimpl = std::move(tmp);
}

}
