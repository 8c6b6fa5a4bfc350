#include"Util/Str.hpp"
#include"Uuid.hpp"
#include<algorithm>
#include<sodium/randombytes.h>
#include<sodium/utils.h>
#include<stdexcept>

namespace {

std::uint8_t const zero[16] = {0};

}

Uuid Uuid::random() {
	auto impl = std::make_shared<Impl>();
	randombytes_buf(impl->data, sizeof(impl->data));
	auto rv = Uuid();
	rv.pimpl = std::move(impl);
	return rv;
}

Uuid::Uuid(std::string const& s) {
	if (!valid_string(s))
		throw Util::BacktraceException<std::invalid_argument>(
			"Uuid: expected 32 hex digits, got '" + s + "'"
		);
	auto buf = Util::Str::hexread(s);
	auto impl = std::make_shared<Impl>();
	std::copy(buf.begin(), buf.end(), impl->data);
	pimpl = std::move(impl);
}
bool Uuid::valid_string(std::string const& s) {
	return s.size() == 32 && Util::Str::ishex(s);
}
Uuid::operator std::string() const {
	return Util::Str::hexdump(pimpl ? pimpl->data : zero, 16);
}

Uuid::operator bool() const {
	return pimpl && !sodium_is_zero(pimpl->data, 16);
}
bool Uuid::operator==(Uuid const& o) const {
	return sodium_memcmp( pimpl ? pimpl->data : zero
			    , o.pimpl ? o.pimpl->data : zero
			    , 16
			    ) == 0;
}
