#include"Ln/NodeId.hpp"
#include"Secp256k1/Detail/context.hpp"
#include"Secp256k1/PubKey.hpp"
#include"Util/Str.hpp"
#include"Util/make_unique.hpp"
#include<secp256k1.h>
#include<sodium/utils.h>

using Secp256k1::Detail::context;

namespace Secp256k1 {

class PubKey::Impl {
public:
	secp256k1_pubkey key;

	explicit
	Impl(std::uint8_t const buffer[33]) {
		auto res = secp256k1_ec_pubkey_parse( context.get()
						    , &key
						    , buffer
						    , 33
						    );
		if (!res)
			throw InvalidPubKey();
	}
	Impl(Impl const&) =default;

	void serialize(std::uint8_t buffer[33]) const {
		auto size = std::size_t(33);
		auto res = secp256k1_ec_pubkey_serialize( context.get()
							, buffer
							, &size
							, &key
							, SECP256K1_EC_COMPRESSED
							);
		if (!res || size != 33)
			throw std::logic_error("secp256k1: serialize failed.");
	}
};

PubKey::PubKey(std::uint8_t const buffer[33])
	: pimpl(Util::make_unique<Impl>(buffer)) { }
PubKey::PubKey(std::string const& s) {
	if (s.size() != 66 || !Util::Str::ishex(s))
		throw InvalidPubKey();
	auto buf = Util::Str::hexread(s);
	pimpl = Util::make_unique<Impl>(&buf[0]);
}
PubKey::PubKey(Ln::NodeId const& n) {
	std::uint8_t buf[33];
	n.to_buffer(buf);
	pimpl = Util::make_unique<Impl>(buf);
}

PubKey::PubKey(PubKey const& o)
	: pimpl(Util::make_unique<Impl>(*o.pimpl)) { }
PubKey::PubKey(PubKey&& o) : pimpl(std::move(o.pimpl)) { }
PubKey::~PubKey() { }

void PubKey::to_buffer(std::uint8_t buffer[33]) const {
	pimpl->serialize(buffer);
}
PubKey::operator std::string() const {
	std::uint8_t buf[33];
	to_buffer(buf);
	return Util::Str::hexdump(buf, sizeof(buf));
}

bool PubKey::operator==(PubKey const& o) const {
	std::uint8_t a[33];
	std::uint8_t b[33];
	to_buffer(a);
	o.to_buffer(b);
	return sodium_memcmp(a, b, sizeof(a)) == 0;
}

bool PubKey::valid_string(std::string const& s) {
	try {
		PubKey tmp(s);
		return true;
	} catch (InvalidPubKey const&) {
		return false;
	}
}

}
