#undef NDEBUG
#include"Ln/NodeId.hpp"
#include"Secp256k1/PubKey.hpp"
#include<assert.h>
#include<string>

int main() {
	auto const g = std::string(
		"0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798"
	);
	auto const g2 = std::string(
		"02c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5"
	);
	/* x = 5 has no point on the curve.  */
	auto const off_curve = std::string(
		"020000000000000000000000000000000000000000000000000000000000000005"
	);

	assert(Secp256k1::PubKey::valid_string(g));
	assert(Secp256k1::PubKey::valid_string(g2));
	assert(!Secp256k1::PubKey::valid_string(off_curve));
	assert(!Secp256k1::PubKey::valid_string(g.substr(2)));
	assert(!Secp256k1::PubKey::valid_string("not hex at all"));
	assert(Ln::NodeId::valid_string(off_curve));

	auto pk = Secp256k1::PubKey(g);
	assert(std::string(pk) == g);
	assert(pk == Secp256k1::PubKey(Ln::NodeId(g)));
	assert(pk != Secp256k1::PubKey(g2));

	auto copy = pk;
	copy = Secp256k1::PubKey(g2);
	assert(std::string(copy) == g2);
	assert(std::string(pk) == g);

	auto thrown = false;
	try {
		Secp256k1::PubKey tmp(off_curve);
	} catch (Secp256k1::InvalidPubKey const&) {
		thrown = true;
	}
	assert(thrown);

	return 0;
}
