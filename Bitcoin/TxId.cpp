#include"Bitcoin/TxId.hpp"
#include<algorithm>

namespace Bitcoin {

TxId::TxId(std::string const& s) : hash(s) { }

TxId TxId::from_digest(Sha256::Hash const& digest) {
	std::uint8_t buf[32];
	digest.to_buffer(buf);
	std::reverse(buf, buf + sizeof(buf));
	auto rv = TxId();
	rv.hash.from_buffer(buf);
	return rv;
}

TxId::operator std::string() const {
	return std::string(hash);
}

void TxId::to_wire(std::uint8_t buf[32]) const {
	hash.to_buffer(buf);
	std::reverse(buf, buf + 32);
}

}
