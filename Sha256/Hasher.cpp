#include"Sha256/Hash.hpp"
#include"Sha256/Hasher.hpp"
#include"Util/make_unique.hpp"
#include<sodium/crypto_hash_sha256.h>
#include<sodium/utils.h>
#include<stdexcept>

namespace Sha256 {

class Hasher::Impl {
private:
	crypto_hash_sha256_state s;

public:
	Impl() {
		crypto_hash_sha256_init(&s);
	}
	Impl(Impl const&) =default;
	~Impl() {
		sodium_memzero(&s, sizeof(s));
	}

	void feed(void const* p, std::size_t len) {
		crypto_hash_sha256_update( &s
					 , (unsigned char const*) p
					 , (unsigned long long) len
					 );
	}
	void finalize(std::uint8_t buff[32]) {
		crypto_hash_sha256_final(&s, buff);
	}
};

Hasher::Hasher() : pimpl(Util::make_unique<Impl>()) { }
Hasher::Hasher(Hasher&&) =default;
Hasher::Hasher(Hasher const& o)
	: pimpl(o.pimpl ? Util::make_unique<Impl>(*o.pimpl) : nullptr) { }
Hasher::~Hasher() =default;
Hasher& Hasher::operator=(Hasher&&) =default;

Hasher::operator bool() const {
	return !!pimpl;
}

void Hasher::feed(void const* p, std::size_t len) {
	if (!pimpl)
		throw std::logic_error("Sha256::Hasher: already finalized.");
	pimpl->feed(p, len);
}

Sha256::Hash Hasher::finalize()&& {
	if (!pimpl)
		throw std::logic_error("Sha256::Hasher: already finalized.");
	std::uint8_t buff[32];
	pimpl->finalize(buff);
	pimpl = nullptr;

	auto rv = Sha256::Hash();
	rv.from_buffer(buff);
	sodium_memzero(buff, sizeof(buff));
	return rv;
}

}
