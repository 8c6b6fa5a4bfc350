#ifndef SECP256K1_PUBKEY_HPP
#define SECP256K1_PUBKEY_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<memory>
#include<ostream>
#include<stdexcept>
#include<string>

namespace Ln { class NodeId; }

namespace Secp256k1 {

/* Thrown when bytes do not encode a point on
 * the curve.  */
class InvalidPubKey : public Util::BacktraceException<std::invalid_argument> {
public:
	InvalidPubKey()
		: Util::BacktraceException<std::invalid_argument>(
			"Invalid public key."
		  ) { }
};

/** class Secp256k1::PubKey
 *
 * @brief a point on secp256k1, parsed from its
 * 33-byte compressed encoding.
 */
class PubKey {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	/* Throws InvalidPubKey.  */
	explicit PubKey(std::uint8_t const buffer[33]);
	explicit PubKey(std::string const&);
	explicit PubKey(Ln::NodeId const&);

	PubKey(PubKey const&);
	PubKey(PubKey&&);
	~PubKey();

	PubKey& operator=(PubKey const& o) {
		auto tmp = PubKey(o);
		tmp.pimpl.swap(pimpl);
		return *this;
	}
	PubKey& operator=(PubKey&& o) {
		auto tmp = PubKey(std::move(o));
		tmp.pimpl.swap(pimpl);
		return *this;
	}

	/* Compressed form.  */
	void to_buffer(std::uint8_t buffer[33]) const;
	explicit operator std::string() const;

	bool operator==(PubKey const&) const;
	bool operator!=(PubKey const& o) const {
		return !(*this == o);
	}

	/* Whether the string is 66 hex digits that
	 * decode to a point on the curve.  */
	static
	bool valid_string(std::string const&);
};

inline
std::ostream& operator<<(std::ostream& os, PubKey const& pk) {
	return os << std::string(pk);
}

}

#endif /* !defined(SECP256K1_PUBKEY_HPP) */
