#ifndef BITCOIN_TXID_HPP
#define BITCOIN_TXID_HPP

#include"Sha256/Hash.hpp"
#include<cstdint>
#include<iostream>
#include<string>

namespace Bitcoin {

/** class Bitcoin::TxId
 *
 * @brief identifies a transaction by the
 * double-SHA256 of its non-witness
 * serialization.
 *
 * @desc The string form is byte-reversed
 * relative to the raw digest, matching what
 * block explorers and node RPCs display.
 * The internal hash is stored already
 * reversed.
 */
class TxId {
private:
	Sha256::Hash hash;

public:
	TxId() =default;
	TxId(TxId const&) =default;
	TxId(TxId&&) =default;
	TxId& operator=(TxId const&) =default;
	TxId& operator=(TxId&&) =default;
	~TxId() =default;

	/* Display order.  */
	explicit
	TxId(std::string const& s);
	/* Raw digest order; reverses.  */
	static
	TxId from_digest(Sha256::Hash const& digest);

	explicit
	operator std::string() const;

	/* Serialization order, i.e. raw digest.  */
	void to_wire(std::uint8_t buf[32]) const;

	bool operator==(TxId const& o) const {
		return hash == o.hash;
	}
	bool operator!=(TxId const& o) const {
		return !(*this == o);
	}
	bool operator<(TxId const& o) const {
		return std::string(hash) < std::string(o.hash);
	}
};

inline
std::ostream& operator<<(std::ostream& os, TxId const& i) {
	return os << std::string(i);
}

}

#endif /* !defined(BITCOIN_TXID_HPP) */
