#ifndef BITCOIN_TX_HPP
#define BITCOIN_TX_HPP

#include"Bitcoin/TxIn.hpp"
#include"Bitcoin/TxOut.hpp"
#include<iostream>
#include<string>

namespace Bitcoin { class TxId; }

namespace Bitcoin {

/** struct Bitcoin::Tx
 *
 * @brief a complete Bitcoin transaction.
 *
 * @desc Streaming a `Tx` to an `std::ostream`
 * writes its binary consensus serialization,
 * in the segwit form when any input carries a
 * witness.
 */
struct Tx {
	std::uint32_t nVersion;
	std::vector<TxIn> inputs;
	std::vector<TxOut> outputs;
	std::uint32_t nLockTime;

	Tx() : nVersion(2), nLockTime(0) { }

	Bitcoin::TxId get_txid() const;

	/* True if any input signals replaceability.  */
	bool signals_rbf() const;

	/* Hex dump of the full serialization.  */
	explicit
	operator std::string() const;

	bool operator==(Tx const& o) const {
		return nVersion == o.nVersion
		    && inputs == o.inputs
		    && outputs == o.outputs
		    && nLockTime == o.nLockTime
		     ;
	}
	bool operator!=(Tx const& o) const {
		return !(*this == o);
	}
};

std::ostream& operator<<(std::ostream&, Tx const&);

}

#endif /* !defined(BITCOIN_TX_HPP) */
