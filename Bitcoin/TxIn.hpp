#ifndef BITCOIN_TXIN_HPP
#define BITCOIN_TXIN_HPP

#include"Bitcoin/TxId.hpp"
#include<cstdint>
#include<vector>

namespace Bitcoin {

/* nSequence values.  */
std::uint32_t const sequence_final = 0xFFFFFFFF;
/* Highest nSequence that still signals BIP125
 * replaceability.  */
std::uint32_t const sequence_rbf = 0xFFFFFFFD;

/** struct Bitcoin::TxIn
 *
 * @brief an input, spending output `prevOut`
 * of `prevTxid`.
 *
 * @desc `witness` is the witness stack for this
 * input, bottom first.
 * It is not part of the txid serialization.
 */
struct TxIn {
	Bitcoin::TxId prevTxid;
	std::uint32_t prevOut;
	std::vector<std::uint8_t> scriptSig;
	std::uint32_t nSequence;
	std::vector<std::vector<std::uint8_t>> witness;

	TxIn() : prevOut(0), nSequence(sequence_final) { }

	bool signals_rbf() const {
		return nSequence <= sequence_rbf;
	}

	bool operator==(TxIn const& o) const {
		return prevTxid == o.prevTxid
		    && prevOut == o.prevOut
		    && scriptSig == o.scriptSig
		    && nSequence == o.nSequence
		    && witness == o.witness
		     ;
	}
	bool operator!=(TxIn const& o) const {
		return !(*this == o);
	}
};

}

#endif /* !defined(BITCOIN_TXIN_HPP) */
