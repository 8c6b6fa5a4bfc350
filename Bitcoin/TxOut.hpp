#ifndef BITCOIN_TXOUT_HPP
#define BITCOIN_TXOUT_HPP

#include"Ln/Amount.hpp"
#include<cstdint>
#include<utility>
#include<vector>

namespace Bitcoin {

/** struct Bitcoin::TxOut
 *
 * @brief an output: a value in whole satoshis
 * plus the script that locks it.
 */
struct TxOut {
	Ln::Amount amount;
	std::vector<std::uint8_t> scriptPubKey;

	TxOut() =default;
	TxOut( Ln::Amount amount_
	     , std::vector<std::uint8_t> scriptPubKey_
	     ) : amount(amount_)
	       , scriptPubKey(std::move(scriptPubKey_))
	       { }

	bool operator==(TxOut const& o) const {
		return amount == o.amount
		    && scriptPubKey == o.scriptPubKey
		     ;
	}
	bool operator!=(TxOut const& o) const {
		return !(*this == o);
	}
};

}

#endif /* !defined(BITCOIN_TXOUT_HPP) */
