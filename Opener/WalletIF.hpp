#ifndef OPENER_WALLETIF_HPP
#define OPENER_WALLETIF_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Bitcoin { struct Tx; }
namespace Opener { struct FundingDraft; }

namespace Opener {

/* Thrown when the wallet cannot fund or sign.  */
class WalletError : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	WalletError(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(msg) { }
};

/** class Opener::WalletIF
 *
 * @brief the on-chain wallet.
 *
 * @desc Synchronous.
 * Callers serialize access; see
 * `Opener::Mod::BatchOpener::Assembler`.
 */
class WalletIF {
public:
	virtual ~WalletIF() { }

	/* Selects inputs and adds change.  The
	 * recipients appear as outputs with their
	 * exact amounts and scripts.  */
	virtual
	Bitcoin::Tx build(FundingDraft const&) =0;
	/* Signs with the default policy.  Returns
	 * whether every input is now finalized.  */
	virtual
	bool sign(Bitcoin::Tx&) =0;
};

}

#endif /* !defined(OPENER_WALLETIF_HPP) */
