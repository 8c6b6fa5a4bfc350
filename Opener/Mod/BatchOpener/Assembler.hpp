#ifndef OPENER_MOD_BATCHOPENER_ASSEMBLER_HPP
#define OPENER_MOD_BATCHOPENER_ASSEMBLER_HPP

#include"Opener/Mod/BatchOpener/Correlator.hpp"
#include<vector>

namespace Bitcoin { struct Tx; }
namespace Ev { class Semaphore; }
namespace Ev { template<typename a> class Io; }
namespace Opener { class FeeEstimatorIF; }
namespace Opener { class WalletIF; }
namespace S { class Bus; }

namespace Opener { namespace Mod { namespace BatchOpener {

/** class Opener::Mod::BatchOpener::Assembler
 *
 * @brief builds and signs the one funding
 * transaction shared by a batch.
 *
 * @desc The transaction has one recipient per
 * event, with the event's value and script, at
 * the normal-target fee rate and signalling RBF.
 * Everything from the fee lookup to the end of
 * signing holds `wallet_lock`, so that two
 * batches never select coins at the same time.
 * Throws `Opener::WalletError` if the wallet
 * fails or leaves the transaction unfinalized,
 * and also when the fee estimator throws
 * `Opener::FeeEstimateError`.
 */
class Assembler {
private:
	S::Bus& bus;
	Opener::WalletIF& wallet;
	Opener::FeeEstimatorIF& fees;
	Ev::Semaphore& wallet_lock;

public:
	Assembler() =delete;
	Assembler(Assembler const&) =delete;

	Assembler( S::Bus& bus_
		 , Opener::WalletIF& wallet_
		 , Opener::FeeEstimatorIF& fees_
		 , Ev::Semaphore& wallet_lock_
		 ) : bus(bus_)
		   , wallet(wallet_)
		   , fees(fees_)
		   , wallet_lock(wallet_lock_)
		   { }

	Ev::Io<Bitcoin::Tx> assemble(std::vector<FundingEvent> const& events);
};

}}}

#endif /* !defined(OPENER_MOD_BATCHOPENER_ASSEMBLER_HPP) */
