#ifndef OPENER_MOD_BATCHOPENER_MAIN_HPP
#define OPENER_MOD_BATCHOPENER_MAIN_HPP

#include"Ev/Semaphore.hpp"
#include"Ln/NodeId.hpp"
#include"Opener/Mod/BatchOpener/Assembler.hpp"
#include"Opener/Mod/BatchOpener/Correlator.hpp"
#include"Opener/Mod/BatchOpener/Dispatcher.hpp"
#include"Opener/Mod/BatchOpener/Initiator.hpp"
#include"Opener/OpenError.hpp"
#include"Opener/Options.hpp"
#include"S/Tap.hpp"
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Opener { class DebouncerIF; }
namespace Opener { class FeeEstimatorIF; }
namespace Opener { class PeerConnectorIF; }
namespace Opener { class ProtocolEngineIF; }
namespace Opener { class WalletIF; }
namespace Opener { namespace Mod { class Waiter; }}
namespace S { class Bus; }

namespace Opener { namespace Mod { namespace BatchOpener {

/* Marks each request whose supplied
 * user_channel_id already appears on an earlier
 * request.  The first request with an id keeps
 * it; the later ones fail with
 * `DuplicateUserChannelId` without being
 * initiated.  */
std::vector<bool>
find_duplicate_user_channel_ids(std::vector<OpenChannelRequest> const& requests);

/* Gives every request without a user_channel_id
 * a random non-zero one, distinct from every
 * other id in the batch.  Requests that have one
 * keep it.  */
void assign_user_channel_ids(std::vector<OpenChannelRequest>& requests);

/** class Opener::Mod::BatchOpener::Main
 *
 * @brief opens a batch of channels funded by a
 * single transaction.
 *
 * @desc `open_batch`:
 *
 * 1.  Rejects repeated user_channel_ids and
 *     assigns missing ones.
 * 2.  Initiates each request in order.
 * 3.  Waits, up to `funding_timeout`, for the
 *     funding-ready event of every initiated
 *     request.
 * 4.  Requests whose event never came fail with
 *     `FundingNeverHappened`.
 *     If none are left, it stops here.
 * 5.  Builds and signs one transaction paying all
 *     of them.  If that fails, all of them fail
 *     with `FundingTxFailed`.
 * 6.  Tells the debouncer how many completions to
 *     expect for the txid.
 * 7.  Hands the transaction to the protocol
 *     engine for each of them.
 *
 * The result always has one entry per request,
 * in request order, paired with the request as
 * updated by step 1.
 * Concurrent batches are allowed; only step 5 is
 * serialized.
 */
class Main {
private:
	S::Bus& bus;
	Opener::Mod::Waiter& waiter;
	Opener::DebouncerIF& debouncer;
	Ln::NodeId local_node;
	double funding_timeout;
	double poll_interval;

	S::Tap<FundingEvent> tap;
	Ev::Semaphore wallet_lock;
	Initiator initiator;
	Assembler assembler;
	Dispatcher dispatcher;

public:
	Main() =delete;
	Main(Main const&) =delete;

	Main( S::Bus& bus_
	    , Opener::Mod::Waiter& waiter_
	    , Opener::PeerConnectorIF& peers
	    , Opener::ProtocolEngineIF& engine
	    , Opener::WalletIF& wallet
	    , Opener::FeeEstimatorIF& fees
	    , Opener::DebouncerIF& debouncer_
	    , Ln::NodeId local_node_
	    , double funding_timeout_ = 30.0
	    , double poll_interval_ = 0.5
	    );
	/* Takes the timeout and poll interval from
	 * the `--opener-*` settings.  */
	Main( S::Bus& bus_
	    , Opener::Mod::Waiter& waiter_
	    , Opener::PeerConnectorIF& peers
	    , Opener::ProtocolEngineIF& engine
	    , Opener::WalletIF& wallet
	    , Opener::FeeEstimatorIF& fees
	    , Opener::DebouncerIF& debouncer_
	    , Ln::NodeId local_node_
	    , Opener::Options const& options
	    );

	Ev::Io<BatchResult>
	open_batch(std::vector<OpenChannelRequest> requests);
};

}}}

#endif /* !defined(OPENER_MOD_BATCHOPENER_MAIN_HPP) */
