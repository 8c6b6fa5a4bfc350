#ifndef OPENER_MOD_BATCHOPENER_DISPATCHER_HPP
#define OPENER_MOD_BATCHOPENER_DISPATCHER_HPP

#include"Ln/ChannelId.hpp"
#include"Ln/NodeId.hpp"
#include"Opener/Mod/BatchOpener/Correlator.hpp"
#include"Opener/OpenError.hpp"
#include<cstddef>
#include<string>
#include<vector>

namespace Bitcoin { struct Tx; }
namespace Ev { template<typename a> class Io; }
namespace Opener { class ProtocolEngineIF; }
namespace S { class Bus; }

namespace Opener { namespace Mod { namespace BatchOpener {

/** struct Opener::Mod::BatchOpener::Pending
 *
 * @brief a request that was initiated and whose
 * funding-ready event arrived; it is waiting for
 * the shared transaction.
 */
struct Pending {
	/* Position in the batch.  */
	std::size_t index;
	Ln::ChannelId temporary_channel_id;
	/* As reported by the event.  */
	Ln::NodeId counterparty;
};

/** class Opener::Mod::BatchOpener::Dispatcher
 *
 * @brief settles the per-request results once
 * correlation is over.
 */
class Dispatcher {
private:
	S::Bus& bus;
	Opener::ProtocolEngineIF& engine;

public:
	Dispatcher() =delete;
	Dispatcher(Dispatcher const&) =delete;

	Dispatcher( S::Bus& bus_
		  , Opener::ProtocolEngineIF& engine_
		  ) : bus(bus_), engine(engine_) { }

	/** Opener::Mod::BatchOpener::Dispatcher::reclassify
	 *
	 * @brief looks up the event for every
	 * successfully initiated request by
	 * user_channel_id.
	 * Requests without one become
	 * `FundingNeverHappened`; the rest are
	 * returned, in batch order.
	 */
	std::vector<Pending>
	reclassify( BatchResult& results
		  , std::vector<FundingEvent> const& events
		  ) const;

	/* Marks every pending request as
	 * `FundingTxFailed`.  */
	void fail_all( BatchResult& results
		     , std::vector<Pending> const& pending
		     , std::string const& why
		     ) const;

	/** Opener::Mod::BatchOpener::Dispatcher::complete
	 *
	 * @brief hands each pending request its own
	 * copy of the funding transaction, one at a
	 * time in batch order.
	 * A refusal by the protocol engine turns only
	 * that request into `FundingRejected`.
	 */
	Ev::Io<BatchResult> complete( BatchResult results
				    , std::vector<Pending> pending
				    , Bitcoin::Tx const& tx
				    );
};

}}}

#endif /* !defined(OPENER_MOD_BATCHOPENER_DISPATCHER_HPP) */
