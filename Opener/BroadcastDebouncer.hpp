#ifndef OPENER_BROADCASTDEBOUNCER_HPP
#define OPENER_BROADCASTDEBOUNCER_HPP

#include"Bitcoin/TxId.hpp"
#include"Opener/DebouncerIF.hpp"
#include<cstddef>
#include<map>

namespace Bitcoin { struct Tx; }
namespace Ev { template<typename a> class Io; }
namespace Opener { class ChainBroadcasterIF; }
namespace S { class Bus; }

namespace Opener {

/** class Opener::BroadcastDebouncer
 *
 * @brief sits between channel state machines and
 * the chain, collapsing the broadcasts of a
 * shared funding transaction into one.
 *
 * @desc Each completion against a registered
 * transaction calls `broadcast`; only the last
 * expected one is forwarded.
 * Transactions that were never registered are
 * forwarded immediately.
 */
class BroadcastDebouncer : public DebouncerIF {
private:
	S::Bus& bus;
	ChainBroadcasterIF& chain;
	std::map<Bitcoin::TxId, std::size_t> expected;

public:
	BroadcastDebouncer() =delete;
	BroadcastDebouncer(BroadcastDebouncer const&) =delete;

	BroadcastDebouncer( S::Bus& bus_
			  , ChainBroadcasterIF& chain_
			  ) : bus(bus_), chain(chain_) { }

	/* A count of 0 forgets the transaction.  */
	void set_debounce(Bitcoin::TxId const&, std::size_t count) override;

	Ev::Io<void> broadcast(Bitcoin::Tx const& tx);

	/* Remaining expected broadcasts; 0 if not
	 * registered.  */
	std::size_t pending(Bitcoin::TxId const&) const;
};

}

#endif /* !defined(OPENER_BROADCASTDEBOUNCER_HPP) */
