#ifndef OPENER_MOD_BATCHOPENER_CORRELATOR_HPP
#define OPENER_MOD_BATCHOPENER_CORRELATOR_HPP

#include"Opener/Msg/FundingGenerationReady.hpp"
#include"S/Tap.hpp"
#include<cstdint>
#include<functional>
#include<list>
#include<memory>
#include<vector>

namespace Ev { template<typename a> class Io; }
namespace Ln { class NodeId; }
namespace Opener { namespace Mod { class Waiter; }}

namespace Opener { namespace Mod { namespace BatchOpener {

typedef Opener::Msg::FundingGenerationReady FundingEvent;

/** struct Opener::Mod::BatchOpener::EventFilter
 *
 * @brief waits for the one event that satisfies
 * `matches`; `user_channel_id` says which request
 * it waits for.
 */
struct EventFilter {
	std::uint64_t user_channel_id;
	std::function<bool(FundingEvent const&)> matches;
};

/* Matches the funding-ready event for
 * `user_channel_id` raised on behalf of
 * `local_node`.  */
EventFilter make_funding_filter( Ln::NodeId const& local_node
			       , std::uint64_t user_channel_id
			       );

/** class Opener::Mod::BatchOpener::Correlator
 *
 * @brief pairs funding-ready events from a
 * private bus receiver with filters.
 *
 * @desc Each batch gets its own correlator, so
 * that concurrent batches never see each other's
 * filters.
 * Copies share the same receiver.
 */
class Correlator {
private:
	class Impl;
	std::shared_ptr<Impl> pimpl;

public:
	Correlator() =delete;
	Correlator( Opener::Mod::Waiter& waiter
		  , S::Tap<FundingEvent>::Receiver receiver
		  );

	/** Opener::Mod::BatchOpener::Correlator::wait_for_events
	 *
	 * @brief drains the receiver and tests each
	 * event against the filters still unmatched.
	 * The first filter an event satisfies is
	 * retired and the event kept.
	 *
	 * @desc Returns as soon as every filter is
	 * retired.
	 * Otherwise it sleeps `interval` seconds and
	 * drains again, until the accumulated sleep
	 * reaches `timeout`, then returns whatever was
	 * matched.
	 * With no filters it returns at once, without
	 * suspending.
	 * Events are returned in the order they were
	 * matched.
	 */
	Ev::Io<std::vector<FundingEvent>>
	wait_for_events( std::list<EventFilter> filters
		       , double timeout
		       , double interval
		       );
};

}}}

#endif /* !defined(OPENER_MOD_BATCHOPENER_CORRELATOR_HPP) */
