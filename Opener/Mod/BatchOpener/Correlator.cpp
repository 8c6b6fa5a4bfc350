#include"Ev/Io.hpp"
#include"Ln/NodeId.hpp"
#include"Opener/Mod/BatchOpener/Correlator.hpp"
#include"Opener/Mod/Waiter.hpp"
#include"Util/BacktraceException.hpp"
#include<stdexcept>

namespace Opener { namespace Mod { namespace BatchOpener {

EventFilter make_funding_filter( Ln::NodeId const& local_node
			       , std::uint64_t user_channel_id
			       ) {
	auto f = EventFilter();
	f.user_channel_id = user_channel_id;
	f.matches = [local_node, user_channel_id](FundingEvent const& e) {
		return e.node_id == local_node
		    && e.user_channel_id == user_channel_id
		     ;
	};
	return f;
}

class Correlator::Impl : public std::enable_shared_from_this<Impl> {
private:
	Opener::Mod::Waiter& waiter;
	S::Tap<FundingEvent>::Receiver receiver;

	struct Run {
		std::list<EventFilter> filters;
		std::vector<FundingEvent> matched;
		double timeout;
		double interval;
		double elapsed;
	};

	void drain(Run& run) {
		auto e = FundingEvent();
		while (!run.filters.empty() && receiver.try_receive(e)) {
			for ( auto it = run.filters.begin()
			    ; it != run.filters.end()
			    ; ++it
			    ) {
				if (!it->matches(e))
					continue;
				run.filters.erase(it);
				run.matched.push_back(std::move(e));
				break;
			}
		}
	}

	Ev::Io<void> poll(std::shared_ptr<Run> run) {
		drain(*run);
		if (run->filters.empty() || run->elapsed >= run->timeout)
			return Ev::lift();
		auto self = shared_from_this();
		return waiter.wait(run->interval).then([self, run]() {
			run->elapsed += run->interval;
			return self->poll(run);
		});
	}

public:
	Impl( Opener::Mod::Waiter& waiter_
	    , S::Tap<FundingEvent>::Receiver receiver_
	    ) : waiter(waiter_), receiver(std::move(receiver_)) { }

	Ev::Io<std::vector<FundingEvent>>
	wait_for_events( std::list<EventFilter> filters
		       , double timeout
		       , double interval
		       ) {
		if (filters.empty())
			return Ev::lift(std::vector<FundingEvent>());
		if (!(interval > 0))
			throw Util::BacktraceException<std::invalid_argument>(
				"Correlator: poll interval must be positive."
			);

		auto run = std::make_shared<Run>();
		run->filters = std::move(filters);
		run->timeout = timeout;
		run->interval = interval;
		run->elapsed = 0;

		auto self = shared_from_this();
		return Ev::lift().then([self, run]() {
			return self->poll(run);
		}).then([run]() {
			return Ev::lift(std::move(run->matched));
		});
	}
};

Correlator::Correlator( Opener::Mod::Waiter& waiter
		      , S::Tap<FundingEvent>::Receiver receiver
		      ) : pimpl(std::make_shared<Impl>( waiter
						      , std::move(receiver)
						      )) { }

Ev::Io<std::vector<FundingEvent>>
Correlator::wait_for_events( std::list<EventFilter> filters
			   , double timeout
			   , double interval
			   ) {
	return pimpl->wait_for_events(std::move(filters), timeout, interval);
}

}}}
