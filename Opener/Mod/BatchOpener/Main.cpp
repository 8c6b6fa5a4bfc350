#include"Bitcoin/Tx.hpp"
#include"Bitcoin/TxId.hpp"
#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"Opener/DebouncerIF.hpp"
#include"Opener/Mod/BatchOpener/Main.hpp"
#include"Opener/WalletIF.hpp"
#include"Opener/log.hpp"
#include"Opener/random_engine.hpp"
#include"Util/Str.hpp"
#include<cstdint>
#include<limits>
#include<memory>
#include<random>
#include<set>

namespace Opener { namespace Mod { namespace BatchOpener {

std::vector<bool>
find_duplicate_user_channel_ids(std::vector<OpenChannelRequest> const& requests) {
	auto seen = std::set<std::uint64_t>();
	auto dups = std::vector<bool>(requests.size(), false);
	for (auto i = std::size_t(0); i < requests.size(); ++i) {
		auto id = requests[i].user_channel_id;
		if (id == 0)
			continue;
		if (!seen.insert(id).second)
			dups[i] = true;
	}
	return dups;
}

void assign_user_channel_ids(std::vector<OpenChannelRequest>& requests) {
	auto used = std::set<std::uint64_t>();
	for (auto const& r : requests)
		if (r.user_channel_id != 0)
			used.insert(r.user_channel_id);

	auto dist = std::uniform_int_distribution<std::uint64_t>(
		1, std::numeric_limits<std::uint64_t>::max()
	);
	for (auto& r : requests) {
		if (r.user_channel_id != 0)
			continue;
		auto id = std::uint64_t();
		do {
			id = dist(Opener::random_engine);
		} while (used.count(id) != 0);
		used.insert(id);
		r.user_channel_id = id;
	}
}

Main::Main( S::Bus& bus_
	  , Opener::Mod::Waiter& waiter_
	  , Opener::PeerConnectorIF& peers
	  , Opener::ProtocolEngineIF& engine
	  , Opener::WalletIF& wallet
	  , Opener::FeeEstimatorIF& fees
	  , Opener::DebouncerIF& debouncer_
	  , Ln::NodeId local_node_
	  , double funding_timeout_
	  , double poll_interval_
	  ) : bus(bus_)
	    , waiter(waiter_)
	    , debouncer(debouncer_)
	    , local_node(std::move(local_node_))
	    , funding_timeout(funding_timeout_)
	    , poll_interval(poll_interval_)
	    , tap(bus_)
	    , wallet_lock(1)
	    , initiator(bus_, peers, engine)
	    , assembler(bus_, wallet, fees, wallet_lock)
	    , dispatcher(bus_, engine)
	    { }
Main::Main( S::Bus& bus_
	  , Opener::Mod::Waiter& waiter_
	  , Opener::PeerConnectorIF& peers
	  , Opener::ProtocolEngineIF& engine
	  , Opener::WalletIF& wallet
	  , Opener::FeeEstimatorIF& fees
	  , Opener::DebouncerIF& debouncer_
	  , Ln::NodeId local_node_
	  , Opener::Options const& options
	  ) : Main( bus_, waiter_, peers, engine, wallet, fees, debouncer_
		  , std::move(local_node_)
		  , options.funding_timeout
		  , options.poll_interval
		  )
	    { }

namespace {

/* State of one open_batch call.  */
struct Batch {
	BatchResult results;
	/* Entries already failed before initiation.  */
	std::vector<bool> settled;
	std::size_t next;
	std::vector<Pending> pending;
	std::vector<FundingEvent> events;
};

Ev::Io<void> initiate_next(Initiator& initiator, std::shared_ptr<Batch> b) {
	while (b->next < b->results.size() && b->settled[b->next])
		++b->next;
	if (b->next >= b->results.size())
		return Ev::lift();
	auto i = b->next++;
	auto pinitiator = &initiator;
	return initiator.initiate(b->results[i].first).then([pinitiator, b, i](OpenResult r) {
		b->results[i].second = std::move(r);
		return Ev::yield().then([pinitiator, b]() {
			return initiate_next(*pinitiator, b);
		});
	});
}

/* Thrown to skip assembly when nothing is left
 * to fund.  */
struct NothingToFund { };

}

Ev::Io<BatchResult>
Main::open_batch(std::vector<OpenChannelRequest> requests) {
	auto dups = find_duplicate_user_channel_ids(requests);
	assign_user_channel_ids(requests);

	auto b = std::make_shared<Batch>();
	b->next = 0;
	b->settled = dups;
	for (auto i = std::size_t(0); i < requests.size(); ++i) {
		auto result = OpenResult();
		if (dups[i])
			result = OpenResult::left(OpenError(
				OpenError::DuplicateUserChannelId,
				Util::Str::fmt( "user_channel_id %llu is already "
						"used earlier in this batch."
					      , (unsigned long long)
						requests[i].user_channel_id
					      )
			));
		b->results.emplace_back(std::move(requests[i]), std::move(result));
	}

	/* Subscribe before initiating, so no event can
	 * be raised before we listen.  */
	auto correlator = Correlator(waiter, tap.subscribe());

	return Ev::lift().then([this, b]() {
		return initiate_next(initiator, b);
	}).then([this, b, correlator]() {
		auto filters = std::list<EventFilter>();
		for (auto const& e : b->results)
			if (e.second.is_right())
				filters.push_back(make_funding_filter(
					local_node, e.first.user_channel_id
				));
		auto c = correlator;
		return c.wait_for_events( std::move(filters)
					, funding_timeout
					, poll_interval
					);
	}).then([this, b](std::vector<FundingEvent> events) {
		b->events = std::move(events);
		b->pending = dispatcher.reclassify(b->results, b->events);
		if (b->pending.empty())
			throw NothingToFund();
		return Opener::log( bus, Debug
				  , "BatchOpener: %zu of %zu requests ready "
				    "for funding."
				  , b->pending.size()
				  , b->results.size()
				  );
	}).then([this, b]() {
		return assembler.assemble(b->events);
	}).then([this, b](Bitcoin::Tx tx) {
		debouncer.set_debounce(tx.get_txid(), b->pending.size());
		return dispatcher.complete( std::move(b->results)
					  , std::move(b->pending)
					  , tx
					  );
	}).catching<WalletError>([this, b](WalletError const& e) {
		dispatcher.fail_all(b->results, b->pending, e.what());
		return Opener::log( bus, Error
				  , "BatchOpener: funding transaction "
				    "failed, %zu channels abandoned: %s"
				  , b->pending.size()
				  , e.what()
				  ).then([b]() {
			return Ev::lift(std::move(b->results));
		});
	}).catching<NothingToFund>([this, b](NothingToFund const&) {
		return Opener::log( bus, Info
				  , "BatchOpener: no channel reached "
				    "funding; nothing to assemble."
				  ).then([b]() {
			return Ev::lift(std::move(b->results));
		});
	});
}

}}}
