#include"Bitcoin/Tx.hpp"
#include"Ev/Io.hpp"
#include"Opener/Mod/BatchOpener/Dispatcher.hpp"
#include"Opener/ProtocolEngineIF.hpp"
#include"Opener/log.hpp"
#include<map>
#include<memory>

namespace Opener { namespace Mod { namespace BatchOpener {

std::vector<Pending>
Dispatcher::reclassify( BatchResult& results
		      , std::vector<FundingEvent> const& events
		      ) const {
	auto by_id = std::map<std::uint64_t, FundingEvent const*>();
	for (auto const& e : events)
		by_id.insert(std::make_pair(e.user_channel_id, &e));

	auto rv = std::vector<Pending>();
	for (auto i = std::size_t(0); i < results.size(); ++i) {
		auto& entry = results[i];
		if (entry.second.is_left())
			continue;
		auto it = by_id.find(entry.first.user_channel_id);
		if (it == by_id.end()) {
			entry.second = OpenResult::left(OpenError(
				OpenError::FundingNeverHappened,
				"Funding negotiation with "
				+ entry.first.counterparty_pubkey
				+ " did not complete in time."
			));
			continue;
		}
		rv.push_back(Pending{ i
				    , entry.second.right_value()
				    , it->second->counterparty_node_id
				    });
	}
	return rv;
}

void Dispatcher::fail_all( BatchResult& results
			 , std::vector<Pending> const& pending
			 , std::string const& why
			 ) const {
	for (auto const& p : pending)
		results[p.index].second = OpenResult::left(OpenError(
			OpenError::FundingTxFailed, why
		));
}

namespace {

struct Completion {
	BatchResult results;
	std::vector<Pending> pending;
	Bitcoin::Tx tx;
	std::size_t next;
};

Ev::Io<void> complete_next( S::Bus& bus
			  , ProtocolEngineIF& engine
			  , std::shared_ptr<Completion> c
			  ) {
	if (c->next >= c->pending.size())
		return Ev::lift();
	auto p = c->pending[c->next];
	++c->next;
	auto pbus = &bus;
	auto pengine = &engine;
	return Ev::lift().then([pengine, c, p]() {
		return pengine->funding_transaction_generated(
			p.temporary_channel_id, p.counterparty, c->tx
		);
	}).catching<ProtocolError>([pbus, c, p](ProtocolError const& e) {
		c->results[p.index].second = OpenResult::left(OpenError(
			OpenError::FundingRejected, e.what()
		));
		return Opener::log( *pbus, Warn
				  , "BatchOpener: %s rejected funding "
				    "transaction: %s"
				  , std::string(p.counterparty).c_str()
				  , e.what()
				  );
	}).then([pbus, pengine, c]() {
		return complete_next(*pbus, *pengine, c);
	});
}

}

Ev::Io<BatchResult> Dispatcher::complete( BatchResult results
					, std::vector<Pending> pending
					, Bitcoin::Tx const& tx
					) {
	auto c = std::make_shared<Completion>();
	c->results = std::move(results);
	c->pending = std::move(pending);
	c->tx = tx;
	c->next = 0;

	return complete_next(bus, engine, c).then([c]() {
		return Ev::lift(std::move(c->results));
	});
}

}}}
