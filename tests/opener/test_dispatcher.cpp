#undef NDEBUG
#include"Bitcoin/Tx.hpp"
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Ln/ChannelId.hpp"
#include"Ln/NodeId.hpp"
#include"Opener/ChannelConfig.hpp"
#include"Opener/Mod/BatchOpener/Dispatcher.hpp"
#include"Opener/ProtocolEngineIF.hpp"
#include"S/Bus.hpp"
#include<assert.h>
#include<set>
#include<string>
#include<vector>

using Opener::BatchResult;
using Opener::OpenChannelRequest;
using Opener::OpenError;
using Opener::OpenResult;
using Opener::Mod::BatchOpener::FundingEvent;
using Opener::Mod::BatchOpener::Pending;

namespace {

auto const local = Ln::NodeId(
	"0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798"
);
auto const peer = Ln::NodeId(
	"02c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5"
);

Ln::ChannelId tcid(char c) {
	return Ln::ChannelId(std::string(64, c));
}

struct Handed {
	Ln::ChannelId temporary_channel_id;
	Ln::NodeId counterparty;
	Bitcoin::Tx tx;
};

class DummyEngine : public Opener::ProtocolEngineIF {
public:
	std::vector<Handed> handed;
	std::set<Ln::ChannelId> refusing;

	Ev::Io<Ln::ChannelId>
	create_channel( Ln::NodeId const&
		      , Ln::Amount
		      , Ln::Amount
		      , std::uint64_t
		      , Opener::ChannelConfig const&
		      ) override {
		throw Opener::ProtocolError("unused");
	}
	Ev::Io<void>
	funding_transaction_generated( Ln::ChannelId const& t
				     , Ln::NodeId const& n
				     , Bitcoin::Tx tx
				     ) override {
		handed.push_back(Handed{t, n, tx});
		if (refusing.count(t) != 0)
			return Ev::lift().then([]() {
				throw Opener::ProtocolError("channel unknown");
				return Ev::lift();
			});
		return Ev::lift();
	}
};

BatchResult make_results() {
	auto rs = BatchResult();
	for (auto i = 0; i < 4; ++i) {
		auto r = OpenChannelRequest();
		r.counterparty_pubkey = std::string(peer);
		r.user_channel_id = std::uint64_t(i + 1);
		rs.push_back(std::make_pair(r, OpenResult::right(tcid('a' + i))));
	}
	rs[0].second = OpenResult::left(OpenError(OpenError::InvalidPubkey, "x"));
	return rs;
}

FundingEvent event(std::uint64_t id) {
	auto e = FundingEvent();
	e.node_id = local;
	e.user_channel_id = id;
	e.counterparty_node_id = peer;
	e.channel_value = Ln::Amount::sat(100000);
	return e;
}

}

int main() {
	auto bus = S::Bus();
	auto engine = DummyEngine();
	Opener::Mod::BatchOpener::Dispatcher dispatcher(bus, engine);

	auto results = make_results();
	auto events = std::vector<FundingEvent>();
	events.push_back(event(4));
	events.push_back(event(2));

	auto pending = dispatcher.reclassify(results, events);
	/* In batch order, not event order.  */
	assert(pending.size() == 2);
	assert(pending[0].index == 1);
	assert(pending[0].temporary_channel_id == tcid('b'));
	assert(pending[0].counterparty == peer);
	assert(pending[1].index == 3);
	assert(pending[1].temporary_channel_id == tcid('d'));
	/* Earlier failures are untouched.  */
	assert(results[0].second.left_value().kind == OpenError::InvalidPubkey);
	assert(results[2].second.left_value().kind
	       == OpenError::FundingNeverHappened);

	auto failed = results;
	dispatcher.fail_all(failed, pending, "no coins");
	assert(failed[1].second.left_value().kind == OpenError::FundingTxFailed);
	assert(failed[1].second.left_value().message == "no coins");
	assert(failed[3].second.left_value().kind == OpenError::FundingTxFailed);
	assert(failed[2].second == results[2].second);

	auto tx = Bitcoin::Tx();
	tx.nLockTime = 700000;
	engine.refusing.insert(tcid('b'));

	auto code = Ev::lift().then([&]() {
		return dispatcher.complete(results, pending, tx);
	}).then([&](BatchResult rs) {
		assert(rs.size() == 4);
		/* Everyone pending was handed the
		 * transaction, in order, even after a
		 * refusal.  */
		assert(engine.handed.size() == 2);
		assert(engine.handed[0].temporary_channel_id == tcid('b'));
		assert(engine.handed[1].temporary_channel_id == tcid('d'));
		assert(engine.handed[1].counterparty == peer);
		assert(engine.handed[1].tx == tx);

		assert(rs[1].second.left_value().kind == OpenError::FundingRejected);
		assert(rs[1].second.left_value().message == "channel unknown");
		assert(rs[3].second.is_right());
		assert(rs[3].second.right_value() == tcid('d'));
		assert(rs[3].first.user_channel_id == 4);
		assert(rs[2].second == results[2].second);
		return Ev::lift(0);
	});

	return Ev::start(code);
}
