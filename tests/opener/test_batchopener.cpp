#undef NDEBUG
#include"Bitcoin/Tx.hpp"
#include"Bitcoin/TxId.hpp"
#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ln/ChannelId.hpp"
#include"Ln/NodeId.hpp"
#include"Net/PeerAddr.hpp"
#include"Opener/BroadcastDebouncer.hpp"
#include"Opener/ChainBroadcasterIF.hpp"
#include"Opener/ChannelConfig.hpp"
#include"Opener/FeeEstimatorIF.hpp"
#include"Opener/FundingDraft.hpp"
#include"Opener/Mod/BatchOpener/Main.hpp"
#include"Opener/Mod/Waiter.hpp"
#include"Opener/Msg/FundingGenerationReady.hpp"
#include"Opener/Options.hpp"
#include"Opener/PeerConnectorIF.hpp"
#include"Opener/ProtocolEngineIF.hpp"
#include"Opener/WalletIF.hpp"
#include"S/Bus.hpp"
#include"Util/Str.hpp"
#include<assert.h>
#include<set>
#include<stdexcept>
#include<string>
#include<vector>

using Opener::BatchResult;
using Opener::OpenChannelRequest;
using Opener::OpenError;

namespace {

auto const local = std::string(
	"02e493dbf1c10d80f3581e4904930b1404cc6c13900ee0758474fa94abe8c4cd13"
);
auto const alice = std::string(
	"0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798"
);
auto const bob = std::string(
	"02c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5"
);
auto const carol = std::string(
	"02f9308a019258c31049344f85f89d5229b531c845836f99b08601f113bce036f9"
);

class DummyPeers : public Opener::PeerConnectorIF {
public:
	std::set<Ln::NodeId> connected;

	Ev::Io<bool> is_connected(Ln::NodeId const& n) override {
		return Ev::lift(connected.count(n) != 0);
	}
	Ev::Io<void> connect( Ln::NodeId const& n
			    , Net::PeerAddr const&
			    ) override {
		connected.insert(n);
		return Ev::lift();
	}
};

class DummyChain : public Opener::ChainBroadcasterIF {
public:
	std::vector<Bitcoin::TxId> sent;

	Ev::Io<void> broadcast_transaction(Bitcoin::Tx const& tx) override {
		sent.push_back(tx.get_txid());
		return Ev::lift();
	}
};

/* Negotiates instantly: every created channel gets
 * its funding-ready event, except for counterparties
 * that are `silent`.  Completed channels ask the
 * debouncer to broadcast, as a channel state
 * machine would.  */
class DummyEngine : public Opener::ProtocolEngineIF {
private:
	S::Bus& bus;
	Opener::BroadcastDebouncer& debouncer;
	Ln::NodeId self;

public:
	std::set<Ln::NodeId> silent;
	std::vector<std::uint64_t> created;
	std::vector<Ln::ChannelId> funded;

	DummyEngine( S::Bus& bus_
		   , Opener::BroadcastDebouncer& debouncer_
		   , Ln::NodeId self_
		   ) : bus(bus_), debouncer(debouncer_), self(self_) { }

	Ev::Io<Ln::ChannelId>
	create_channel( Ln::NodeId const& counterparty
		      , Ln::Amount value
		      , Ln::Amount
		      , std::uint64_t user_channel_id
		      , Opener::ChannelConfig const&
		      ) override {
		created.push_back(user_channel_id);
		auto tcid = Ln::ChannelId(Util::Str::fmt(
			"%064llx", (unsigned long long) created.size()
		));
		if (silent.count(counterparty) != 0)
			return Ev::lift(tcid);

		auto e = Opener::Msg::FundingGenerationReady();
		e.node_id = self;
		e.user_channel_id = user_channel_id;
		e.counterparty_node_id = counterparty;
		e.channel_value = value;
		e.output_script = std::vector<std::uint8_t>(34, std::uint8_t(created.size()));
		return Ev::concurrent(bus.raise(e)) + Ev::lift(tcid);
	}
	Ev::Io<void>
	funding_transaction_generated( Ln::ChannelId const& t
				     , Ln::NodeId const&
				     , Bitcoin::Tx tx
				     ) override {
		funded.push_back(t);
		return debouncer.broadcast(tx);
	}
};

class DummyFees : public Opener::FeeEstimatorIF {
public:
	bool broke;

	DummyFees() : broke(false) { }

	Ev::Io<std::uint32_t>
	get_est_sat_per_1000_weight(Opener::ConfirmationTarget) override {
		auto self = this;
		return Ev::lift().then([self]() {
			if (self->broke)
				throw Opener::FeeEstimateError("no fee data");
			return Ev::lift(std::uint32_t(2500));
		});
	}
};

class DummyWallet : public Opener::WalletIF {
public:
	std::vector<Opener::FundingDraft> drafts;
	bool broke;
	/* Fails with something other than WalletError.  */
	bool disk_full;

	DummyWallet() : broke(false), disk_full(false) { }

	Bitcoin::Tx build(Opener::FundingDraft const& d) override {
		drafts.push_back(d);
		if (broke)
			throw Opener::WalletError("wallet is locked");
		if (disk_full)
			throw std::runtime_error("disk full");
		auto tx = Bitcoin::Tx();
		auto in = Bitcoin::TxIn();
		in.prevTxid = Bitcoin::TxId(std::string(64, '3'));
		in.prevOut = std::uint32_t(drafts.size());
		in.nSequence = Bitcoin::sequence_rbf;
		tx.inputs.push_back(in);
		tx.outputs = d.recipients;
		return tx;
	}
	bool sign(Bitcoin::Tx&) override {
		return true;
	}
};

OpenChannelRequest request( std::string const& pk
			  , std::string const& addr
			  , std::uint64_t id = 0
			  ) {
	auto r = OpenChannelRequest();
	r.counterparty_pubkey = pk;
	r.counterparty_host_port = addr;
	r.amount = Ln::Amount::sat(500000);
	r.user_channel_id = id;
	return r;
}

OpenError::Kind failure(BatchResult const& rs, std::size_t i) {
	assert(rs[i].second.is_left());
	return rs[i].second.left_value().kind;
}

}

int main() {
	/* Id assignment.  */
	{
		auto rs = std::vector<OpenChannelRequest>();
		rs.push_back(request(alice, "", 5));
		for (auto i = 0; i < 20; ++i)
			rs.push_back(request(alice, ""));
		rs.push_back(request(alice, "", 5));
		Opener::Mod::BatchOpener::assign_user_channel_ids(rs);
		auto ids = std::set<std::uint64_t>();
		for (auto i = std::size_t(1); i < 21; ++i) {
			assert(rs[i].user_channel_id != 0);
			assert(rs[i].user_channel_id != 5);
			ids.insert(rs[i].user_channel_id);
		}
		assert(ids.size() == 20);
		assert(rs[0].user_channel_id == 5);

		/* Only the later copies of a supplied id are
		 * duplicates.  */
		auto dups = Opener::Mod::BatchOpener::find_duplicate_user_channel_ids(rs);
		assert(dups.size() == rs.size());
		for (auto i = std::size_t(0); i < 21; ++i)
			assert(!dups[i]);
		assert(dups[21]);
	}

	auto bus = S::Bus();
	Opener::Mod::Waiter waiter(bus);
	auto chain = DummyChain();
	Opener::BroadcastDebouncer debouncer(bus, chain);
	auto peers = DummyPeers();
	auto engine = DummyEngine(bus, debouncer, Ln::NodeId(local));
	auto wallet = DummyWallet();
	auto fees = DummyFees();
	auto options = Opener::Options::parse({ "--opener-funding-timeout=0.1"
					      , "--opener-poll-interval=0.01"
					      });
	Opener::Mod::BatchOpener::Main opener( bus, waiter
					     , peers, engine
					     , wallet, fees
					     , debouncer
					     , Ln::NodeId(local)
					     , options
					     );

	peers.connected.insert(Ln::NodeId(bob));

	auto created_before = std::size_t();
	auto drafts_before = std::size_t();
	auto funded_before = std::size_t();
	auto sent_before = std::size_t();
	auto mark = [&]() {
		created_before = engine.created.size();
		drafts_before = wallet.drafts.size();
		funded_before = engine.funded.size();
		sent_before = chain.sent.size();
	};

	auto code = Ev::lift().then([&]() {
		return opener.open_batch(std::vector<OpenChannelRequest>());
	}).then([&](BatchResult rs) {
		assert(rs.empty());
		assert(wallet.drafts.empty());

		auto rqs = std::vector<OpenChannelRequest>();
		rqs.push_back(request(alice, "127.0.0.1:9735"));
		rqs.push_back(request(bob, "", 77));
		return opener.open_batch(rqs);
	}).then([&](BatchResult rs) {
		/* Both open, sharing one transaction.  */
		assert(rs.size() == 2);
		assert(rs[0].first.counterparty_pubkey == alice);
		assert(rs[0].first.user_channel_id != 0);
		assert(rs[1].first.user_channel_id == 77);
		assert(rs[0].second.is_right());
		assert(rs[1].second.is_right());
		assert(peers.connected.count(Ln::NodeId(alice)) != 0);

		assert(wallet.drafts.size() == 1);
		auto const& d = wallet.drafts[0];
		assert(d.recipients.size() == 2);
		assert(d.feerate == 10.0);
		assert(d.enable_rbf);

		assert(engine.funded.size() == 2);
		assert(engine.funded[0] == rs[0].second.right_value());
		assert(engine.funded[1] == rs[1].second.right_value());
		/* Broadcast once, after the last completion.  */
		assert(chain.sent.size() == 1);

		auto rqs = std::vector<OpenChannelRequest>();
		rqs.push_back(request(carol, "carol.example:99999"));
		rqs.push_back(request(bob, ""));
		return opener.open_batch(rqs);
	}).then([&](BatchResult rs) {
		/* A bad request does not sink the batch.  */
		assert(rs.size() == 2);
		assert(failure(rs, 0) == OpenError::InvalidAddress);
		assert(rs[1].second.is_right());
		assert(wallet.drafts.size() == 2);
		assert(wallet.drafts[1].recipients.size() == 1);
		assert(chain.sent.size() == 2);

		engine.silent.insert(Ln::NodeId(carol));
		peers.connected.insert(Ln::NodeId(carol));
		auto rqs = std::vector<OpenChannelRequest>();
		rqs.push_back(request(carol, ""));
		rqs.push_back(request(alice, ""));
		return opener.open_batch(rqs);
	}).then([&](BatchResult rs) {
		/* Negotiation that never finished.  */
		assert(failure(rs, 0) == OpenError::FundingNeverHappened);
		assert(rs[1].second.is_right());
		assert(wallet.drafts.size() == 3);
		assert(wallet.drafts[2].recipients.size() == 1);
		/* Only one completion was expected.  */
		assert(chain.sent.size() == 3);

		auto rqs = std::vector<OpenChannelRequest>();
		rqs.push_back(request(carol, ""));
		rqs.push_back(request("nope", ""));
		return opener.open_batch(rqs);
	}).then([&](BatchResult rs) {
		/* Nothing reached funding: no transaction.  */
		assert(failure(rs, 0) == OpenError::FundingNeverHappened);
		assert(failure(rs, 1) == OpenError::InvalidPubkey);
		assert(wallet.drafts.size() == 3);
		assert(chain.sent.size() == 3);

		wallet.broke = true;
		auto rqs = std::vector<OpenChannelRequest>();
		rqs.push_back(request(alice, ""));
		rqs.push_back(request(bob, ""));
		rqs.push_back(request(carol, ""));
		return opener.open_batch(rqs);
	}).then([&](BatchResult rs) {
		/* Wallet failure fails everyone that got
		 * as far as funding.  */
		assert(rs.size() == 3);
		assert(failure(rs, 0) == OpenError::FundingTxFailed);
		assert(rs[0].second.left_value().message == "wallet is locked");
		assert(failure(rs, 1) == OpenError::FundingTxFailed);
		assert(failure(rs, 2) == OpenError::FundingNeverHappened);
		assert(engine.funded.size() == 4);
		assert(chain.sent.size() == 3);

		wallet.broke = false;
		mark();
		auto rqs = std::vector<OpenChannelRequest>();
		rqs.push_back(request(alice, "", 5));
		rqs.push_back(request(bob, "", 5));
		rqs.push_back(request(bob, "", 6));
		return opener.open_batch(rqs);
	}).then([&](BatchResult rs) {
		/* A repeated id is rejected before it reaches
		 * the protocol engine; the first user keeps it.  */
		assert(rs.size() == 3);
		assert(rs[0].second.is_right());
		assert(failure(rs, 1) == OpenError::DuplicateUserChannelId);
		assert(rs[1].first.user_channel_id == 5);
		assert(rs[2].second.is_right());
		assert(engine.created.size() == created_before + 2);
		assert(engine.created[created_before] == 5);
		assert(engine.created[created_before + 1] == 6);
		assert(wallet.drafts.size() == drafts_before + 1);
		assert(wallet.drafts.back().recipients.size() == 2);
		assert(engine.funded.size() == funded_before + 2);
		/* Both expected completions happened.  */
		assert(chain.sent.size() == sent_before + 1);

		fees.broke = true;
		mark();
		auto rqs = std::vector<OpenChannelRequest>();
		rqs.push_back(request(alice, ""));
		rqs.push_back(request("nope", ""));
		rqs.push_back(request(bob, ""));
		return opener.open_batch(rqs);
	}).then([&](BatchResult rs) {
		/* No fee estimate: the shared transaction
		 * cannot be built.  */
		assert(rs.size() == 3);
		assert(failure(rs, 0) == OpenError::FundingTxFailed);
		assert(rs[0].second.left_value().message.find("no fee data")
		       != std::string::npos);
		assert(failure(rs, 1) == OpenError::InvalidPubkey);
		assert(failure(rs, 2) == OpenError::FundingTxFailed);
		assert(wallet.drafts.size() == drafts_before);
		assert(engine.funded.size() == funded_before);
		assert(chain.sent.size() == sent_before);

		fees.broke = false;
		wallet.disk_full = true;
		auto rqs = std::vector<OpenChannelRequest>();
		rqs.push_back(request(alice, ""));
		rqs.push_back(request(bob, ""));
		return opener.open_batch(rqs);
	}).then([&](BatchResult rs) {
		assert(rs.size() == 2);
		assert(failure(rs, 0) == OpenError::FundingTxFailed);
		assert(rs[0].second.left_value().message == "disk full");
		assert(failure(rs, 1) == OpenError::FundingTxFailed);
		assert(engine.funded.size() == funded_before);

		/* The wallet lock was released.  */
		wallet.disk_full = false;
		mark();
		auto rqs = std::vector<OpenChannelRequest>();
		rqs.push_back(request(alice, ""));
		return opener.open_batch(rqs);
	}).then([&](BatchResult rs) {
		assert(rs[0].second.is_right());
		assert(engine.funded.size() == funded_before + 1);
		assert(chain.sent.size() == sent_before + 1);

		/* Many requests that all fail at once.  */
		auto rqs = std::vector<OpenChannelRequest>(
			5000, request("nope", "")
		);
		return opener.open_batch(rqs);
	}).then([&](BatchResult rs) {
		assert(rs.size() == 5000);
		for (auto i = std::size_t(0); i < rs.size(); ++i)
			assert(failure(rs, i) == OpenError::InvalidPubkey);
		return Ev::lift(0);
	});

	return Ev::start(code);
}
