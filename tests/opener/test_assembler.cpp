#undef NDEBUG
#include"Bitcoin/Tx.hpp"
#include"Bitcoin/TxId.hpp"
#include"Ev/Io.hpp"
#include"Ev/Semaphore.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/start.hpp"
#include"Ev/yield.hpp"
#include"Opener/FeeEstimatorIF.hpp"
#include"Opener/FundingDraft.hpp"
#include"Opener/Mod/BatchOpener/Assembler.hpp"
#include"Opener/WalletIF.hpp"
#include"S/Bus.hpp"
#include<assert.h>
#include<vector>

using Opener::Mod::BatchOpener::FundingEvent;

namespace {

/* Counts greenthreads between a fee lookup and
 * the end of signing.  */
auto in_wallet = std::size_t(0);
auto max_in_wallet = std::size_t(0);

class DummyFees : public Opener::FeeEstimatorIF {
public:
	std::uint32_t perkw;
	std::vector<Opener::ConfirmationTarget> asked;

	DummyFees() : perkw(253) { }

	Ev::Io<std::uint32_t>
	get_est_sat_per_1000_weight(Opener::ConfirmationTarget t) override {
		asked.push_back(t);
		++in_wallet;
		if (in_wallet > max_in_wallet)
			max_in_wallet = in_wallet;
		auto v = perkw;
		/* Give other batches a chance to interleave.  */
		return Ev::yield() + Ev::yield() + Ev::lift(v);
	}
};

class DummyWallet : public Opener::WalletIF {
public:
	std::vector<Opener::FundingDraft> drafts;
	bool can_sign;
	bool can_build;

	DummyWallet() : can_sign(true), can_build(true) { }

	Bitcoin::Tx build(Opener::FundingDraft const& d) override {
		drafts.push_back(d);
		if (!can_build) {
			--in_wallet;
			throw Opener::WalletError("insufficient funds");
		}
		auto tx = Bitcoin::Tx();
		auto in = Bitcoin::TxIn();
		in.prevTxid = Bitcoin::TxId(std::string(64, '7'));
		in.prevOut = std::uint32_t(drafts.size());
		in.nSequence = d.enable_rbf ? Bitcoin::sequence_rbf
					    : Bitcoin::sequence_final
					    ;
		tx.inputs.push_back(in);
		tx.outputs = d.recipients;
		/* Change.  */
		tx.outputs.push_back(Bitcoin::TxOut( Ln::Amount::sat(5000)
						   , std::vector<std::uint8_t>(22, 0x00)
						   ));
		return tx;
	}
	bool sign(Bitcoin::Tx& tx) override {
		--in_wallet;
		if (!can_sign)
			return false;
		tx.inputs[0].witness.push_back(std::vector<std::uint8_t>(64, 0x30));
		return true;
	}
};

auto done = std::size_t(0);

Ev::Io<void> count_done(Bitcoin::Tx) {
	++done;
	return Ev::lift();
}
Ev::Io<void> wait_done(std::size_t n) {
	return Ev::yield().then([n]() {
		if (done == n)
			return Ev::lift();
		return wait_done(n);
	});
}

FundingEvent event(std::uint64_t id, std::uint64_t sats) {
	auto e = FundingEvent();
	e.user_channel_id = id;
	e.channel_value = Ln::Amount::sat(sats);
	e.output_script = std::vector<std::uint8_t>(34, std::uint8_t(id));
	e.output_script[0] = 0x00;
	e.output_script[1] = 0x20;
	return e;
}

}

int main() {
	auto bus = S::Bus();
	auto fees = DummyFees();
	auto wallet = DummyWallet();
	auto lock = Ev::Semaphore(1);
	Opener::Mod::BatchOpener::Assembler assembler(bus, wallet, fees, lock);

	auto events = std::vector<FundingEvent>();
	events.push_back(event(1, 100000));
	events.push_back(event(2, 300000));

	auto code = Ev::lift().then([&]() {
		return assembler.assemble(events);
	}).then([&](Bitcoin::Tx tx) {
		assert(fees.asked.size() == 1);
		assert(fees.asked[0] == Opener::ConfirmationTarget::Normal);
		assert(wallet.drafts.size() == 1);
		auto const& d = wallet.drafts[0];
		assert(d.feerate == 1.0);
		assert(d.enable_rbf);
		/* One output per event, in event order.  */
		assert(d.recipients.size() == 2);
		assert(d.recipients[0].amount == Ln::Amount::sat(100000));
		assert(d.recipients[0].scriptPubKey == events[0].output_script);
		assert(d.recipients[1].amount == Ln::Amount::sat(300000));
		assert(d.recipients[1].scriptPubKey == events[1].output_script);

		assert(tx.signals_rbf());
		assert(tx.outputs.size() == 3);
		assert(!tx.inputs[0].witness.empty());

		/* Two batches at once never share the wallet.  */
		fees.perkw = 1000;
		return Ev::concurrent(assembler.assemble(events).then(&count_done))
		     + Ev::concurrent(assembler.assemble(events).then(&count_done))
		     ;
	}).then([&]() {
		return wait_done(2);
	}).then([&]() {
		assert(max_in_wallet == 1);
		assert(wallet.drafts.back().feerate == 4.0);

		wallet.can_sign = false;
		return assembler.assemble(events).then([](Bitcoin::Tx) {
			return Ev::lift(false);
		}).catching<Opener::WalletError>([](Opener::WalletError const&) {
			return Ev::lift(true);
		});
	}).then([&](bool failed) {
		assert(failed);
		wallet.can_sign = true;
		wallet.can_build = false;
		return assembler.assemble(events).then([](Bitcoin::Tx) {
			return Ev::lift(false);
		}).catching<Opener::WalletError>([](Opener::WalletError const&) {
			return Ev::lift(true);
		});
	}).then([&](bool failed) {
		assert(failed);
		/* The lock was released after failures.  */
		wallet.can_build = true;
		return assembler.assemble(events);
	}).then([&](Bitcoin::Tx) {
		assert(in_wallet == 0);
		return Ev::lift(0);
	});

	return Ev::start(code);
}
