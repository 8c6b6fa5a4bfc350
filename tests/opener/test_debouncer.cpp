#undef NDEBUG
#include"Bitcoin/Tx.hpp"
#include"Bitcoin/TxId.hpp"
#include"Ev/Io.hpp"
#include"Ev/start.hpp"
#include"Opener/BroadcastDebouncer.hpp"
#include"Opener/ChainBroadcasterIF.hpp"
#include"S/Bus.hpp"
#include<assert.h>
#include<vector>

namespace {

class DummyChain : public Opener::ChainBroadcasterIF {
public:
	std::vector<Bitcoin::TxId> sent;

	Ev::Io<void> broadcast_transaction(Bitcoin::Tx const& tx) override {
		sent.push_back(tx.get_txid());
		return Ev::lift();
	}
};

Bitcoin::Tx make_tx(std::uint64_t sats) {
	auto tx = Bitcoin::Tx();
	tx.inputs.push_back(Bitcoin::TxIn());
	tx.inputs[0].nSequence = Bitcoin::sequence_rbf;
	tx.outputs.push_back(Bitcoin::TxOut( Ln::Amount::sat(sats)
					   , std::vector<std::uint8_t>(34, 0x51)
					   ));
	return tx;
}

}

int main() {
	auto bus = S::Bus();
	auto chain = DummyChain();
	Opener::BroadcastDebouncer debouncer(bus, chain);

	auto shared = make_tx(100000);
	auto other = make_tx(200000);
	auto txid = shared.get_txid();
	assert(txid != other.get_txid());

	debouncer.set_debounce(txid, 3);
	assert(debouncer.pending(txid) == 3);
	assert(debouncer.pending(other.get_txid()) == 0);

	auto code = Ev::lift().then([&]() {
		return debouncer.broadcast(shared);
	}).then([&]() {
		/* Held back.  */
		assert(chain.sent.empty());
		assert(debouncer.pending(txid) == 2);
		/* Unregistered transactions pass through.  */
		return debouncer.broadcast(other);
	}).then([&]() {
		assert(chain.sent.size() == 1);
		assert(chain.sent[0] == other.get_txid());
		return debouncer.broadcast(shared);
	}).then([&]() {
		assert(chain.sent.size() == 1);
		return debouncer.broadcast(shared);
	}).then([&]() {
		/* Last expected completion sends it.  */
		assert(chain.sent.size() == 2);
		assert(chain.sent[1] == txid);
		assert(debouncer.pending(txid) == 0);
		/* And it is forgotten afterwards.  */
		return debouncer.broadcast(shared);
	}).then([&]() {
		assert(chain.sent.size() == 3);

		/* Zero count unregisters.  */
		debouncer.set_debounce(txid, 2);
		debouncer.set_debounce(txid, 0);
		assert(debouncer.pending(txid) == 0);
		return debouncer.broadcast(shared);
	}).then([&]() {
		assert(chain.sent.size() == 4);
		return Ev::lift(0);
	});

	return Ev::start(code);
}
