#undef NDEBUG
#include"Bitcoin/Tx.hpp"
#include"Bitcoin/TxId.hpp"
#include"Util/Str.hpp"
#include<assert.h>
#include<string>

namespace {

Bitcoin::Tx sample_tx() {
	auto tx = Bitcoin::Tx();
	auto in = Bitcoin::TxIn();
	in.prevTxid = Bitcoin::TxId(std::string(64, '1'));
	in.prevOut = 0;
	in.nSequence = Bitcoin::sequence_rbf;
	tx.inputs.push_back(in);

	auto script = Util::Str::hexread(
		"0020" "2222222222222222222222222222222222222222222222222222222222222222"
	);
	tx.outputs.emplace_back(Ln::Amount::sat(100000), script);
	return tx;
}

}

int main() {
	auto tx = sample_tx();
	assert(tx.nVersion == 2);
	assert(tx.nLockTime == 0);
	assert(tx.signals_rbf());

	assert(std::string(tx) ==
		"02000000"
		"01"
		"1111111111111111111111111111111111111111111111111111111111111111"
		"00000000"
		"00"
		"fdffffff"
		"01"
		"a086010000000000"
		"22"
		"0020"
		"2222222222222222222222222222222222222222222222222222222222222222"
		"00000000"
	);
	assert(std::string(tx.get_txid()) ==
		"a6f599db9831bff0919574d9c6035ca0f1e5bf468687807382e27062f609cade"
	);

	/* Witnesses switch to the segwit serialization
	 * but do not change the txid.  */
	auto signed_tx = tx;
	signed_tx.inputs[0].witness.push_back(Util::Str::hexread("abcd"));
	assert(std::string(signed_tx) ==
		"02000000"
		"0001"
		"01"
		"1111111111111111111111111111111111111111111111111111111111111111"
		"00000000"
		"00"
		"fdffffff"
		"01"
		"a086010000000000"
		"22"
		"0020"
		"2222222222222222222222222222222222222222222222222222222222222222"
		"01"
		"02abcd"
		"00000000"
	);
	assert(signed_tx.get_txid() == tx.get_txid());
	assert(signed_tx != tx);

	/* Final sequence does not signal RBF.  */
	auto final_tx = tx;
	final_tx.inputs[0].nSequence = Bitcoin::sequence_final;
	assert(!final_tx.signals_rbf());
	assert(final_tx.get_txid() != tx.get_txid());

	return 0;
}
