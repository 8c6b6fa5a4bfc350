#include"Bitcoin/Tx.hpp"
#include"Bitcoin/TxId.hpp"
#include"Ev/Io.hpp"
#include"Opener/BroadcastDebouncer.hpp"
#include"Opener/ChainBroadcasterIF.hpp"
#include"Opener/log.hpp"

namespace Opener {

void BroadcastDebouncer::set_debounce( Bitcoin::TxId const& txid
				     , std::size_t count
				     ) {
	if (count == 0)
		expected.erase(txid);
	else
		expected[txid] = count;
}

Ev::Io<void> BroadcastDebouncer::broadcast(Bitcoin::Tx const& tx) {
	auto txid = tx.get_txid();
	auto it = expected.find(txid);
	if (it == expected.end())
		return chain.broadcast_transaction(tx);

	--it->second;
	if (it->second != 0)
		return Opener::log( bus, Debug
				  , "BroadcastDebouncer: %s: holding, "
				    "%zu more expected."
				  , std::string(txid).c_str()
				  , it->second
				  );

	expected.erase(it);
	auto tx_copy = tx;
	return Opener::log( bus, Info
			  , "BroadcastDebouncer: %s: broadcasting."
			  , std::string(txid).c_str()
			  ).then([this, tx_copy]() {
		return chain.broadcast_transaction(tx_copy);
	});
}

std::size_t BroadcastDebouncer::pending(Bitcoin::TxId const& txid) const {
	auto it = expected.find(txid);
	if (it == expected.end())
		return 0;
	return it->second;
}

}
