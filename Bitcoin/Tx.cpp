#include"Bitcoin/Tx.hpp"
#include"Bitcoin/TxId.hpp"
#include"Bitcoin/encode.hpp"
#include"Sha256/HasherStream.hpp"
#include"Sha256/fun.hpp"
#include"Util/Str.hpp"
#include<algorithm>
#include<sstream>

namespace {

void write_tx(std::ostream& os, Bitcoin::Tx const& tx, bool with_witness) {
	auto segwit = with_witness && std::any_of
		( tx.inputs.begin(), tx.inputs.end()
		, [](Bitcoin::TxIn const& i) { return !i.witness.empty(); }
		);

	Bitcoin::put_le32(os, tx.nVersion);
	if (segwit) {
		/* Marker and flag.  */
		os.put(0x00);
		os.put(0x01);
	}

	Bitcoin::put_compact_size(os, tx.inputs.size());
	for (auto const& i : tx.inputs) {
		std::uint8_t prev[32];
		i.prevTxid.to_wire(prev);
		os.write((char const*) prev, sizeof(prev));
		Bitcoin::put_le32(os, i.prevOut);
		Bitcoin::put_bytes(os, i.scriptSig);
		Bitcoin::put_le32(os, i.nSequence);
	}

	Bitcoin::put_compact_size(os, tx.outputs.size());
	for (auto const& o : tx.outputs) {
		Bitcoin::put_le64(os, o.amount.to_sat());
		Bitcoin::put_bytes(os, o.scriptPubKey);
	}

	if (segwit) {
		for (auto const& i : tx.inputs) {
			Bitcoin::put_compact_size(os, i.witness.size());
			for (auto const& item : i.witness)
				Bitcoin::put_bytes(os, item);
		}
	}

	Bitcoin::put_le32(os, tx.nLockTime);
}

}

namespace Bitcoin {

std::ostream& operator<<(std::ostream& os, Tx const& tx) {
	write_tx(os, tx, true);
	return os;
}

Bitcoin::TxId Tx::get_txid() const {
	Sha256::HasherStream hasher;
	write_tx(hasher, *this, false);
	return Bitcoin::TxId::from_digest(
		Sha256::fun(std::move(hasher).finalize())
	);
}

bool Tx::signals_rbf() const {
	return std::any_of( inputs.begin(), inputs.end()
			  , [](TxIn const& i) { return i.signals_rbf(); }
			  );
}

Tx::operator std::string() const {
	std::ostringstream os;
	os << *this;
	auto str = os.str();
	return Util::Str::hexdump(str.data(), str.size());
}

}
