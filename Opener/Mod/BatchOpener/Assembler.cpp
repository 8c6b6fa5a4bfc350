#include"Bitcoin/Tx.hpp"
#include"Ev/Io.hpp"
#include"Ev/Semaphore.hpp"
#include"Opener/FeeEstimatorIF.hpp"
#include"Opener/FundingDraft.hpp"
#include"Opener/Mod/BatchOpener/Assembler.hpp"
#include"Opener/WalletIF.hpp"
#include"Opener/feerate.hpp"
#include"Opener/log.hpp"
#include<exception>
#include<memory>
#include<string>

namespace Opener { namespace Mod { namespace BatchOpener {

namespace {

/* Wallet implementations may throw their own
 * exception types; all of them are batch-fatal,
 * so they become `WalletError`.  */
Bitcoin::Tx build_and_sign(WalletIF& wallet, FundingDraft const& draft) {
	try {
		auto tx = wallet.build(draft);
		if (!wallet.sign(tx))
			throw WalletError("Wallet could not finalize "
					  "the funding transaction.");
		return tx;
	} catch (WalletError const&) {
		throw;
	} catch (std::exception const& e) {
		throw WalletError(e.what());
	}
}

}

Ev::Io<Bitcoin::Tx>
Assembler::assemble(std::vector<FundingEvent> const& events) {
	auto draft = std::make_shared<FundingDraft>();
	for (auto const& e : events)
		draft->recipients.emplace_back( e.channel_value
					      , e.output_script
					      );
	draft->enable_rbf = true;

	auto locked = Ev::lift().then([this]() {
		return fees.get_est_sat_per_1000_weight(
			ConfirmationTarget::Normal
		);
	}).catching<FeeEstimateError>([](FeeEstimateError const& e) -> Ev::Io<std::uint32_t> {
		throw WalletError( std::string("No fee estimate: ")
				 + e.what()
				 );
	}).then([this, draft](std::uint32_t perkw) {
		draft->feerate = feerate_from_perkw(perkw);
		return Ev::lift(build_and_sign(wallet, *draft));
	});

	return wallet_lock.run(std::move(locked)).then([this, draft](Bitcoin::Tx tx) {
		auto txid = std::string(tx.get_txid());
		return Opener::log( bus, Info
				  , "BatchOpener: funding transaction %s: "
				    "%zu channel outputs at %.3f sat/vB."
				  , txid.c_str()
				  , draft->recipients.size()
				  , draft->feerate
				  ).then([tx]() {
			return Ev::lift(tx);
		});
	});
}

}}}
