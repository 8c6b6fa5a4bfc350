#ifndef OPENER_MOD_BATCHOPENER_INITIATOR_HPP
#define OPENER_MOD_BATCHOPENER_INITIATOR_HPP

#include"Opener/OpenError.hpp"

namespace Ev { template<typename a> class Io; }
namespace Opener { class PeerConnectorIF; }
namespace Opener { class ProtocolEngineIF; }
namespace S { class Bus; }

namespace Opener { namespace Mod { namespace BatchOpener {

/** class Opener::Mod::BatchOpener::Initiator
 *
 * @brief starts one channel open: makes sure the
 * counterparty is connected, then asks the
 * protocol engine to create the channel.
 *
 * @desc Every failure is returned as the left
 * side of the result; nothing is thrown for
 * per-request problems.
 * Checks run in this order: counterparty pubkey,
 * address (whenever one is given), existing
 * connection, connect, create.
 * A request without an address to a peer that is
 * not connected fails with
 * `MissingConnectionInfo` at once.
 */
class Initiator {
private:
	S::Bus& bus;
	Opener::PeerConnectorIF& peers;
	Opener::ProtocolEngineIF& engine;

public:
	Initiator() =delete;
	Initiator(Initiator const&) =delete;

	Initiator( S::Bus& bus_
		 , Opener::PeerConnectorIF& peers_
		 , Opener::ProtocolEngineIF& engine_
		 ) : bus(bus_), peers(peers_), engine(engine_) { }

	/* The request must already carry its
	 * user_channel_id.  */
	Ev::Io<OpenResult> initiate(OpenChannelRequest const& request);
};

}}}

#endif /* !defined(OPENER_MOD_BATCHOPENER_INITIATOR_HPP) */
