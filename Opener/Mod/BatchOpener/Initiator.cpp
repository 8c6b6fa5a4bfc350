#include"Ev/Io.hpp"
#include"Ln/ChannelId.hpp"
#include"Ln/NodeId.hpp"
#include"Net/PeerAddr.hpp"
#include"Opener/ChannelConfig.hpp"
#include"Opener/Mod/BatchOpener/Initiator.hpp"
#include"Opener/PeerConnectorIF.hpp"
#include"Opener/ProtocolEngineIF.hpp"
#include"Opener/log.hpp"
#include"Secp256k1/PubKey.hpp"
#include<memory>

namespace {

/* Carries a per-request failure to the end of
 * the chain.  */
struct Failed {
	Opener::OpenError error;
};

}

namespace Opener { namespace Mod { namespace BatchOpener {

Ev::Io<OpenResult> Initiator::initiate(OpenChannelRequest const& request) {
	auto const& pk = request.counterparty_pubkey;
	if ( !Ln::NodeId::valid_string(pk)
	  || !Secp256k1::PubKey::valid_string(pk)
	   ) {
		auto err = OpenError( OpenError::InvalidPubkey
				    , "Not a valid node id: " + pk
				    );
		return Opener::log( bus, Warn
				  , "BatchOpener: %s"
				  , err.message.c_str()
				  ).then([err]() {
			return Ev::lift(OpenResult::left(err));
		});
	}
	auto node = Ln::NodeId(pk);

	/* Parse the address up front so that a bad one
	 * is reported even if we happen to be
	 * connected.  */
	auto addr = std::shared_ptr<Net::PeerAddr>();
	if (!request.counterparty_host_port.empty()) {
		try {
			addr = std::make_shared<Net::PeerAddr>(
				Net::PeerAddr::parse(request.counterparty_host_port)
			);
		} catch (Net::PeerAddrError const& e) {
			auto err = OpenError(OpenError::InvalidAddress, e.what());
			return Opener::log( bus, Warn
					  , "BatchOpener: %s: %s"
					  , pk.c_str()
					  , err.message.c_str()
					  ).then([err]() {
				return Ev::lift(OpenResult::left(err));
			});
		}
	}

	auto req = request;
	return Ev::lift().then([this, node]() {
		return peers.is_connected(node);
	}).then([this, node, addr](bool connected) {
		if (connected)
			return Ev::lift();
		if (!addr)
			throw Failed{OpenError(
				OpenError::MissingConnectionInfo,
				"Not connected to " + std::string(node)
				+ " and no address given."
			)};
		return peers.connect(node, *addr).catching<ConnectError>([node, addr](ConnectError const& e) -> Ev::Io<void> {
			throw Failed{OpenError(
				OpenError::ConnectionFailed,
				"Failed to connect to " + std::string(node)
				+ "@" + std::string(*addr) + ": " + e.what()
			)};
		});
	}).then([this, node, req]() {
		return engine.create_channel( node
					    , req.amount
					    , req.push_amount
					    , req.user_channel_id
					    , ChannelConfig::from_request(req)
					    );
	}).then([this, node, req](Ln::ChannelId tcid) {
		return Opener::log( bus, Info
				  , "BatchOpener: initiated channel with %s, "
				    "temporary id %s, user id %llu."
				  , std::string(node).c_str()
				  , std::string(tcid).c_str()
				  , (unsigned long long) req.user_channel_id
				  ).then([tcid]() {
			return Ev::lift(OpenResult::right(tcid));
		});
	}).catching<ConnectError>([this, node](ConnectError const& e) {
		auto err = OpenError( OpenError::ConnectionFailed
				    , "Cannot check connection to "
				    + std::string(node) + ": " + e.what()
				    );
		return Opener::log( bus, Warn
				  , "BatchOpener: %s"
				  , err.message.c_str()
				  ).then([err]() {
			return Ev::lift(OpenResult::left(err));
		});
	}).catching<ProtocolError>([this, node](ProtocolError const& e) {
		auto err = OpenError( OpenError::InitiationRejected
				    , std::string(e.what())
				    );
		return Opener::log( bus, Warn
				  , "BatchOpener: %s refused channel: %s"
				  , std::string(node).c_str()
				  , e.what()
				  ).then([err]() {
			return Ev::lift(OpenResult::left(err));
		});
	}).catching<Failed>([this](Failed const& f) {
		auto err = f.error;
		return Opener::log( bus, Warn
				  , "BatchOpener: %s"
				  , err.message.c_str()
				  ).then([err]() {
			return Ev::lift(OpenResult::left(err));
		});
	});
}

}}}
