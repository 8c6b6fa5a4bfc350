#ifndef OPENER_PEERCONNECTORIF_HPP
#define OPENER_PEERCONNECTORIF_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Ln { class NodeId; }
namespace Net { class PeerAddr; }

namespace Opener {

/* Thrown inside `connect` when the peer could not
 * be reached or the handshake failed.  */
class ConnectError : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	ConnectError(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(msg) { }
};

/** class Opener::PeerConnectorIF
 *
 * @brief the node's peer connection layer.
 */
class PeerConnectorIF {
public:
	virtual ~PeerConnectorIF() { }

	virtual
	Ev::Io<bool> is_connected(Ln::NodeId const&) =0;
	/* Idempotent: succeeds at once if already
	 * connected.  */
	virtual
	Ev::Io<void> connect( Ln::NodeId const&
			    , Net::PeerAddr const&
			    ) =0;
};

}

#endif /* !defined(OPENER_PEERCONNECTORIF_HPP) */
