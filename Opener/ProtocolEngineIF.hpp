#ifndef OPENER_PROTOCOLENGINEIF_HPP
#define OPENER_PROTOCOLENGINEIF_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>
#include<string>

namespace Bitcoin { struct Tx; }
namespace Ev { template<typename a> class Io; }
namespace Ln { class Amount; }
namespace Ln { class ChannelId; }
namespace Ln { class NodeId; }
namespace Opener { struct ChannelConfig; }

namespace Opener {

/* Thrown when the protocol engine refuses an
 * operation.  */
class ProtocolError : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	ProtocolError(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(msg) { }
};

/** class Opener::ProtocolEngineIF
 *
 * @brief the per-channel state machines.
 *
 * @desc After a successful `create_channel` the
 * engine later raises an
 * `Opener::Msg::FundingGenerationReady` on the
 * bus carrying the same `user_channel_id`.
 */
class ProtocolEngineIF {
public:
	virtual ~ProtocolEngineIF() { }

	/* Returns the temporary channel id.  */
	virtual
	Ev::Io<Ln::ChannelId>
	create_channel( Ln::NodeId const& counterparty
		      , Ln::Amount value
		      , Ln::Amount push
		      , std::uint64_t user_channel_id
		      , ChannelConfig const& config
		      ) =0;

	/* Not idempotent; call once per temporary
	 * channel id.  */
	virtual
	Ev::Io<void>
	funding_transaction_generated( Ln::ChannelId const& temporary_channel_id
				     , Ln::NodeId const& counterparty
				     , Bitcoin::Tx tx
				     ) =0;
};

}

#endif /* !defined(OPENER_PROTOCOLENGINEIF_HPP) */
