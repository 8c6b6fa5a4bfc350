#ifndef OPENER_MSG_FUNDINGGENERATIONREADY_HPP
#define OPENER_MSG_FUNDINGGENERATIONREADY_HPP

#include"Ln/Amount.hpp"
#include"Ln/NodeId.hpp"
#include<cstdint>
#include<vector>

namespace Opener { namespace Msg {

/** struct Opener::Msg::FundingGenerationReady
 *
 * @brief raised by the protocol engine once a
 * channel it initiated has agreed parameters and
 * needs a funding output.
 *
 * @desc `user_channel_id` echoes the id given to
 * `create_channel`.
 * `node_id` is the local node that initiated; more
 * than one local node may share a bus.
 */
struct FundingGenerationReady {
	Ln::NodeId node_id;
	std::uint64_t user_channel_id;
	Ln::NodeId counterparty_node_id;
	Ln::Amount channel_value;
	std::vector<std::uint8_t> output_script;
};

}}

#endif /* !defined(OPENER_MSG_FUNDINGGENERATIONREADY_HPP) */
