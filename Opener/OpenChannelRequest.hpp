#ifndef OPENER_OPENCHANNELREQUEST_HPP
#define OPENER_OPENCHANNELREQUEST_HPP

#include"Ln/Amount.hpp"
#include"Opener/ChannelConfig.hpp"
#include<cstdint>
#include<string>

namespace Opener {

/** struct Opener::OpenChannelRequest
 *
 * @brief one channel the caller wants opened.
 *
 * @desc `counterparty_pubkey` is the hex node id.
 * An empty `counterparty_host_port` means no
 * address was given; the peer must then already
 * be connected.
 * A zero `user_channel_id` means none was given;
 * the batch opener assigns one before any
 * protocol call and never changes it after.
 */
struct OpenChannelRequest {
	std::string counterparty_pubkey;
	std::string counterparty_host_port;
	Ln::Amount amount;
	Ln::Amount push_amount;
	std::uint64_t user_channel_id;
	bool is_public;
	ChannelConfig config;

	OpenChannelRequest() : user_channel_id(0), is_public(true) { }
};

}

#endif /* !defined(OPENER_OPENCHANNELREQUEST_HPP) */
