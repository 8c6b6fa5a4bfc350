#ifndef OPENER_CHANNELCONFIG_HPP
#define OPENER_CHANNELCONFIG_HPP

#include<cstdint>

namespace Opener { struct OpenChannelRequest; }

namespace Opener {

/** struct Opener::ChannelConfig
 *
 * @brief per-channel settings handed to the
 * protocol engine when a channel is initiated.
 */
struct ChannelConfig {
	bool announced_channel;
	std::uint32_t forwarding_fee_proportional_millionths;
	std::uint32_t forwarding_fee_base_msat;
	std::uint16_t cltv_expiry_delta;
	std::uint64_t max_dust_htlc_exposure_msat;
	std::uint64_t force_close_avoidance_max_fee_satoshis;

	ChannelConfig()
		: announced_channel(true)
		, forwarding_fee_proportional_millionths(0)
		, forwarding_fee_base_msat(1000)
		, cltv_expiry_delta(72)
		, max_dust_htlc_exposure_msat(5000000)
		, force_close_avoidance_max_fee_satoshis(1000)
		{ }

	/* The request's overrides, announced iff the
	 * request is public.  */
	static
	ChannelConfig from_request(OpenChannelRequest const&);

	bool operator==(ChannelConfig const& o) const {
		return announced_channel == o.announced_channel
		    && forwarding_fee_proportional_millionths
		       == o.forwarding_fee_proportional_millionths
		    && forwarding_fee_base_msat == o.forwarding_fee_base_msat
		    && cltv_expiry_delta == o.cltv_expiry_delta
		    && max_dust_htlc_exposure_msat
		       == o.max_dust_htlc_exposure_msat
		    && force_close_avoidance_max_fee_satoshis
		       == o.force_close_avoidance_max_fee_satoshis
		     ;
	}
	bool operator!=(ChannelConfig const& o) const {
		return !(*this == o);
	}
};

}

#endif /* !defined(OPENER_CHANNELCONFIG_HPP) */
