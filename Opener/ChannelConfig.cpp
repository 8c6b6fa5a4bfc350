#include"Opener/ChannelConfig.hpp"
#include"Opener/OpenChannelRequest.hpp"

namespace Opener {

ChannelConfig ChannelConfig::from_request(OpenChannelRequest const& r) {
	auto rv = r.config;
	rv.announced_channel = r.is_public;
	return rv;
}

}
