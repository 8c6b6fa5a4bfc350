#include"Opener/OpenError.hpp"

namespace Opener {

char const* kind_name(OpenError::Kind k) {
	switch (k) {
	case OpenError::InvalidPubkey: return "invalid pubkey";
	case OpenError::InvalidAddress: return "invalid address";
	case OpenError::MissingConnectionInfo: return "missing connection info";
	case OpenError::DuplicateUserChannelId: return "duplicate user_channel_id";
	case OpenError::ConnectionFailed: return "connection failed";
	case OpenError::InitiationRejected: return "initiation rejected";
	case OpenError::FundingNeverHappened: return "funding never happened";
	case OpenError::FundingTxFailed: return "funding transaction failed";
	case OpenError::FundingRejected: return "funding rejected";
	}
	return "unknown";
}

}
