#ifndef OPENER_OPENERROR_HPP
#define OPENER_OPENERROR_HPP

#include"Ln/ChannelId.hpp"
#include"Opener/OpenChannelRequest.hpp"
#include"Util/Either.hpp"
#include<ostream>
#include<string>
#include<utility>
#include<vector>

namespace Opener {

/** struct Opener::OpenError
 *
 * @brief why one request in a batch did not
 * produce a channel.
 */
struct OpenError {
	enum Kind {
		/* Counterparty pubkey does not parse or is
		 * not on the curve.  */
		InvalidPubkey,
		/* host:port does not parse.  */
		InvalidAddress,
		/* No address and not already connected.  */
		MissingConnectionInfo,
		/* Caller-supplied user_channel_id repeats
		 * one used earlier in the batch.  */
		DuplicateUserChannelId,
		ConnectionFailed,
		/* Protocol engine refused to create.  */
		InitiationRejected,
		/* Created, but no funding-ready event came
		 * before the correlation timeout.  */
		FundingNeverHappened,
		/* Building or signing the shared funding
		 * transaction failed.  */
		FundingTxFailed,
		/* Protocol engine refused the funding
		 * transaction.  */
		FundingRejected
	};

	Kind kind;
	std::string message;

	OpenError() : kind(InvalidPubkey) { }
	OpenError(Kind kind_, std::string message_)
		: kind(kind_), message(std::move(message_)) { }

	bool operator==(OpenError const& o) const {
		return kind == o.kind && message == o.message;
	}
	bool operator!=(OpenError const& o) const {
		return !(*this == o);
	}
};

char const* kind_name(OpenError::Kind);

inline
std::ostream& operator<<(std::ostream& os, OpenError const& e) {
	return os << kind_name(e.kind) << ": " << e.message;
}

typedef Util::Either<OpenError, Ln::ChannelId> OpenResult;
/* One entry per request, in request order.  */
typedef std::vector<std::pair<OpenChannelRequest, OpenResult>> BatchResult;

}

#endif /* !defined(OPENER_OPENERROR_HPP) */
