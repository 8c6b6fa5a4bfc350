#ifndef OPENER_FUNDINGDRAFT_HPP
#define OPENER_FUNDINGDRAFT_HPP

#include"Bitcoin/TxOut.hpp"
#include<vector>

namespace Opener {

/** struct Opener::FundingDraft
 *
 * @brief what the wallet is asked to fund: the
 * channel outputs, in event order, at a fee rate
 * in sat/vB.
 */
struct FundingDraft {
	std::vector<Bitcoin::TxOut> recipients;
	double feerate;
	bool enable_rbf;

	FundingDraft() : feerate(0), enable_rbf(true) { }
};

}

#endif /* !defined(OPENER_FUNDINGDRAFT_HPP) */
