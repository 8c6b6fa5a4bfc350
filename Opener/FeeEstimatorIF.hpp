#ifndef OPENER_FEEESTIMATORIF_HPP
#define OPENER_FEEESTIMATORIF_HPP

#include"Util/BacktraceException.hpp"
#include<cstdint>
#include<stdexcept>
#include<string>

namespace Ev { template<typename a> class Io; }

namespace Opener {

enum class ConfirmationTarget {
	Background,
	Normal,
	HighPriority
};

/* Thrown when no estimate is available.  */
class FeeEstimateError : public Util::BacktraceException<std::runtime_error> {
public:
	explicit
	FeeEstimateError(std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(msg) { }
};

/** class Opener::FeeEstimatorIF
 *
 * @brief on-chain fee estimates, in satoshi per
 * 1000 weight units.
 *
 * @desc Failures are reported by throwing
 * `Opener::FeeEstimateError` in the returned
 * action.
 */
class FeeEstimatorIF {
public:
	virtual ~FeeEstimatorIF() { }

	virtual
	Ev::Io<std::uint32_t>
	get_est_sat_per_1000_weight(ConfirmationTarget) =0;
};

}

#endif /* !defined(OPENER_FEEESTIMATORIF_HPP) */
