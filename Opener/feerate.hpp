#ifndef OPENER_FEERATE_HPP
#define OPENER_FEERATE_HPP

#include<cstdint>

namespace Opener {

/* Minimum relay fee, in sat per 1000 weight.  */
std::uint32_t const min_relay_perkw = 253;

/** Opener::feerate_from_perkw
 *
 * @brief converts sat per 1000 weight to sat/vB.
 *
 * @desc 253 is the rounded-up form of 1 sat/vB and
 * maps back to exactly 1.0; anything else is
 * divided by 250.
 */
double feerate_from_perkw(std::uint32_t perkw);

}

#endif /* !defined(OPENER_FEERATE_HPP) */
