#ifndef EV_YIELD_HPP
#define EV_YIELD_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::yield
 *
 * @brief does nothing, but lets other greenthreads
 * run before this one resumes.
 *
 * @desc Anything shared with other greenthreads
 * may have changed by the time this returns.
 */
Ev::Io<void> yield();

}

#endif /* !defined(EV_YIELD_HPP) */
