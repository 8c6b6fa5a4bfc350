#ifndef EV_CONCURRENT_HPP
#define EV_CONCURRENT_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::concurrent
 *
 * @brief starts the given action as a new
 * greenthread the next time the current one
 * yields, and returns immediately.
 *
 * @desc Exceptions escaping the new greenthread
 * are reported on stderr and otherwise dropped.
 */
Ev::Io<void> concurrent(Ev::Io<void> io);

}

#endif /* !defined(EV_CONCURRENT_HPP) */
