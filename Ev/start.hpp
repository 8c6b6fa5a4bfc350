#ifndef EV_START_HPP
#define EV_START_HPP

namespace Ev { template<typename a> class Io; }

namespace Ev {

/** Ev::start
 *
 * @brief runs the main loop with the given action
 * as the first greenthread, returning its result
 * as the process exit code once the loop has no
 * more work.
 *
 * @desc An exception escaping the action gives
 * exit code 254.
 */
int start(Ev::Io<int> main);

}

#endif /* !defined(EV_START_HPP) */
