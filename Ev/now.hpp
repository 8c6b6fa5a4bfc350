#ifndef EV_NOW_HPP
#define EV_NOW_HPP

namespace Ev {

/** Ev::now
 *
 * @brief current time in seconds from the epoch,
 * as seen by the main loop.
 */
double now();

}

#endif /* !defined(EV_NOW_HPP) */
