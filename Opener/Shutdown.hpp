#ifndef OPENER_SHUTDOWN_HPP
#define OPENER_SHUTDOWN_HPP

namespace Opener {

/** struct Opener::Shutdown
 *
 * @brief raised on the bus when the process is
 * going down; also the exception that blocked
 * `Ev::Io` waits are failed with.
 */
struct Shutdown {};

}

#endif /* !defined(OPENER_SHUTDOWN_HPP) */
