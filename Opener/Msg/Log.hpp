#ifndef OPENER_MSG_LOG_HPP
#define OPENER_MSG_LOG_HPP

#include"Opener/log.hpp"
#include<string>

namespace Opener { namespace Msg {

/** struct Opener::Msg::Log
 *
 * @brief a formatted log line, raised by
 * `Opener::log`.
 */
struct Log {
	LogLevel level;
	std::string message;
};

}}

#endif /* !defined(OPENER_MSG_LOG_HPP) */
