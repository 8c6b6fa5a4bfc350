#ifndef OPENER_LOG_HPP
#define OPENER_LOG_HPP

#include<string>

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Opener {

enum LogLevel {
	Trace,
	Debug,
	Info,
	Warn,
	Error
};

/* "trace", "debug", ...  */
std::string log_level_name(LogLevel);
/* Throws std::invalid_argument on unknown names.  */
LogLevel log_level_from_name(std::string const&);

/** Opener::log
 *
 * @brief printf-style logging; raises an
 * `Opener::Msg::Log` on the bus.
 */
Ev::Io<void> log(S::Bus& bus, LogLevel l, const char *fmt, ...)
#if defined(__GNUC__)
	__attribute__ ((format (printf, 3, 4)))
#endif
;

}

#endif /* !defined(OPENER_LOG_HPP) */
