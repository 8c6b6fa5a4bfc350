#ifndef OPENER_MOD_LOGPRINTER_HPP
#define OPENER_MOD_LOGPRINTER_HPP

#include"Opener/log.hpp"
#include<iosfwd>

namespace S { class Bus; }

namespace Opener { namespace Mod {

/** class Opener::Mod::LogPrinter
 *
 * @brief writes `Opener::Msg::Log` messages at or
 * above a threshold to a stream, one
 * `LEVEL: message` line each.
 */
class LogPrinter {
private:
	std::ostream& os;
	LogLevel threshold;

	void start(S::Bus& bus);

public:
	LogPrinter() =delete;
	LogPrinter(LogPrinter const&) =delete;

	LogPrinter( S::Bus& bus
		  , std::ostream& os_
		  , LogLevel threshold_ = Info
		  ) : os(os_), threshold(threshold_) { start(bus); }

	void set_threshold(LogLevel l) { threshold = l; }
};

}}

#endif /* !defined(OPENER_MOD_LOGPRINTER_HPP) */
