#ifndef OPENER_OPTIONS_HPP
#define OPENER_OPTIONS_HPP

#include"Opener/log.hpp"
#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>
#include<vector>

namespace Opener {

/* Thrown on unknown options or bad values.  */
class OptionsError : public Util::BacktraceException<std::invalid_argument> {
public:
	explicit
	OptionsError(std::string const& msg)
		: Util::BacktraceException<std::invalid_argument>(msg) { }
};

/** struct Opener::Options
 *
 * @brief runtime settings, from `--name=value`
 * arguments.
 *
 * @desc
 *
 * - `--opener-funding-timeout=<seconds>`: how long a
 *   batch waits for funding-ready events.  Default 30.
 * - `--opener-poll-interval=<seconds>`: how often the
 *   wait checks for new events.  Default 0.5.
 * - `--opener-log-level=<trace|debug|info|warn|error>`:
 *   default `info`.
 * - `--opener-peer-db=<path>`: peer record database.
 *   Default `lnopener.sqlite3`.
 *
 * `Opener::Mod::BatchOpener::Main` has a
 * constructor taking these; `log_level` is the
 * threshold for `Opener::Mod::LogPrinter` and
 * `peer_db` the path the embedding program opens
 * for `Opener::PeerStore`.
 */
struct Options {
	double funding_timeout;
	double poll_interval;
	LogLevel log_level;
	std::string peer_db;

	Options()
		: funding_timeout(30.0)
		, poll_interval(0.5)
		, log_level(Info)
		, peer_db("lnopener.sqlite3")
		{ }

	static
	Options parse(std::vector<std::string> const& args);
};

}

#endif /* !defined(OPENER_OPTIONS_HPP) */
