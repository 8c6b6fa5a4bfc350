#include"Ev/Io.hpp"
#include"Opener/Msg/Log.hpp"
#include"Opener/log.hpp"
#include"S/Bus.hpp"
#include"Util/BacktraceException.hpp"
#include"Util/Str.hpp"
#include<stdarg.h>
#include<stdexcept>

namespace Opener {

std::string log_level_name(LogLevel l) {
	switch (l) {
	case Trace: return "trace";
	case Debug: return "debug";
	case Info: return "info";
	case Warn: return "warn";
	case Error: return "error";
	}
	return "unknown";
}

LogLevel log_level_from_name(std::string const& s) {
	if (s == "trace")
		return Trace;
	if (s == "debug")
		return Debug;
	if (s == "info")
		return Info;
	if (s == "warn")
		return Warn;
	if (s == "error")
		return Error;
	throw Util::BacktraceException<std::invalid_argument>(
		"Unknown log level: " + s
	);
}

Ev::Io<void> log(S::Bus& bus, LogLevel l, const char *fmt, ...) {
	va_list ap;

	va_start(ap, fmt);
	auto msg = Util::Str::vfmt(fmt, ap);
	va_end(ap);

	return bus.raise(Msg::Log{l, std::move(msg)});
}

}
