#include"Opener/Options.hpp"
#include<cmath>
#include<cstdlib>

namespace {

double parse_seconds(std::string const& name, std::string const& v) {
	if (v.empty())
		throw Opener::OptionsError("--" + name + ": empty value");
	auto end = (char*) nullptr;
	auto d = std::strtod(v.c_str(), &end);
	if (*end != '\0' || !std::isfinite(d) || d <= 0)
		throw Opener::OptionsError( "--" + name
					  + ": expected positive seconds, got '"
					  + v + "'"
					  );
	return d;
}

}

namespace Opener {

Options Options::parse(std::vector<std::string> const& args) {
	auto rv = Options();
	for (auto const& a : args) {
		if (a.compare(0, 2, "--") != 0)
			throw OptionsError("Not an option: " + a);
		auto eq = a.find('=');
		if (eq == std::string::npos)
			throw OptionsError("Option needs a value: " + a);
		auto name = a.substr(2, eq - 2);
		auto value = a.substr(eq + 1);

		if (name == "opener-funding-timeout")
			rv.funding_timeout = parse_seconds(name, value);
		else if (name == "opener-poll-interval")
			rv.poll_interval = parse_seconds(name, value);
		else if (name == "opener-log-level") {
			try {
				rv.log_level = log_level_from_name(value);
			} catch (std::invalid_argument const& e) {
				throw OptionsError("--" + name + ": " + e.what());
			}
		} else if (name == "opener-peer-db") {
			if (value.empty())
				throw OptionsError("--" + name + ": empty path");
			rv.peer_db = value;
		} else
			throw OptionsError("Unknown option: --" + name);
	}
	return rv;
}

}
