#include"Ev/Io.hpp"
#include"Opener/Mod/LogPrinter.hpp"
#include"Opener/Msg/Log.hpp"
#include"S/Bus.hpp"
#include<algorithm>
#include<cctype>
#include<ostream>

namespace Opener { namespace Mod {

void LogPrinter::start(S::Bus& bus) {
	bus.subscribe<Msg::Log>([this](Msg::Log const& l) {
		if (l.level < threshold)
			return Ev::lift();
		auto name = log_level_name(l.level);
		std::transform( name.begin(), name.end(), name.begin()
			      , [](char c) { return char(std::toupper((unsigned char) c)); }
			      );
		os << name << ": " << l.message << std::endl;
		return Ev::lift();
	});
}

}}
