#include"Ln/Amount.hpp"
#include<algorithm>
#include<sstream>
#include<stdexcept>

namespace Ln {

bool Amount::valid_string(std::string const& s) {
	if (s.size() < 5)
		return false;
	if (std::string(s.end() - 4, s.end()) != "msat")
		return false;
	/* 21e6 BTC in msat is 19 digits; anything longer
	 * would not fit anyway.  */
	if (s.size() > 19 + 4)
		return false;
	return std::all_of( s.begin(), s.end() - 4
			  , [](char c) { return '0' <= c && c <= '9'; }
			  );
}

Amount::Amount(std::string const& s) : v(0) {
	if (!valid_string(s))
		throw std::invalid_argument("Ln::Amount: invalid string: " + s);
	auto is = std::istringstream(std::string(s.begin(), s.end() - 4));
	is >> v;
}

Amount::operator std::string() const {
	auto os = std::ostringstream();
	os << v << "msat";
	return os.str();
}

}
