#include"Opener/feerate.hpp"

namespace Opener {

double feerate_from_perkw(std::uint32_t perkw) {
	if (perkw == min_relay_perkw)
		return 1.0;
	return double(perkw) / 250.0;
}

}
