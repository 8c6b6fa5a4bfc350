#undef NDEBUG
#include"Uuid.hpp"
#include<assert.h>
#include<sstream>
#include<stdexcept>

int main() {
	assert(!Uuid());
	assert(Uuid() == Uuid(std::string(32, '0')));

	auto a = Uuid::random();
	auto b = Uuid::random();
	/* With overwhelming probability.  */
	assert(a && b && a != b);
	assert(Uuid(std::string(a)) == a);

	auto const s = std::string("0f1e2d3c4b5a69788796a5b4c3d2e1f0");
	assert(Uuid::valid_string(s));
	assert(!Uuid::valid_string(s.substr(2)));
	assert(!Uuid::valid_string(s.substr(0, 31) + "g"));
	auto u = Uuid(s);
	std::ostringstream os;
	os << u;
	assert(os.str() == s);

	auto thrown = false;
	try {
		Uuid tmp("not a uuid");
	} catch (std::invalid_argument const&) {
		thrown = true;
	}
	assert(thrown);

	return 0;
}
