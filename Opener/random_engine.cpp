#include"Opener/random_engine.hpp"
#include<sodium/randombytes.h>

namespace Opener {

std::default_random_engine random_engine(
	std::default_random_engine::result_type(randombytes_random())
);

}
