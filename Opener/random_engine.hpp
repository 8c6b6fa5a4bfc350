#ifndef OPENER_RANDOM_ENGINE_HPP
#define OPENER_RANDOM_ENGINE_HPP

#include<random>

namespace Opener {

/* Process-wide engine, seeded once from the
 * system CSPRNG.  Not for key material.  */
extern std::default_random_engine random_engine;

}

#endif /* !defined(OPENER_RANDOM_ENGINE_HPP) */
