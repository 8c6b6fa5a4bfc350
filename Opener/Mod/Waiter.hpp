#ifndef OPENER_MOD_WAITER_HPP
#define OPENER_MOD_WAITER_HPP

#include<memory>

namespace Ev { template<typename a> class Io; }
namespace S { class Bus; }

namespace Opener { namespace Mod {

/** class Opener::Mod::Waiter
 *
 * @brief timed suspension for greenthreads.
 *
 * @desc When an `Opener::Shutdown` is raised on
 * the bus, every pending wait fails with an
 * `Opener::Shutdown` exception, and so does every
 * later one.
 */
class Waiter {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Waiter() =delete;
	Waiter(Waiter const&) =delete;

	explicit
	Waiter(S::Bus& bus);
	~Waiter();

	/* Resumes after `seconds` of loop time.  */
	Ev::Io<void> wait(double seconds);
};

}}

#endif /* !defined(OPENER_MOD_WAITER_HPP) */
