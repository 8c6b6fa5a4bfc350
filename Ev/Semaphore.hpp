#ifndef EV_SEMAPHORE_HPP
#define EV_SEMAPHORE_HPP

#include"Ev/Io.hpp"
#include<cstddef>
#include<memory>
#include<utility>

namespace Ev {

/** class Ev::Semaphore
 *
 * @brief lets at most a fixed number of
 * greenthreads run a guarded action at once;
 * the rest block (letting others run) in FIFO
 * order until a slot frees up.
 *
 * @desc A slot is released whether the guarded
 * action completes or throws; exceptions from
 * the action propagate to the caller.
 * With a maximum of 1 this is a mutex for
 * greenthreads.
 */
class Semaphore {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	Ev::Io<void> core_run(Ev::Io<void> action);

public:
	Semaphore() =delete;
	Semaphore(Semaphore const&) =delete;
	Semaphore(Semaphore&&);
	~Semaphore();

	explicit
	Semaphore(std::size_t max);

	template<typename a>
	Ev::Io<a> run(Ev::Io<a> action) {
		auto presult = std::make_shared<std::shared_ptr<a>>();
		auto void_action = action.then([presult](a rv) {
			*presult = std::make_shared<a>(std::move(rv));
			return Ev::lift();
		});
		return core_run(std::move(void_action)).then([presult]() {
			return Ev::lift(std::move(**presult));
		});
	}
	Ev::Io<void> run(Ev::Io<void> action) {
		return core_run(std::move(action));
	}
};

}

#endif /* !defined(EV_SEMAPHORE_HPP) */
