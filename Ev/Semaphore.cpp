#include"Ev/Io.hpp"
#include"Ev/Semaphore.hpp"
#include"Ev/yield.hpp"
#include"Util/make_unique.hpp"
#include<functional>
#include<queue>

namespace Ev {

class Semaphore::Impl {
private:
	std::size_t remaining;

	struct Waiting {
		Ev::Io<void> action;
		std::function<void()> pass;
		std::function<void(std::exception_ptr)> fail;
	};
	std::queue<Waiting> blocked;

	/* Hand the slot to the next waiter, or return it.  */
	void release() {
		if (blocked.empty()) {
			++remaining;
			return;
		}
		auto next = std::move(blocked.front());
		blocked.pop();
		enter( std::move(next.action)
		     , std::move(next.pass)
		     , std::move(next.fail)
		     );
	}
	void enter( Ev::Io<void> action
		  , std::function<void()> pass
		  , std::function<void(std::exception_ptr)> fail
		  ) {
		action.run([this, pass]() {
			release();
			pass();
		}, [this, fail](std::exception_ptr e) {
			release();
			fail(e);
		});
	}

public:
	explicit
	Impl(std::size_t max) : remaining(max) { }

	Ev::Io<void> run(Ev::Io<void> action) {
		auto paction = std::make_shared<Ev::Io<void>>(std::move(action));
		return Ev::Io<void>([ this, paction
				    ]( std::function<void()> pass
				     , std::function<void(std::exception_ptr)> fail
				     ) {
			if (remaining > 0) {
				--remaining;
				enter(*paction, std::move(pass), std::move(fail));
			} else {
				blocked.push(Waiting{
					*paction, std::move(pass), std::move(fail)
				});
			}
		}) + Ev::yield();
	}
};

Semaphore::Semaphore(Semaphore&&) =default;
Semaphore::~Semaphore() =default;

Semaphore::Semaphore(std::size_t max)
	: pimpl(Util::make_unique<Impl>(max)) { }

Ev::Io<void> Semaphore::core_run(Ev::Io<void> action) {
	/* Yield first so the guarded action never runs on
	 * the stack of a releasing greenthread.  */
	return pimpl->run(Ev::yield() + std::move(action));
}

}
