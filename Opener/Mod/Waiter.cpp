#include"Ev/Io.hpp"
#include"Opener/Mod/Waiter.hpp"
#include"Opener/Shutdown.hpp"
#include"S/Bus.hpp"
#include"Util/make_unique.hpp"
#include<ev.h>
#include<list>

namespace Opener { namespace Mod {

class Waiter::Impl {
private:
	struct Timer {
		ev_timer watcher;
		Impl* owner;
		std::function<void()> pass;
		std::function<void(std::exception_ptr)> fail;
	};
	/* std::list so watchers never move while
	 * libev holds pointers to them.  */
	std::list<Timer> timers;
	bool shutting_down;

	static
	void fail_shutdown(std::function<void(std::exception_ptr)> const& fail) {
		try {
			throw Opener::Shutdown();
		} catch (Opener::Shutdown const&) {
			fail(std::current_exception());
		}
	}

	static
	void on_timer(EV_P_ ev_timer* w, int) {
		auto t = static_cast<Timer*>(w->data);
		ev_timer_stop(EV_A_ w);
		auto pass = std::move(t->pass);
		auto owner = t->owner;
		for (auto it = owner->timers.begin(); it != owner->timers.end(); ++it) {
			if (&*it == t) {
				owner->timers.erase(it);
				break;
			}
		}
		pass();
	}

	void shutdown() {
		shutting_down = true;
		auto pending = std::move(timers);
		timers.clear();
		for (auto& t : pending) {
			ev_timer_stop(EV_DEFAULT_ &t.watcher);
			fail_shutdown(t.fail);
		}
	}

public:
	explicit
	Impl(S::Bus& bus) : shutting_down(false) {
		bus.subscribe<Opener::Shutdown>([this](Opener::Shutdown const&) {
			shutdown();
			return Ev::lift();
		});
	}
	~Impl() {
		for (auto& t : timers)
			ev_timer_stop(EV_DEFAULT_ &t.watcher);
	}

	Ev::Io<void> wait(double seconds) {
		return Ev::Io<void>([this, seconds]( std::function<void()> pass
						   , std::function<void(std::exception_ptr)> fail
						   ) {
			if (shutting_down)
				return fail_shutdown(fail);

			timers.emplace_back();
			auto& t = timers.back();
			t.owner = this;
			t.pass = std::move(pass);
			t.fail = std::move(fail);
			ev_timer_init(&t.watcher, &on_timer, seconds, 0);
			t.watcher.data = &t;
			ev_timer_start(EV_DEFAULT_ &t.watcher);
		});
	}
};

Waiter::Waiter(S::Bus& bus) : pimpl(Util::make_unique<Impl>(bus)) { }
Waiter::~Waiter() { }

Ev::Io<void> Waiter::wait(double seconds) {
	return pimpl->wait(seconds);
}

}}
