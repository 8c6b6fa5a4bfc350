#ifndef S_DETAIL_SIGNAL_HPP
#define S_DETAIL_SIGNAL_HPP

#include"Ev/Io.hpp"
#include"Ev/concurrent.hpp"
#include"Ev/yield.hpp"
#include"S/Detail/SignalBase.hpp"
#include<cstddef>
#include<functional>
#include<memory>
#include<vector>

namespace S { namespace Detail {

/* Subscribers for one message type `a`.
 * `raise` starts every subscriber as its own greenthread
 * and completes when all of them have completed; if any
 * of them threw, one of the exceptions is rethrown.  */
template<typename a>
class Signal : public SignalBase {
private:
	typedef std::function<Ev::Io<void>(a const&)> Callback;
	/* Shared so that a raise in flight keeps iterating
	 * over a stable list even if a subscriber subscribes
	 * more callbacks.  */
	std::shared_ptr<std::vector<Callback>> callbacks;

	struct RaiseData {
		std::shared_ptr<a> value;
		std::size_t running;
		bool launching;
		std::exception_ptr exc;
		std::function<void()> pass;
		std::function<void(std::exception_ptr)> fail;

		void finish_one() {
			--running;
			if (!launching && running == 0)
				trigger();
		}
		void finish_launch() {
			launching = false;
			if (running == 0)
				trigger();
		}
		void trigger() {
			auto p = std::move(pass);
			auto f = std::move(fail);
			value = nullptr;
			if (exc)
				f(exc);
			else
				p();
		}
	};

public:
	Signal() : callbacks(std::make_shared<std::vector<Callback>>()) { }

	void subscribe(Callback cb) {
		if (!cb)
			return;
		/* Copy-on-write, so in-flight raises are undisturbed.  */
		auto copy = std::make_shared<std::vector<Callback>>(*callbacks);
		copy->push_back(std::move(cb));
		callbacks = std::move(copy);
	}

	Ev::Io<void> raise(a value) {
		auto pvalue = std::make_shared<a>(std::move(value));
		auto cbs = callbacks;
		return Ev::yield().then([pvalue, cbs]() {
			return Ev::Io<void>([ pvalue, cbs
					    ]( std::function<void()> pass
					     , std::function<void(std::exception_ptr)> fail
					     ) {
				auto pdata = std::make_shared<RaiseData>();
				pdata->value = pvalue;
				pdata->running = 0;
				pdata->launching = true;
				pdata->pass = std::move(pass);
				pdata->fail = std::move(fail);

				for (auto const& cb : *cbs) {
					++pdata->running;
					auto action = Ev::lift().then([pdata, cb]() {
						return cb(*pdata->value);
					});
					auto wrapped = Ev::Io<void>([ pdata, action
								    ]( std::function<void()> pass
								     , std::function<void(std::exception_ptr)>
								     ) {
						action.run([pdata, pass]() {
							pass();
							pdata->finish_one();
						}, [pdata, pass](std::exception_ptr e) {
							pdata->exc = e;
							pass();
							pdata->finish_one();
						});
					});
					Ev::concurrent(wrapped).run( []() { }
								   , [](std::exception_ptr) { }
								   );
				}
				pdata->finish_launch();
			});
		}).then([]() {
			return Ev::yield();
		});
	}
};

}}

#endif /* !defined(S_DETAIL_SIGNAL_HPP) */
