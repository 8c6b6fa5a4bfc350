#ifndef S_BUS_HPP
#define S_BUS_HPP

#include"S/Detail/Signal.hpp"
#include"Util/make_unique.hpp"
#include<functional>
#include<memory>
#include<typeindex>
#include<typeinfo>

namespace S {

/** class S::Bus
 *
 * @brief typed message bus: modules subscribe to
 * message types, anyone can raise a message to all
 * subscribers of its type.
 *
 * @desc Subscriptions last as long as the bus.
 * For pull-style consumption with private state
 * per consumer, see `S::Tap`.
 */
class Bus {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	S::Detail::SignalBase&
	get_signal( std::type_index type
		  , std::function< std::unique_ptr<S::Detail::SignalBase>()
				 > make
		  );
	template<typename a>
	S::Detail::Signal<a>& get_signal_ex() {
		typedef S::Detail::Signal<a> Signal;
		auto& sbase = get_signal( std::type_index(typeid(Signal))
					, []() -> std::unique_ptr<S::Detail::SignalBase> {
			return Util::make_unique<Signal>();
		});
		return static_cast<Signal&>(sbase);
	}

public:
	Bus();
	Bus(Bus&&);
	~Bus();

	template<typename a>
	void subscribe(std::function<Ev::Io<void>(a const&)> cb) {
		get_signal_ex<a>().subscribe(std::move(cb));
	}
	template<typename a>
	Ev::Io<void> raise(a value) {
		return get_signal_ex<a>().raise(std::move(value));
	}
};

}

#endif /* !defined(S_BUS_HPP) */
