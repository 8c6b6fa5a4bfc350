#ifndef S_TAP_HPP
#define S_TAP_HPP

#include"Ev/Io.hpp"
#include"S/Bus.hpp"
#include<cstddef>
#include<deque>
#include<list>
#include<memory>
#include<utility>

namespace S {

/** class S::Tap<a>
 *
 * @brief turns the push-style bus subscription for
 * message type `a` into any number of independent
 * pull-style receivers.
 *
 * @desc The tap subscribes to the bus exactly once.
 * Every `Receiver` handed out by `subscribe` gets its
 * own copy of every `a` raised after it was created,
 * and drains it with a non-blocking `try_receive`.
 * Receivers that have been destroyed stop receiving;
 * the tap forgets them on the next message.
 *
 * The tap itself may be destroyed before the bus; the
 * bus subscription then keeps feeding any receivers
 * still alive.
 */
template<typename a>
class Tap {
private:
	typedef std::deque<a> Queue;
	typedef std::list<std::weak_ptr<Queue>> Queues;

	std::shared_ptr<Queues> queues;

	static
	void deliver(Queues& qs, a const& m) {
		auto it = qs.begin();
		while (it != qs.end()) {
			auto q = it->lock();
			if (!q) {
				it = qs.erase(it);
				continue;
			}
			q->push_back(m);
			++it;
		}
	}

public:
	class Receiver {
	private:
		std::shared_ptr<Queue> q;

		friend class Tap<a>;
		explicit
		Receiver(std::shared_ptr<Queue> q_) : q(std::move(q_)) { }

	public:
		Receiver() =delete;
		Receiver(Receiver const&) =delete;
		Receiver(Receiver&&) =default;
		Receiver& operator=(Receiver&&) =default;
		~Receiver() =default;

		/** S::Tap<a>::Receiver::try_receive
		 *
		 * @brief moves the oldest pending message
		 * into `out` and returns true, or returns
		 * false if there is none.
		 * Never suspends.
		 */
		bool try_receive(a& out) {
			if (!q || q->empty())
				return false;
			out = std::move(q->front());
			q->pop_front();
			return true;
		}

		std::size_t pending() const {
			return q ? q->size() : 0;
		}
	};

	Tap() =delete;
	Tap(Tap const&) =delete;
	Tap(Tap&&) =default;

	explicit
	Tap(S::Bus& bus) : queues(std::make_shared<Queues>()) {
		auto qs = queues;
		bus.subscribe<a>([qs](a const& m) {
			deliver(*qs, m);
			return Ev::lift();
		});
	}

	Receiver subscribe() {
		auto q = std::make_shared<Queue>();
		queues->push_back(q);
		return Receiver(std::move(q));
	}
};

}

#endif /* !defined(S_TAP_HPP) */
