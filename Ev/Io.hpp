#ifndef EV_IO_HPP
#define EV_IO_HPP

#include<exception>
#include<functional>
#include<memory>
#include<type_traits>
#include<utility>

namespace Ev {

template<typename a>
class Io;

namespace Detail {

/* Io<a> -> a.  */
template<typename t>
struct IoInner;
template<typename a>
struct IoInner<Io<a>> {
	typedef a type;
};

/* The continuation that receives a value of type a.  */
template<typename a>
struct PassFunc {
	typedef std::function<void(a)> type;
};
template<>
struct PassFunc<void> {
	typedef std::function<void()> type;
};

typedef std::function<void(std::exception_ptr)> FailFunc;

/* Common part of Io<a> and Io<void>.  */
template<typename a>
class IoBase {
public:
	typedef std::function<void( typename PassFunc<a>::type
				  , FailFunc
				  )> CoreFunc;

protected:
	CoreFunc core;

	template<typename b>
	friend class Ev::Io;
	template<typename b>
	friend class IoBase;

public:
	explicit
	IoBase(CoreFunc core_) : core(std::move(core_)) { }

	/** Ev::Io<a>::catching<e>
	 *
	 * @brief if this action throws an `e`, run
	 * the handler and continue with its action
	 * instead.
	 * Other exceptions propagate unchanged.
	 */
	template<typename e>
	Io<a> catching(std::function<Io<a>(e const&)> handler) const {
		auto core_copy = core;
		return Io<a>([ core_copy
			     , handler
			     ]( typename PassFunc<a>::type pass
			      , FailFunc fail
			      ) {
			auto sub_fail = [ pass, fail
					, handler
					](std::exception_ptr err) {
				try {
					std::rethrow_exception(err);
				} catch (e const& ex) {
					try {
						handler(ex).core(pass, fail);
					} catch (...) {
						fail(std::current_exception());
					}
				} catch (...) {
					fail(std::current_exception());
				}
			};
			core_copy(pass, sub_fail);
		});
	}

	/** Ev::Io<a>::run
	 *
	 * @brief starts the action, calling exactly
	 * one of `pass` or `fail` when it finishes.
	 */
	void run( typename PassFunc<a>::type pass
		, FailFunc fail
		) const {
		try {
			core(std::move(pass), fail);
		} catch (...) {
			fail(std::current_exception());
		}
	}
};

}

template<typename a>
class Io : public Detail::IoBase<a> {
public:
	explicit
	Io(typename Detail::IoBase<a>::CoreFunc core_)
		: Detail::IoBase<a>(std::move(core_)) { }

	/* (>>=) :: IO a -> (a -> IO b) -> IO b */
	template<typename f>
	Io<typename Detail::IoInner<typename std::result_of<f(a)>::type>::type>
	then(f func) const {
		typedef typename Detail::IoInner<
			typename std::result_of<f(a)>::type
		>::type b;
		auto core_copy = this->core;
		return Io<b>([ core_copy
			     , func
			     ]( typename Detail::PassFunc<b>::type pass
			      , Detail::FailFunc fail
			      ) {
			try {
				auto sub_pass = [func, pass, fail](a value) {
					try {
						func(std::move(value)).core(pass, fail);
					} catch (...) {
						fail(std::current_exception());
					}
				};
				core_copy(sub_pass, fail);
			} catch (...) {
				fail(std::current_exception());
			}
		});
	}
};

template<>
class Io<void> : public Detail::IoBase<void> {
public:
	explicit
	Io(Detail::IoBase<void>::CoreFunc core_)
		: Detail::IoBase<void>(std::move(core_)) { }

	/* (>>=) :: IO () -> (() -> IO b) -> IO b */
	template<typename f>
	Io<typename Detail::IoInner<typename std::result_of<f()>::type>::type>
	then(f func) const {
		typedef typename Detail::IoInner<
			typename std::result_of<f()>::type
		>::type b;
		auto core_copy = core;
		return Io<b>([ core_copy
			     , func
			     ]( typename Detail::PassFunc<b>::type pass
			      , Detail::FailFunc fail
			      ) {
			try {
				auto sub_pass = [func, pass, fail]() {
					try {
						func().core(pass, fail);
					} catch (...) {
						fail(std::current_exception());
					}
				};
				core_copy(sub_pass, fail);
			} catch (...) {
				fail(std::current_exception());
			}
		});
	}
};

template<typename a>
Io<a> lift(a val) {
	auto container = std::make_shared<a>(std::move(val));
	return Io<a>([container]( std::function<void(a)> pass
				, Detail::FailFunc
				) {
		pass(std::move(*container));
	});
}
inline
Io<void> lift() {
	return Io<void>([]( std::function<void()> pass
			  , Detail::FailFunc
			  ) {
		pass();
	});
}

/* Sequencing: run the first, then the second.  */
template<typename a>
Io<a> operator+(Io<void> first, Io<a> second) {
	return first.then([second]() {
		return second;
	});
}
inline
Io<void>& operator+=(Io<void>& first, Io<void> second) {
	first = first + std::move(second);
	return first;
}

}

#endif /* !defined(EV_IO_HPP) */
