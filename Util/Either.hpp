#ifndef UTIL_EITHER_HPP
#define UTIL_EITHER_HPP

#include<new>
#include<stdexcept>
#include<utility>

namespace Util {

/** class Util::Either<L, R>
 *
 * @brief contains either an `L` or an `R`,
 * a typesafe sum type.
 *
 * @desc Stands in for `std::variant`, which is
 * C++17.
 * By convention `L` is the failure case and `R`
 * the success case.
 */
template<typename L, typename R>
class Either {
private:
	union U {
		L l;
		R r;
		/* Construction and destruction are handled
		 * by the owning `Either`.  */
		U() { }
		~U() { }
	} u;
	bool is_l;

	struct UnInit { };
	explicit Either(UnInit) { }

	void destroy() {
		if (is_l)
			u.l.~L();
		else
			u.r.~R();
	}

public:
	static
	Either left(L obj) {
		auto rv = Either(UnInit());
		rv.is_l = true;
		new(&rv.u.l) L(std::move(obj));
		return rv;
	}
	static
	Either right(R obj) {
		auto rv = Either(UnInit());
		rv.is_l = false;
		new(&rv.u.r) R(std::move(obj));
		return rv;
	}

	/* Default-constructed left.  */
	Either() : is_l(true) {
		new(&u.l) L();
	}
	Either(Either const& o) : is_l(o.is_l) {
		if (is_l)
			new(&u.l) L(o.u.l);
		else
			new(&u.r) R(o.u.r);
	}
	Either(Either&& o) : is_l(o.is_l) {
		if (is_l)
			new(&u.l) L(std::move(o.u.l));
		else
			new(&u.r) R(std::move(o.u.r));
	}
	~Either() { destroy(); }

	Either& operator=(Either const& o) {
		if (this == &o)
			return *this;
		auto tmp = Either(o);
		return *this = std::move(tmp);
	}
	Either& operator=(Either&& o) {
		if (this == &o)
			return *this;
		destroy();
		is_l = o.is_l;
		if (is_l)
			new(&u.l) L(std::move(o.u.l));
		else
			new(&u.r) R(std::move(o.u.r));
		return *this;
	}

	bool is_left() const { return is_l; }
	bool is_right() const { return !is_l; }

	/* Throw std::logic_error if the wrong side is accessed.  */
	L const& left_value() const {
		if (!is_l)
			throw std::logic_error("Util::Either: not left.");
		return u.l;
	}
	R const& right_value() const {
		if (is_l)
			throw std::logic_error("Util::Either: not right.");
		return u.r;
	}

	template<typename FL, typename FR>
	void cmatch(FL fl, FR fr) const {
		if (is_l)
			fl(u.l);
		else
			fr(u.r);
	}
	template<typename FL, typename FR>
	void match(FL fl, FR fr) const {
		cmatch(std::move(fl), std::move(fr));
	}
	template<typename FL, typename FR>
	void match(FL fl, FR fr) {
		if (is_l)
			fl(u.l);
		else
			fr(u.r);
	}
};

template<typename L, typename R>
bool operator==(Util::Either<L,R> const& a, Util::Either<L,R> const& b) {
	if (a.is_left() != b.is_left())
		return false;
	if (a.is_left())
		return a.left_value() == b.left_value();
	return a.right_value() == b.right_value();
}
template<typename L, typename R>
bool operator!=(Util::Either<L,R> const& a, Util::Either<L,R> const& b) {
	return !(a == b);
}

}

#endif /* !defined(UTIL_EITHER_HPP) */
