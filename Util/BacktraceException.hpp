#ifndef UTIL_BACKTRACE_EXCEPTION_HPP
#define UTIL_BACKTRACE_EXCEPTION_HPP

#include<utility>

namespace Util {

/** class Util::BacktraceException<E>
 *
 * @brief Base wrapper for the exceptions we throw.
 *
 * @desc Gives a single place to attach diagnostics
 * (e.g. a captured backtrace) to every exception
 * derived from a standard exception `E`.
 * Currently it only forwards to `E`.
 */
template<typename E>
class BacktraceException : public E {
public:
	template<typename... Args>
	BacktraceException(Args&&... args)
		: E(std::forward<Args>(args)...) { }

	char const* what() const noexcept override {
		return E::what();
	}
};

}

#endif /* !defined(UTIL_BACKTRACE_EXCEPTION_HPP) */
