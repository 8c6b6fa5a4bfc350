#ifndef UTIL_MAKE_UNIQUE_HPP
#define UTIL_MAKE_UNIQUE_HPP

#include<memory>
#include<utility>

namespace Util {

/** Util::make_unique
 *
 * @brief `std::make_unique` is C++14; this is
 * the single-object form for C++11.
 */
template<typename T, typename... As>
std::unique_ptr<T> make_unique(As&&... as) {
	return std::unique_ptr<T>(new T(std::forward<As>(as)...));
}

}

#endif /* !defined(UTIL_MAKE_UNIQUE_HPP) */
