#ifndef SQLITE3_QUERY_HPP
#define SQLITE3_QUERY_HPP

#include<cstdint>
#include<memory>
#include<string>
#include<type_traits>

namespace Sqlite3 { class Db; }
namespace Sqlite3 { class Result; }
namespace Sqlite3 { class Tx; }

namespace Sqlite3 {

/** class Sqlite3::Query
 *
 * @brief a prepared statement awaiting its
 * parameters.
 *
 * @desc Parameters are named (`:name`).
 * Integers and bools bind as INTEGER, floating
 * point as REAL, strings as TEXT.
 * Unbound parameters are NULL.
 */
class Query {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	friend class Sqlite3::Tx;
	Query(Sqlite3::Db const&, void* stmt);

	void bind_int(char const*, std::int64_t);
	void bind_real(char const*, double);

public:
	Query() =delete;
	Query(Query&&);
	~Query();

	template<typename a>
	typename std::enable_if<std::is_integral<a>::value, Query&>::type
	bind(char const* name, a v) {
		bind_int(name, std::int64_t(v));
		return *this;
	}
	template<typename a>
	typename std::enable_if<std::is_floating_point<a>::value, Query&>::type
	bind(char const* name, a v) {
		bind_real(name, double(v));
		return *this;
	}
	Query& bind(char const* name, std::string const& v);
	Query& bind(char const* name, char const* v) {
		return bind(name, std::string(v));
	}
	Query& bind_null(char const* name);

	/* Runs the first step.  The Query is invalid
	 * afterwards.  Throws Sqlite3::Error.  */
	Result execute();
};

}

#endif /* !defined(SQLITE3_QUERY_HPP) */
