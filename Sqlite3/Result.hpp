#ifndef SQLITE3_RESULT_HPP
#define SQLITE3_RESULT_HPP

#include"Sqlite3/Db.hpp"
#include<cstdint>
#include<string>

namespace Sqlite3 { class Query; }

namespace Sqlite3 {

/** class Sqlite3::Result
 *
 * @brief the rows produced by an executed
 * query, traversed once.
 *
 * @desc Typical use:
 *
 *     auto res = tx.query(sql).bind(...).execute();
 *     while (res.next())
 *         use(res.column<std::string>(0));
 *
 * Statements that produce no rows have already
 * run to completion once `execute` returns.
 */
class Result {
private:
	Sqlite3::Db db;
	void* stmt;
	bool have_row;
	bool started;

	friend class Sqlite3::Query;
	Result(Sqlite3::Db const& db, void* stmt);

	bool step();

	std::int64_t column_int(int) const;
	double column_real(int) const;
	std::string column_text(int) const;

public:
	Result() =delete;
	Result(Result const&) =delete;
	Result(Result&&);
	~Result();

	/* Moves to the next row; false when there
	 * are no more.  */
	bool next();

	bool column_is_null(int c) const;

	template<typename a>
	a column(int c) const;

	/* Rows changed by the last INSERT, UPDATE
	 * or DELETE on this connection.  */
	int changes() const;
};

template<>
inline std::int64_t Result::column<std::int64_t>(int c) const {
	return column_int(c);
}
template<>
inline bool Result::column<bool>(int c) const {
	return column_int(c) != 0;
}
template<>
inline double Result::column<double>(int c) const {
	return column_real(c);
}
template<>
inline std::string Result::column<std::string>(int c) const {
	return column_text(c);
}

}

#endif /* !defined(SQLITE3_RESULT_HPP) */
