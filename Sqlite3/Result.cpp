#include"Sqlite3/Error.hpp"
#include"Sqlite3/Result.hpp"
#include<sqlite3.h>

namespace Sqlite3 {

Result::Result(Sqlite3::Db const& db_, void* stmt_)
	: db(db_), stmt(stmt_), have_row(false), started(false) {
	have_row = step();
}
Result::Result(Result&& o)
	: db(std::move(o.db))
	, stmt(o.stmt)
	, have_row(o.have_row)
	, started(o.started) {
	o.stmt = nullptr;
	o.have_row = false;
}
Result::~Result() {
	if (stmt)
		(void) sqlite3_finalize((sqlite3_stmt*) stmt);
}

bool Result::step() {
	if (!stmt)
		return false;
	auto ss = (sqlite3_stmt*) stmt;
	auto res = sqlite3_step(ss);
	if (res == SQLITE_ROW)
		return true;
	auto conn = (sqlite3*) db.connection();
	auto code = sqlite3_extended_errcode(conn);
	auto msg = std::string(sqlite3_errmsg(conn));
	sqlite3_finalize(ss);
	stmt = nullptr;
	if (res != SQLITE_DONE)
		throw Error(code, msg);
	return false;
}

bool Result::next() {
	/* The first row was fetched by the constructor.  */
	if (!started) {
		started = true;
		return have_row;
	}
	have_row = step();
	return have_row;
}

bool Result::column_is_null(int c) const {
	return sqlite3_column_type((sqlite3_stmt*) stmt, c) == SQLITE_NULL;
}
std::int64_t Result::column_int(int c) const {
	return sqlite3_column_int64((sqlite3_stmt*) stmt, c);
}
double Result::column_real(int c) const {
	return sqlite3_column_double((sqlite3_stmt*) stmt, c);
}
std::string Result::column_text(int c) const {
	auto ss = (sqlite3_stmt*) stmt;
	auto p = sqlite3_column_text(ss, c);
	auto len = sqlite3_column_bytes(ss, c);
	if (!p)
		return std::string();
	return std::string((char const*) p, std::size_t(len));
}

int Result::changes() const {
	return sqlite3_changes((sqlite3*) db.connection());
}

}
