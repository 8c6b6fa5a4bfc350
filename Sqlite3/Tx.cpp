#include"Sqlite3/Db.hpp"
#include"Sqlite3/Error.hpp"
#include"Sqlite3/Query.hpp"
#include"Sqlite3/Tx.hpp"
#include"Util/make_unique.hpp"
#include<sqlite3.h>

namespace Sqlite3 {

class Tx::Impl {
private:
	Sqlite3::Db db;
	bool done;

	sqlite3* conn() const {
		return (sqlite3*) db.connection();
	}
	void check(int res, std::string const& what) {
		if (res != SQLITE_OK)
			throw Error( sqlite3_extended_errcode(conn())
				   , what + ": " + sqlite3_errmsg(conn())
				   );
	}
	int run(char const* sql) {
		return sqlite3_exec(conn(), sql, nullptr, nullptr, nullptr);
	}

public:
	explicit
	Impl(Sqlite3::Db const& db_) : db(db_), done(false) {
		auto res = run("BEGIN");
		if (res != SQLITE_OK) {
			db.release();
			check(res, "BEGIN");
		}
	}
	~Impl() {
		if (!done)
			/* Nothing useful to do if this fails.  */
			(void) run("ROLLBACK");
		db.release();
	}

	void execute(std::string const& sql) {
		check(run(sql.c_str()), sql);
	}
	sqlite3_stmt* prepare(std::string const& sql) {
		auto stmt = (sqlite3_stmt*) nullptr;
		check( sqlite3_prepare_v2( conn(), sql.c_str(), -1
					 , &stmt, nullptr
					 )
		     , sql
		     );
		return stmt;
	}
	Sqlite3::Db const& get_db() const { return db; }
	void commit() {
		check(run("COMMIT"), "COMMIT");
		done = true;
	}
};

Tx::Tx(Sqlite3::Db const& db) : pimpl(Util::make_unique<Impl>(db)) { }
Tx::Tx() { }
Tx::Tx(Tx&& o) : pimpl(std::move(o.pimpl)) { }
Tx& Tx::operator=(Tx&& o) {
	auto tmp = std::move(o);
	std::swap(pimpl, tmp.pimpl);
	return *this;
}
Tx::~Tx() { }

Query Tx::query(std::string const& sql) {
	auto stmt = pimpl->prepare(sql);
	return Query(pimpl->get_db(), stmt);
}
void Tx::execute(std::string const& sql) {
	pimpl->execute(sql);
}
void Tx::commit() {
	pimpl->commit();
	pimpl = nullptr;
}
void Tx::rollback() {
	pimpl = nullptr;
}

}
