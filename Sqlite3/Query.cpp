#include"Sqlite3/Db.hpp"
#include"Sqlite3/Error.hpp"
#include"Sqlite3/Query.hpp"
#include"Sqlite3/Result.hpp"
#include"Util/make_unique.hpp"
#include<sqlite3.h>

namespace Sqlite3 {

class Query::Impl {
public:
	Sqlite3::Db db;
	sqlite3_stmt* stmt;

	Impl(Sqlite3::Db const& db_, void* stmt_)
		: db(db_), stmt((sqlite3_stmt*) stmt_) { }
	~Impl() {
		if (stmt)
			(void) sqlite3_finalize(stmt);
	}

	int index(char const* name) {
		auto i = sqlite3_bind_parameter_index(stmt, name);
		if (i == 0)
			throw Error( SQLITE_RANGE
				   , std::string("no parameter ") + name
				   );
		return i;
	}
	void check(int res, char const* name) {
		if (res != SQLITE_OK)
			throw Error(res, std::string("cannot bind ") + name);
	}
};

Query::Query(Sqlite3::Db const& db, void* stmt)
	: pimpl(Util::make_unique<Impl>(db, stmt)) { }
Query::Query(Query&& o) : pimpl(std::move(o.pimpl)) { }
Query::~Query() { }

void Query::bind_int(char const* name, std::int64_t v) {
	pimpl->check( sqlite3_bind_int64(pimpl->stmt, pimpl->index(name), v)
		    , name
		    );
}
void Query::bind_real(char const* name, double v) {
	pimpl->check( sqlite3_bind_double(pimpl->stmt, pimpl->index(name), v)
		    , name
		    );
}
Query& Query::bind(char const* name, std::string const& v) {
	pimpl->check( sqlite3_bind_text( pimpl->stmt, pimpl->index(name)
				       , v.c_str(), int(v.size())
				       , SQLITE_TRANSIENT
				       )
		    , name
		    );
	return *this;
}
Query& Query::bind_null(char const* name) {
	pimpl->check( sqlite3_bind_null(pimpl->stmt, pimpl->index(name))
		    , name
		    );
	return *this;
}

Result Query::execute() {
	auto stmt = pimpl->stmt;
	pimpl->stmt = nullptr;
	auto db = pimpl->db;
	pimpl = nullptr;
	return Result(db, stmt);
}

}
