#include"Ev/Io.hpp"
#include"Ev/yield.hpp"
#include"Sqlite3/Db.hpp"
#include"Sqlite3/Error.hpp"
#include"Sqlite3/Tx.hpp"
#include<deque>
#include<functional>
#include<sqlite3.h>

namespace Sqlite3 {

class Db::Impl {
private:
	sqlite3* conn;
	bool busy;
	std::deque<std::function<void()>> waiters;

	void fail(char const* what) {
		auto code = conn ? sqlite3_extended_errcode(conn) : SQLITE_NOMEM;
		auto msg = std::string(what) + ": "
			 + (conn ? sqlite3_errmsg(conn) : "out of memory")
			 ;
		if (conn)
			sqlite3_close_v2(conn);
		conn = nullptr;
		throw Error(code, msg);
	}

public:
	explicit
	Impl(std::string const& filename) : conn(nullptr), busy(false) {
		if (sqlite3_open(filename.c_str(), &conn) != SQLITE_OK)
			fail("sqlite3_open");
		if (sqlite3_extended_result_codes(conn, 1) != SQLITE_OK)
			fail("sqlite3_extended_result_codes");
		if (sqlite3_exec( conn, "PRAGMA foreign_keys = ON;"
				, nullptr, nullptr, nullptr
				) != SQLITE_OK)
			fail("PRAGMA foreign_keys");
	}
	~Impl() {
		if (conn)
			sqlite3_close_v2(conn);
	}

	void* connection() const { return conn; }

	/* Calls `wake` once this greenthread owns the
	 * connection.  */
	void acquire(std::function<void()> wake) {
		if (!busy) {
			busy = true;
			wake();
		} else
			waiters.push_back(std::move(wake));
	}
	void release() {
		if (waiters.empty()) {
			busy = false;
			return;
		}
		auto wake = std::move(waiters.front());
		waiters.pop_front();
		wake();
	}
};

void* Db::connection() const {
	return pimpl->connection();
}
void Db::release() {
	pimpl->release();
}

Db::Db(std::string const& filename)
	: pimpl(std::make_shared<Impl>(filename)) { }

Ev::Io<Sqlite3::Tx> Db::transact() {
	auto self = *this;
	return Ev::Io<void>([self]( std::function<void()> pass
				  , std::function<void(std::exception_ptr)>
				  ) {
		self.pimpl->acquire(std::move(pass));
	}).then([]() {
		/* Resume from the main loop rather than
		 * from inside the releaser's stack.  */
		return Ev::yield();
	}).then([self]() {
		return Ev::lift(Sqlite3::Tx(self));
	});
}

}
