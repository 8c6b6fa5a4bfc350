#ifndef SQLITE3_TX_HPP
#define SQLITE3_TX_HPP

#include<memory>
#include<string>

namespace Sqlite3 { class Db; }
namespace Sqlite3 { class Query; }

namespace Sqlite3 {

/** class Sqlite3::Tx
 *
 * @brief an open database transaction, got
 * from `Sqlite3::Db::transact`.
 *
 * @desc Move-only.
 * Changes persist only on `commit()`; a valid
 * `Tx` that is destroyed without committing is
 * rolled back.
 * Either way the connection is handed to the
 * next waiting greenthread.
 */
class Tx {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

	friend class Sqlite3::Db;
	explicit
	Tx(Sqlite3::Db const&);

public:
	Tx();
	Tx(Tx&&);
	Tx& operator=(Tx&&);
	~Tx();

	explicit
	operator bool() const { return !!pimpl; }
	bool operator!() const { return !pimpl; }

	Sqlite3::Query query(std::string const& sql);
	/* No parameters, no results; for DDL.  */
	void execute(std::string const& sql);

	/* Both leave the Tx invalid.
	 * commit() throws Sqlite3::Error.  */
	void commit();
	void rollback();
};

}

#endif /* !defined(SQLITE3_TX_HPP) */
