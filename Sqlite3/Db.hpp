#ifndef SQLITE3_DB_HPP
#define SQLITE3_DB_HPP

#include<memory>
#include<string>

namespace Ev { template<typename a> class Io; }
namespace Sqlite3 { class Result; }
namespace Sqlite3 { class Tx; }

namespace Sqlite3 {

/** class Sqlite3::Db
 *
 * @brief a shared handle to an SQLITE3
 * database connection.
 *
 * @desc All access goes through `transact`,
 * which hands out one `Sqlite3::Tx` at a time.
 * Greenthreads that ask while a transaction is
 * live are queued in FIFO order.
 */
class Db {
private:
	class Impl;
	std::shared_ptr<Impl> pimpl;

	friend class Sqlite3::Result;
	friend class Sqlite3::Tx;

	void* connection() const;
	void release();

public:
	/* ":memory:" gives an in-memory db.
	 * Throws Sqlite3::Error.  */
	explicit
	Db(std::string const& filename);

	/* Invalid db.  */
	Db() =default;
	Db(Db const&) =default;
	Db(Db&&) =default;
	Db& operator=(Db const&) =default;
	Db& operator=(Db&&) =default;
	~Db() =default;

	explicit
	operator bool() const { return !!pimpl; }
	bool operator!() const { return !pimpl; }

	Ev::Io<Sqlite3::Tx> transact();
};

}

#endif /* !defined(SQLITE3_DB_HPP) */
