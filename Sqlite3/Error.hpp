#ifndef SQLITE3_ERROR_HPP
#define SQLITE3_ERROR_HPP

#include"Util/BacktraceException.hpp"
#include<stdexcept>
#include<string>

namespace Sqlite3 {

/** class Sqlite3::Error
 *
 * @brief thrown when libsqlite3 reports a
 * failure; `code` is the extended result code.
 */
class Error : public Util::BacktraceException<std::runtime_error> {
public:
	int code;
	Error(int code_, std::string const& msg)
		: Util::BacktraceException<std::runtime_error>(
			"Sqlite3: " + msg
		  )
		, code(code_)
		{ }
};

}

#endif /* !defined(SQLITE3_ERROR_HPP) */
