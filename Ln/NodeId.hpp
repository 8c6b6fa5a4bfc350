#ifndef LN_NODEID_HPP
#define LN_NODEID_HPP

#include<cstdint>
#include<iostream>
#include<memory>
#include<string>

namespace Ln {

/** class Ln::NodeId
 *
 * @brief the public key of a node, i.e. the
 * node ID, in 33-byte compressed form.
 *
 * @desc Only the encoding is checked here; use
 * `Secp256k1::PubKey` to check that it is on the
 * curve.
 * A default-constructed node ID is all zeroes and
 * is false in boolean context.
 */
class NodeId {
private:
	struct Impl {
		std::uint8_t raw[33];
	};
	std::shared_ptr<Impl const> pimpl;

public:
	NodeId() =default;
	NodeId(NodeId const&) =default;
	NodeId(NodeId&&) =default;
	NodeId& operator=(NodeId const&) =default;
	NodeId& operator=(NodeId&&) =default;
	~NodeId() =default;

	/* Throws std::range_error if not 66 hex digits
	 * starting with 02 or 03.  */
	explicit
	NodeId(std::string const&);
	static
	bool valid_string(std::string const&);

	explicit
	operator std::string() const;

	explicit
	operator bool() const { return !!pimpl; }
	bool operator!() const { return !pimpl; }

	void to_buffer(std::uint8_t buffer[33]) const;

	bool operator==(NodeId const& o) const;
	bool operator!=(NodeId const& o) const {
		return !(*this == o);
	}
	bool operator<(NodeId const& o) const;
};

std::ostream& operator<<(std::ostream&, NodeId const&);

}

#endif /* !defined(LN_NODEID_HPP) */
