#ifndef UUID_HPP
#define UUID_HPP

#include<cstdint>
#include<iostream>
#include<memory>
#include<string>

/** class Uuid
 *
 * @brief 16 random bytes used as a record
 * identifier.
 *
 * @desc No RFC4122 version or variant bits are
 * set.
 * A default-constructed Uuid is all zeroes and
 * false in boolean context.
 */
class Uuid {
private:
	struct Impl {
		std::uint8_t data[16];
	};
	std::shared_ptr<Impl const> pimpl;

public:
	Uuid() =default;
	Uuid(Uuid&&) =default;
	Uuid(Uuid const&) =default;
	Uuid& operator=(Uuid&&) =default;
	Uuid& operator=(Uuid const&) =default;
	~Uuid() =default;

	static Uuid random();

	/* 32 hex digits.  */
	explicit Uuid(std::string const&);
	static
	bool valid_string(std::string const&);
	explicit operator std::string() const;

	explicit operator bool() const;
	bool operator!() const { return !bool(*this); }

	bool operator==(Uuid const& o) const;
	bool operator!=(Uuid const& o) const {
		return !(*this == o);
	}
};

inline
std::ostream& operator<<(std::ostream& os, Uuid const& i) {
	return os << std::string(i);
}

#endif /* !defined(UUID_HPP) */
