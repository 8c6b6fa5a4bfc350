#ifndef SHA256_HASH_HPP
#define SHA256_HASH_HPP

#include<cstdint>
#include<iostream>
#include<memory>
#include<string>

namespace Sha256 { class Hasher; }

namespace Sha256 {

/** class Sha256::Hash
 *
 * @brief a 32-byte SHA-256 digest.
 *
 * @desc Default-constructed hashes are all
 * zeroes.
 */
class Hash {
private:
	struct Impl {
		std::uint8_t d[32];
	};
	std::shared_ptr<Impl> pimpl;

	friend class Sha256::Hasher;

public:
	Hash() =default;
	Hash(Hash const&) =default;
	Hash(Hash&&) =default;
	Hash& operator=(Hash const&) =default;
	Hash& operator=(Hash&&) =default;
	~Hash() =default;

	static
	bool valid_string(std::string const&);
	explicit
	Hash(std::string const&);

	explicit
	operator std::string() const;

	explicit
	operator bool() const;
	bool operator!() const { return !bool(*this); }

	bool operator==(Hash const&) const;
	bool operator!=(Hash const& i) const { return !(*this == i); }

	void to_buffer(std::uint8_t d[32]) const;
	void from_buffer(std::uint8_t const d[32]);
};

inline
std::ostream& operator<<(std::ostream& os, Hash const& i) {
	return os << std::string(i);
}

}

#endif /* !defined(SHA256_HASH_HPP) */
