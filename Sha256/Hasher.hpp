#ifndef SHA256_HASHER_HPP
#define SHA256_HASHER_HPP

#include<cstddef>
#include<memory>

namespace Sha256 { class Hash; }

namespace Sha256 {

/** class Sha256::Hasher
 *
 * @brief feed bytes in, then get the SHA-256 of
 * everything fed.
 */
class Hasher {
private:
	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	Hasher();
	Hasher(Hasher&&);
	/* Duplicates midstate.  */
	Hasher(Hasher const&);
	~Hasher();

	Hasher& operator=(Hasher&&);

	/* False once finalized.  */
	explicit
	operator bool() const;
	bool operator!() const { return !bool(*this); }

	void feed(void const* p, std::size_t size);

	Sha256::Hash finalize()&&;
};

}

#endif /* !defined(SHA256_HASHER_HPP) */
