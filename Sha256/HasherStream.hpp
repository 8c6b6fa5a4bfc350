#ifndef SHA256_HASHERSTREAM_HPP
#define SHA256_HASHERSTREAM_HPP

#include<iostream>
#include<memory>

namespace Sha256 { class Hash; }

namespace Sha256 {

namespace Detail {

class HasherStreamBuf : public std::basic_streambuf<char> {
private:
	typedef std::basic_streambuf<char> Base;

	class Impl;
	std::unique_ptr<Impl> pimpl;

public:
	HasherStreamBuf(HasherStreamBuf const&) =delete;
	HasherStreamBuf();
	~HasherStreamBuf();

	int_type overflow(int_type) override;

	Hash finalize()&&;
};

/* Ensures the buffer exists before the ostream
 * base is constructed.  */
class HasherStreamBase {
protected:
	std::unique_ptr<HasherStreamBuf> buf;
	HasherStreamBase();
};

}

/** class Sha256::HasherStream
 *
 * @brief an `std::ostream` that hashes whatever
 * is written to it, so any type with a
 * serializing `operator<<` can be hashed
 * directly.
 */
class HasherStream : private Detail::HasherStreamBase, public std::ostream {
public:
	HasherStream() : std::ostream(buf.get()) { }

	Hash finalize()&&;
};

}

#endif /* !defined(SHA256_HASHERSTREAM_HPP) */
