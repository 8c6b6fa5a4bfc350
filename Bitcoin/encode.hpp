#ifndef BITCOIN_ENCODE_HPP
#define BITCOIN_ENCODE_HPP

#include<cstdint>
#include<iostream>
#include<vector>

namespace Bitcoin {

/* Primitive writers for the consensus
 * serialization.  Integers are little-endian;
 * lengths use CompactSize.  */
void put_le32(std::ostream&, std::uint32_t);
void put_le64(std::ostream&, std::uint64_t);
void put_compact_size(std::ostream&, std::uint64_t);
/* CompactSize length prefix, then the bytes.  */
void put_bytes(std::ostream&, std::vector<std::uint8_t> const&);

}

#endif /* !defined(BITCOIN_ENCODE_HPP) */
