#include"Bitcoin/encode.hpp"

namespace {

void put_le(std::ostream& os, std::uint64_t v, std::size_t width) {
	for (auto i = std::size_t(0); i < width; ++i) {
		os.put(char(v & 0xFF));
		v >>= 8;
	}
}

}

namespace Bitcoin {

void put_le32(std::ostream& os, std::uint32_t v) {
	put_le(os, v, 4);
}
void put_le64(std::ostream& os, std::uint64_t v) {
	put_le(os, v, 8);
}

void put_compact_size(std::ostream& os, std::uint64_t v) {
	if (v < 0xFD) {
		os.put(char(v));
	} else if (v <= 0xFFFF) {
		os.put(char(0xFD));
		put_le(os, v, 2);
	} else if (v <= 0xFFFFFFFF) {
		os.put(char(0xFE));
		put_le(os, v, 4);
	} else {
		os.put(char(0xFF));
		put_le(os, v, 8);
	}
}

void put_bytes(std::ostream& os, std::vector<std::uint8_t> const& b) {
	put_compact_size(os, b.size());
	for (auto c : b)
		os.put(char(c));
}

}
