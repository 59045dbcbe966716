#include "types/digest.hpp"
#include "encoding/bech32.hpp"
#include "encoding/bfield_codec.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>

namespace zkverify {

bool Digest::operator==(const Digest& rhs) const {
    return elements_ == rhs.elements_;
}

bool Digest::operator!=(const Digest& rhs) const {
    return !(*this == rhs);
}

bool Digest::operator<(const Digest& rhs) const {
    return std::lexicographical_compare(
        elements_.begin(), elements_.end(),
        rhs.elements_.begin(), rhs.elements_.end());
}

std::string Digest::to_hex() const {
    std::ostringstream oss;
    for (size_t i = 0; i < LEN; ++i) {
        uint64_t val = elements_[i].value();
        for (size_t byte_idx = 0; byte_idx < 8; ++byte_idx) {
            uint8_t byte_val = static_cast<uint8_t>((val >> (byte_idx * 8)) & 0xFF);
            oss << std::setfill('0') << std::setw(2) << std::hex << static_cast<int>(byte_val);
        }
    }
    return oss.str();
}

std::string Digest::to_bech32m(const std::string& hrp) const {
    BFieldWriter writer;
    writer.put_digest(*this);
    return bech32::encode(hrp, writer.to_bytes());
}

Digest Digest::from_bech32m(const std::string& hrp, const std::string& text) {
    BFieldReader reader(bech32::decode_expecting(hrp, text));
    Digest digest = reader.take_digest();
    reader.expect_end();
    return digest;
}

std::ostream& operator<<(std::ostream& os, const Digest& digest) {
    return os << digest.to_hex();
}

} // namespace zkverify
