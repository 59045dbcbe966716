#include "encoding/bech32.hpp"
#include "common/errors.hpp"
#include <array>

namespace zkverify {
namespace bech32 {
namespace {

constexpr const char* CHARSET = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";
constexpr uint32_t BECH32M_CONST = 0x2bc830a3;
constexpr size_t CHECKSUM_LEN = 6;

// Reverse lookup for CHARSET, -1 for characters outside it
const std::array<int8_t, 128>& charset_rev() {
    static const std::array<int8_t, 128> table = [] {
        std::array<int8_t, 128> t;
        t.fill(-1);
        for (int i = 0; i < 32; ++i) {
            t[static_cast<unsigned char>(CHARSET[i])] = static_cast<int8_t>(i);
        }
        return t;
    }();
    return table;
}

uint32_t polymod(const std::vector<uint8_t>& values) {
    static constexpr uint32_t GEN[5] = {
        0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3
    };
    uint32_t chk = 1;
    for (uint8_t v : values) {
        uint32_t top = chk >> 25;
        chk = ((chk & 0x1ffffff) << 5) ^ v;
        for (int i = 0; i < 5; ++i) {
            if ((top >> i) & 1) {
                chk ^= GEN[i];
            }
        }
    }
    return chk;
}

std::vector<uint8_t> expand_hrp(const std::string& hrp) {
    std::vector<uint8_t> out;
    out.reserve(hrp.size() * 2 + 1);
    for (char c : hrp) out.push_back(static_cast<uint8_t>(c) >> 5);
    out.push_back(0);
    for (char c : hrp) out.push_back(static_cast<uint8_t>(c) & 31);
    return out;
}

std::vector<uint8_t> create_checksum(const std::string& hrp, const std::vector<uint8_t>& data) {
    std::vector<uint8_t> values = expand_hrp(hrp);
    values.insert(values.end(), data.begin(), data.end());
    values.resize(values.size() + CHECKSUM_LEN, 0);
    uint32_t mod = polymod(values) ^ BECH32M_CONST;
    std::vector<uint8_t> checksum(CHECKSUM_LEN);
    for (size_t i = 0; i < CHECKSUM_LEN; ++i) {
        checksum[i] = (mod >> (5 * (5 - i))) & 31;
    }
    return checksum;
}

// Regroup bits; when decoding (pad == false) leftover bits must be zero padding.
bool convert_bits(std::vector<uint8_t>& out, const std::vector<uint8_t>& in,
                  int from_bits, int to_bits, bool pad) {
    uint32_t acc = 0;
    int bits = 0;
    const uint32_t maxv = (1u << to_bits) - 1;
    for (uint8_t value : in) {
        acc = (acc << from_bits) | value;
        bits += from_bits;
        while (bits >= to_bits) {
            bits -= to_bits;
            out.push_back(static_cast<uint8_t>((acc >> bits) & maxv));
        }
    }
    if (pad) {
        if (bits) out.push_back(static_cast<uint8_t>((acc << (to_bits - bits)) & maxv));
    } else if (bits >= from_bits || ((acc << (to_bits - bits)) & maxv)) {
        return false;
    }
    return true;
}

} // namespace

std::string encode(const std::string& hrp, const std::vector<uint8_t>& payload) {
    std::vector<uint8_t> data;
    data.reserve((payload.size() * 8 + 4) / 5);
    convert_bits(data, payload, 8, 5, true);

    std::vector<uint8_t> checksum = create_checksum(hrp, data);

    std::string result = hrp + '1';
    result.reserve(result.size() + data.size() + CHECKSUM_LEN);
    for (uint8_t d : data) result += CHARSET[d];
    for (uint8_t c : checksum) result += CHARSET[c];
    return result;
}

Decoded decode(const std::string& text) {
    bool has_lower = false;
    bool has_upper = false;
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 33 || uc > 126) {
            throw ParseError("bech32: invalid character");
        }
        if (c >= 'a' && c <= 'z') has_lower = true;
        if (c >= 'A' && c <= 'Z') has_upper = true;
    }
    if (has_lower && has_upper) {
        throw ParseError("bech32: mixed case");
    }

    std::string lowered = text;
    for (char& c : lowered) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }

    size_t sep = lowered.rfind('1');
    if (sep == std::string::npos || sep == 0) {
        throw ParseError("bech32: missing separator or human-readable part");
    }
    if (lowered.size() - sep - 1 < CHECKSUM_LEN) {
        throw ParseError("bech32: data part too short");
    }

    Decoded decoded;
    decoded.hrp = lowered.substr(0, sep);

    std::vector<uint8_t> data;
    data.reserve(lowered.size() - sep - 1);
    const auto& rev = charset_rev();
    for (size_t i = sep + 1; i < lowered.size(); ++i) {
        int8_t v = rev[static_cast<unsigned char>(lowered[i])];
        if (v < 0) {
            throw ParseError("bech32: character outside charset");
        }
        data.push_back(static_cast<uint8_t>(v));
    }

    std::vector<uint8_t> values = expand_hrp(decoded.hrp);
    values.insert(values.end(), data.begin(), data.end());
    if (polymod(values) != BECH32M_CONST) {
        throw ParseError("bech32: checksum mismatch");
    }

    data.resize(data.size() - CHECKSUM_LEN);
    if (!convert_bits(decoded.payload, data, 5, 8, false)) {
        throw ParseError("bech32: invalid padding");
    }
    return decoded;
}

std::vector<uint8_t> decode_expecting(const std::string& hrp, const std::string& text) {
    Decoded decoded = decode(text);
    if (decoded.hrp != hrp) {
        throw ParseError("bech32: expected prefix '" + hrp + "', found '" + decoded.hrp + "'");
    }
    return std::move(decoded.payload);
}

} // namespace bech32
} // namespace zkverify
