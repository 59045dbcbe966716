#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace zkverify {
namespace bech32 {

/**
 * Bech32m (BIP-350) text codec.
 *
 * All canonical artifact strings ("sr1...", "path1...", "verifier1...",
 * "proof1...", "au1...", "aleo1...") use this encoding. Unlike BIP-173 there
 * is no 90-character limit, since keys and proofs are far longer.
 */

struct Decoded {
    std::string hrp;
    std::vector<uint8_t> payload;
};

// Encode a byte payload under the given human-readable part.
std::string encode(const std::string& hrp, const std::vector<uint8_t>& payload);

// Decode and verify the checksum. Throws ParseError on any malformation.
Decoded decode(const std::string& text);

// Decode and additionally require a specific human-readable part.
std::vector<uint8_t> decode_expecting(const std::string& hrp, const std::string& text);

} // namespace bech32
} // namespace zkverify
