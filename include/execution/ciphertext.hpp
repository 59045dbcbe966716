#pragma once

#include "types/b_field_element.hpp"
#include <cstdint>
#include <string>

namespace zkverify {

// Human-readable parts of encrypted transition values
constexpr const char* CIPHERTEXT_HRP = "ciphertext";
constexpr const char* RECORD_CIPHERTEXT_HRP = "record";

/**
 * Encrypt a plaintext's text form under a transition view key. `slot` is the
 * value's position in the transition so equal plaintexts never share a mask.
 */
std::string encrypt_value(const std::string& hrp, const std::string& plaintext,
                          const BFieldElement& view_key, uint64_t slot);

// @throws ParseError on malformed ciphertext or a wrong key
std::string decrypt_value(const std::string& hrp, const std::string& ciphertext,
                          const BFieldElement& view_key, uint64_t slot);

// Structural check only (bech32m, version, canonical elements)
// @throws ParseError
void check_ciphertext(const std::string& hrp, const std::string& ciphertext);

} // namespace zkverify
