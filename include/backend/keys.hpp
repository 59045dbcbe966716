#pragma once

#include "types/digest.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace zkverify {

/**
 * VerifyingKey - public half of a function's key pair ("verifier1...").
 *
 * An Ed25519 public key plus the circuit id it was synthesized for; the
 * (program, function) binding itself is established by the process at
 * registration time.
 */
struct VerifyingKey {
    static constexpr uint64_t VERSION = 2;
    static constexpr const char* HRP = "verifier";
    static constexpr size_t PUBLIC_KEY_SIZE = 32;

    std::array<uint8_t, PUBLIC_KEY_SIZE> public_key{};
    Digest circuit_id;

    std::string to_string() const;
    // @throws ParseError
    static VerifyingKey from_string(const std::string& text);
    static VerifyingKey from_file(const std::string& filepath);

    bool operator==(const VerifyingKey& rhs) const {
        return public_key == rhs.public_key && circuit_id == rhs.circuit_id;
    }
    bool operator!=(const VerifyingKey& rhs) const { return !(*this == rhs); }
};

/**
 * ProvingKey - secret half of a function's key pair ("prover1...").
 * Holds the Ed25519 seed together with the public key derived from it.
 */
struct ProvingKey {
    static constexpr uint64_t VERSION = 2;
    static constexpr const char* HRP = "prover";
    static constexpr size_t SEED_SIZE = 32;

    std::array<uint8_t, SEED_SIZE> seed{};
    std::array<uint8_t, VerifyingKey::PUBLIC_KEY_SIZE> public_key{};
    Digest circuit_id;

    VerifyingKey verifying_key() const { return VerifyingKey{public_key, circuit_id}; }

    std::string to_string() const;
    // @throws ParseError
    static ProvingKey from_string(const std::string& text);

    bool operator==(const ProvingKey& rhs) const {
        return seed == rhs.seed && public_key == rhs.public_key && circuit_id == rhs.circuit_id;
    }
};

/**
 * Proof - one Ed25519 signature per proven statement ("proof1...").
 */
struct Proof {
    static constexpr uint64_t VERSION = 2;
    static constexpr const char* HRP = "proof";
    static constexpr size_t SIGNATURE_SIZE = 64;

    using Signature = std::array<uint8_t, SIGNATURE_SIZE>;

    std::vector<Signature> signatures;

    std::string to_string() const;
    // @throws ParseError
    static Proof from_string(const std::string& text);

    bool operator==(const Proof& rhs) const { return signatures == rhs.signatures; }
    bool operator!=(const Proof& rhs) const { return !(*this == rhs); }
};

} // namespace zkverify
