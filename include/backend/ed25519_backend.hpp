#pragma once

#include "backend/backend.hpp"

namespace zkverify {

/**
 * Ed25519 backend: every statement is signed with its proving key.
 *
 * A Tip5 transcript absorbs, per statement, the verifying key, the circuit id
 * and the public inputs. Statement i is proven by an Ed25519 signature over
 * (challenge, i), so each signature binds the whole batch and its position.
 *
 * Signing and verification go through OpenSSL's EVP interface.
 */
class Ed25519Backend : public ProofBackend {
public:
    Ed25519Backend() = default;
    ~Ed25519Backend() override = default;

    BackendType type() const override { return BackendType::Ed25519; }
    std::string name() const override { return "Ed25519"; }

    ProvingKey synthesize(const Digest& circuit_id, ChaCha12Rng& rng) const override;
    Proof prove(const std::vector<ProvingStatement>& statements, ChaCha12Rng& rng) const override;
    bool verify(const Proof& proof, const std::vector<VerifyingStatement>& statements) const override;

private:
    static Digest challenge(const std::vector<VerifyingStatement>& statements);
    static std::vector<uint8_t> message(const Digest& challenge, size_t index);
};

} // namespace zkverify
