#include "backend/ed25519_backend.hpp"
#include "backend/transcript.hpp"
#include "encoding/bfield_codec.hpp"
#include <openssl/err.h>
#include <openssl/evp.h>
#include <algorithm>
#include <memory>
#include <stdexcept>

namespace zkverify {
namespace {

constexpr const char* TRANSCRIPT_DOMAIN = "zkverify.ed25519.v1";

struct PkeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

PkeyPtr private_key(const std::array<uint8_t, ProvingKey::SEED_SIZE>& seed) {
    PkeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()));
    if (!key) {
        throw std::runtime_error("EVP_PKEY_new_raw_private_key failed");
    }
    return key;
}

std::array<uint8_t, VerifyingKey::PUBLIC_KEY_SIZE> public_key_of(EVP_PKEY* key) {
    std::array<uint8_t, VerifyingKey::PUBLIC_KEY_SIZE> out{};
    size_t len = out.size();
    if (EVP_PKEY_get_raw_public_key(key, out.data(), &len) != 1 || len != out.size()) {
        throw std::runtime_error("EVP_PKEY_get_raw_public_key failed");
    }
    return out;
}

Proof::Signature sign(EVP_PKEY* key, const std::vector<uint8_t>& message) {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key) != 1) {
        throw std::runtime_error("EVP_DigestSignInit failed");
    }
    Proof::Signature signature{};
    size_t len = signature.size();
    if (EVP_DigestSign(ctx.get(), signature.data(), &len, message.data(), message.size()) != 1 ||
        len != signature.size()) {
        throw std::runtime_error("EVP_DigestSign failed");
    }
    return signature;
}

bool verify_signature(const std::array<uint8_t, VerifyingKey::PUBLIC_KEY_SIZE>& public_key,
                      const Proof::Signature& signature, const std::vector<uint8_t>& message) {
    PkeyPtr key(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(), public_key.size()));
    MdCtxPtr ctx(EVP_MD_CTX_new());
    bool valid = key && ctx &&
                 EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) == 1 &&
                 EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                                  message.data(), message.size()) == 1;
    // A rejected signature leaves an entry on this thread's error queue
    ERR_clear_error();
    return valid;
}

bool all_zero(const std::array<uint8_t, ProvingKey::SEED_SIZE>& bytes) {
    return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
}

} // namespace

ProvingKey Ed25519Backend::synthesize(const Digest& circuit_id, ChaCha12Rng& rng) const {
    ProvingKey key;
    do {
        for (size_t i = 0; i < key.seed.size(); i += 8) {
            uint64_t word = rng.next_u64();
            for (size_t j = 0; j < 8; ++j) {
                key.seed[i + j] = static_cast<uint8_t>(word >> (8 * j));
            }
        }
    } while (all_zero(key.seed));
    key.public_key = public_key_of(private_key(key.seed).get());
    key.circuit_id = circuit_id;
    return key;
}

Digest Ed25519Backend::challenge(const std::vector<VerifyingStatement>& statements) {
    Transcript transcript(TRANSCRIPT_DOMAIN);
    for (const auto& statement : statements) {
        BFieldWriter writer;
        writer.put_bytes(std::vector<uint8_t>(statement.key.public_key.begin(), statement.key.public_key.end()));
        writer.put_digest(statement.key.circuit_id);
        writer.put_elements(statement.public_inputs);
        transcript.absorb(writer.elements());
    }
    return transcript.challenge();
}

std::vector<uint8_t> Ed25519Backend::message(const Digest& challenge, size_t index) {
    BFieldWriter writer;
    writer.put_digest(challenge);
    writer.put_u64(index);
    return writer.to_bytes();
}

// Ed25519 signing is deterministic; the rng is not drawn from
Proof Ed25519Backend::prove(const std::vector<ProvingStatement>& statements, ChaCha12Rng& /*rng*/) const {
    if (statements.empty()) {
        throw std::invalid_argument("nothing to prove");
    }

    std::vector<VerifyingStatement> public_statements;
    std::vector<PkeyPtr> keys;
    for (const auto& statement : statements) {
        if (all_zero(statement.key.seed)) {
            throw std::invalid_argument("proving key is unset");
        }
        PkeyPtr key = private_key(statement.key.seed);
        if (public_key_of(key.get()) != statement.key.public_key) {
            throw std::invalid_argument("proving key does not match its public key");
        }
        keys.push_back(std::move(key));
        public_statements.push_back({statement.key.verifying_key(), statement.public_inputs});
    }

    const Digest c = challenge(public_statements);
    Proof proof;
    for (size_t i = 0; i < keys.size(); ++i) {
        proof.signatures.push_back(sign(keys[i].get(), message(c, i)));
    }
    return proof;
}

bool Ed25519Backend::verify(const Proof& proof, const std::vector<VerifyingStatement>& statements) const {
    if (statements.empty() || proof.signatures.size() != statements.size()) {
        return false;
    }

    const Digest c = challenge(statements);
    for (size_t i = 0; i < statements.size(); ++i) {
        if (!verify_signature(statements[i].key.public_key, proof.signatures[i], message(c, i))) {
            return false;
        }
    }
    return true;
}

} // namespace zkverify
