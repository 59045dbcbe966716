#pragma once

#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "backend/keys.hpp"
#include "chacha12_rng.hpp"

namespace zkverify {

/**
 * Backend type enumeration
 */
enum class BackendType {
    Ed25519    // Ed25519 signatures over a Tip5 transcript (reference)
};

/**
 * Convert string to BackendType
 * @throws std::invalid_argument on an unknown name
 */
inline BackendType backend_from_string(const std::string& s) {
    if (s == "ed25519" || s == "ED25519") {
        return BackendType::Ed25519;
    }
    throw std::invalid_argument("Unknown proof backend: " + s);
}

/**
 * Get backend type from environment variable ZKVERIFY_BACKEND
 */
inline BackendType backend_from_env() {
    const char* env = std::getenv("ZKVERIFY_BACKEND");
    if (env) {
        return backend_from_string(env);
    }
    return BackendType::Ed25519;
}

/**
 * ProvingStatement / VerifyingStatement - a key together with the public
 * inputs of one transition.
 */
struct ProvingStatement {
    ProvingKey key;
    std::vector<BFieldElement> public_inputs;
};

struct VerifyingStatement {
    VerifyingKey key;
    std::vector<BFieldElement> public_inputs;
};

/**
 * Abstract proof backend.
 *
 * The process reduces every transition to a statement and hands the batch to
 * the backend; the backend never sees programs or executions.
 */
class ProofBackend {
public:
    virtual ~ProofBackend() = default;

    virtual BackendType type() const = 0;

    /**
     * Get backend name for logging
     */
    virtual std::string name() const = 0;

    /**
     * Derive a fresh key pair for the circuit with the given id
     */
    virtual ProvingKey synthesize(const Digest& circuit_id, ChaCha12Rng& rng) const = 0;

    /**
     * Prove all statements at once; the proof holds one signature per statement
     */
    virtual Proof prove(const std::vector<ProvingStatement>& statements, ChaCha12Rng& rng) const = 0;

    /**
     * Check a proof against the statements. Returns false on any mismatch,
     * including a signature count that differs from the statement count.
     */
    virtual bool verify(const Proof& proof, const std::vector<VerifyingStatement>& statements) const = 0;

    /**
     * Factory method to create a backend
     * @param type Backend type to create
     * @return Unique pointer to backend
     */
    static std::unique_ptr<ProofBackend> create(BackendType type);

    /**
     * Create backend from environment variable
     */
    static std::unique_ptr<ProofBackend> create_from_env() {
        return create(backend_from_env());
    }
};

} // namespace zkverify
