#include "backend/backend.hpp"
#include "backend/ed25519_backend.hpp"

namespace zkverify {

std::unique_ptr<ProofBackend> ProofBackend::create(BackendType type) {
    switch (type) {
        case BackendType::Ed25519:
            return std::make_unique<Ed25519Backend>();
        default:
            throw std::runtime_error("Unknown backend type");
    }
}

} // namespace zkverify
