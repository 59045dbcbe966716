#pragma once

#include "types/b_field_element.hpp"
#include "hash/tip5.hpp"
#include "types/digest.hpp"
#include <array>
#include <string>
#include <vector>

namespace zkverify {

/**
 * Transcript - Fiat-Shamir transcript for non-interactive proofs
 *
 * Maintains a Tip5 sponge that absorbs public data and produces challenges.
 * Prover and verifier must absorb identical data in identical order.
 */
class Transcript {
public:
    explicit Transcript(const std::string& domain);

    // Absorb data into the sponge (variable-length padding)
    void absorb(const std::vector<BFieldElement>& data);

    // Squeeze a digest binding everything absorbed so far
    Digest challenge();

private:
    Tip5 sponge_;

    std::array<BFieldElement, Tip5::RATE> squeeze();
};

} // namespace zkverify
