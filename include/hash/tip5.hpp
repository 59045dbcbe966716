#pragma once

#include "types/b_field_element.hpp"
#include "types/digest.hpp"
#include <array>
#include <vector>

namespace zkverify {

/**
 * Tip5 - Arithmetization-oriented hash function
 *
 * Reference implementation of the Tip5 permutation as specified in
 * "The Tip5 Hash Function for Recursive STARKs" (https://eprint.iacr.org/2023/107.pdf).
 * Used for every id, commitment, Merkle node and Fiat-Shamir challenge.
 */
class Tip5 {
public:
    static constexpr size_t STATE_SIZE = 16;
    static constexpr size_t NUM_SPLIT_AND_LOOKUP = 4;
    static constexpr size_t CAPACITY = 6;
    static constexpr size_t RATE = 10;
    static constexpr size_t NUM_ROUNDS = 5;

    // Lookup table for S-box
    static const std::array<uint8_t, 256> LOOKUP_TABLE;

    // MDS matrix first column (circulant matrix)
    static const std::array<int64_t, STATE_SIZE> MDS_MATRIX_FIRST_COLUMN;

    // Round constants
    static const std::array<BFieldElement, NUM_ROUNDS * STATE_SIZE> ROUND_CONSTANTS;

    std::array<BFieldElement, STATE_SIZE> state;

    Tip5();

    void permutation();

    // Hash functions
    static Digest hash_10(const std::array<BFieldElement, RATE>& input);
    static Digest hash_varlen(const std::vector<BFieldElement>& input);
    static Digest hash_pair(const Digest& left, const Digest& right);

private:
    void round(size_t round_index);
    void sbox_layer();
    void mds_layer();
    void add_round_constants(size_t round_index);

    static void split_and_lookup(BFieldElement& element);
};

} // namespace zkverify
