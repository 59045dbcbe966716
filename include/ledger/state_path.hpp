#pragma once

#include "types/b_field_element.hpp"
#include "types/digest.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace zkverify {

class MerkleTree;

// Human-readable parts of the ledger's bech32m strings
constexpr const char* STATE_ROOT_HRP = "sr";
constexpr const char* STATE_PATH_HRP = "path";

/**
 * StatePath - proof that a record commitment is a leaf of the ledger's
 * commitment tree whose root is the global state root.
 *
 * Text form is "path1..." (bech32m over a versioned field-element encoding).
 */
struct StatePath {
    static constexpr uint64_t VERSION = 1;

    Digest global_state_root;
    BFieldElement commitment;
    uint64_t leaf_index = 0;
    std::vector<Digest> siblings;

    // Leaf of the commitment tree for a record commitment
    static Digest leaf_digest(const BFieldElement& commitment);

    // Path of the leaf at `leaf_index` in a tree built from leaf_digest() values
    static StatePath from_tree(const MerkleTree& tree, size_t leaf_index, const BFieldElement& commitment);

    // True when the commitment leaf hashes up the siblings to global_state_root
    bool verify() const;

    std::string to_string() const;
    // @throws ParseError
    static StatePath from_string(const std::string& text);

    bool operator==(const StatePath& rhs) const {
        return global_state_root == rhs.global_state_root && commitment == rhs.commitment &&
               leaf_index == rhs.leaf_index && siblings == rhs.siblings;
    }
    bool operator!=(const StatePath& rhs) const { return !(*this == rhs); }
};

std::string state_root_to_string(const Digest& root);
// @throws ParseError
Digest state_root_from_string(const std::string& text);

} // namespace zkverify
