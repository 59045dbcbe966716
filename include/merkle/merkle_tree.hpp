#pragma once

#include "types/digest.hpp"
#include "hash/tip5.hpp"
#include <vector>
#include <stdexcept>

namespace zkverify {

/**
 * MerkleTree - Binary tree of digests for commitment
 *
 * Commits to the ledger's record commitments; the state root of the ledger is
 * the root of this tree and a state path is a leaf's authentication path.
 * Uses the Tip5 hash function.
 */
class MerkleTree {
public:
    /**
     * Build a Merkle tree from the given leaves.
     *
     * @param leaves The leaves of the tree (must be power of 2)
     * @throws std::invalid_argument if leaves is empty or not power of 2
     */
    explicit MerkleTree(const std::vector<Digest>& leaves);

    Digest root() const;

    size_t num_leaves() const { return num_leaves_; }

    // Height of the tree (log2 of num_leaves)
    size_t height() const;

    Digest leaf(size_t index) const;

    // Sibling digests from the leaf up to (excluding) the root
    std::vector<Digest> authentication_path(size_t leaf_index) const;

    /**
     * Verify a leaf against a root with its authentication path.
     * Fails if leaf_index does not address a leaf of a tree of that height.
     */
    static bool verify(
        const Digest& root,
        size_t leaf_index,
        const Digest& leaf,
        const std::vector<Digest>& auth_path
    );

    static size_t sibling_index(size_t node_index) { return node_index ^ 1; }
    static size_t parent_index(size_t node_index) { return node_index / 2; }

private:
    // 1-indexed, root = 1, leaves at [num_leaves_, 2 * num_leaves_)
    std::vector<Digest> nodes_;
    size_t num_leaves_;

    void build_tree();
};

} // namespace zkverify
