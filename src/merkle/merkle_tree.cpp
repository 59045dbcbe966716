#include "merkle/merkle_tree.hpp"
#include <algorithm>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace zkverify {

MerkleTree::MerkleTree(const std::vector<Digest>& leaves) {
    if (leaves.empty()) {
        throw std::invalid_argument("Cannot create Merkle tree with no leaves");
    }

    if ((leaves.size() & (leaves.size() - 1)) != 0) {
        throw std::invalid_argument("Number of leaves must be a power of 2");
    }

    num_leaves_ = leaves.size();

    // Index 0 is unused, index 1 is root
    nodes_.resize(2 * num_leaves_);
    std::copy(leaves.begin(), leaves.end(), nodes_.begin() + num_leaves_);

    build_tree();
}

void MerkleTree::build_tree() {
    // Nodes on the same level are independent, so each level is hashed in parallel
    size_t level_size = num_leaves_ / 2;
    size_t level_start = num_leaves_ / 2;

    while (level_size >= 1) {
        #pragma omp parallel for schedule(static) if(level_size > 64)
        for (size_t i = 0; i < level_size; ++i) {
            size_t node_idx = level_start + i;
            nodes_[node_idx] = Tip5::hash_pair(nodes_[2 * node_idx], nodes_[2 * node_idx + 1]);
        }

        level_start /= 2;
        level_size /= 2;
    }
}

Digest MerkleTree::root() const {
    // For a single-leaf tree nodes_[1] is the leaf itself
    return nodes_[1];
}

size_t MerkleTree::height() const {
    size_t h = 0;
    while ((size_t(1) << h) < num_leaves_) {
        ++h;
    }
    return h;
}

Digest MerkleTree::leaf(size_t index) const {
    if (index >= num_leaves_) {
        throw std::out_of_range("Leaf index out of range");
    }
    return nodes_[num_leaves_ + index];
}

std::vector<Digest> MerkleTree::authentication_path(size_t leaf_index) const {
    if (leaf_index >= num_leaves_) {
        throw std::out_of_range("Leaf index out of range");
    }

    std::vector<Digest> path;
    path.reserve(height());

    size_t current_index = num_leaves_ + leaf_index;
    while (current_index > 1) {
        path.push_back(nodes_[sibling_index(current_index)]);
        current_index = parent_index(current_index);
    }

    return path;
}

bool MerkleTree::verify(
    const Digest& root,
    size_t leaf_index,
    const Digest& leaf,
    const std::vector<Digest>& auth_path
) {
    if (auth_path.size() < sizeof(size_t) * 8 && (leaf_index >> auth_path.size()) != 0) {
        return false;
    }

    Digest current = leaf;
    size_t index = leaf_index;

    for (const Digest& sibling : auth_path) {
        if (index % 2 == 0) {
            current = Tip5::hash_pair(current, sibling);
        } else {
            current = Tip5::hash_pair(sibling, current);
        }
        index /= 2;
    }

    return current == root;
}

} // namespace zkverify
