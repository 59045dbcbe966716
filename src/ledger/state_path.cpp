#include "ledger/state_path.hpp"
#include "common/errors.hpp"
#include "encoding/bech32.hpp"
#include "encoding/bfield_codec.hpp"
#include "hash/tip5.hpp"
#include "merkle/merkle_tree.hpp"

namespace zkverify {

Digest StatePath::leaf_digest(const BFieldElement& commitment) {
    BFieldWriter writer;
    writer.put_string("commitment_leaf");
    writer.put(commitment);
    return Tip5::hash_varlen(writer.elements());
}

StatePath StatePath::from_tree(const MerkleTree& tree, size_t leaf_index, const BFieldElement& commitment) {
    if (tree.leaf(leaf_index) != leaf_digest(commitment)) {
        throw std::invalid_argument("commitment does not match leaf " + std::to_string(leaf_index));
    }
    StatePath path;
    path.global_state_root = tree.root();
    path.commitment = commitment;
    path.leaf_index = leaf_index;
    path.siblings = tree.authentication_path(leaf_index);
    return path;
}

bool StatePath::verify() const {
    return MerkleTree::verify(global_state_root, static_cast<size_t>(leaf_index),
                              leaf_digest(commitment), siblings);
}

std::string StatePath::to_string() const {
    BFieldWriter writer;
    writer.put_u64(VERSION);
    writer.put_digest(global_state_root);
    writer.put(commitment);
    writer.put_u64(leaf_index);
    writer.put_digests(siblings);
    return bech32::encode(STATE_PATH_HRP, writer.to_bytes());
}

StatePath StatePath::from_string(const std::string& text) {
    BFieldReader reader(bech32::decode_expecting(STATE_PATH_HRP, text));
    uint64_t version = reader.take_u64();
    if (version != VERSION) {
        throw ParseError("unsupported state path version " + std::to_string(version));
    }
    StatePath path;
    path.global_state_root = reader.take_digest();
    path.commitment = reader.take();
    path.leaf_index = reader.take_u64();
    path.siblings = reader.take_digests();
    reader.expect_end();
    if (path.siblings.size() >= 64) {
        throw ParseError("state path is too long");
    }
    return path;
}

std::string state_root_to_string(const Digest& root) {
    return root.to_bech32m(STATE_ROOT_HRP);
}

Digest state_root_from_string(const std::string& text) {
    return Digest::from_bech32m(STATE_ROOT_HRP, text);
}

} // namespace zkverify
