#pragma once

#include "ledger/state_query.hpp"
#include <map>
#include <string>

namespace zkverify {

/**
 * OfflineQuery - a StateQuery backed by a fixed state root and a caller
 * supplied set of state paths, for verifying without network access.
 *
 * Built once, then read-only. JSON form:
 *   {"state_paths":{"<commitment>":"path1...",...},"state_root":"sr1..."}
 */
class OfflineQuery : public StateQuery {
public:
    // @throws ParseError if state_root is not an "sr1..." string
    explicit OfflineQuery(const std::string& state_root);
    explicit OfflineQuery(const Digest& state_root) : state_root_(state_root) {}

    /**
     * Insert or replace the path stored for a commitment ("<n>field").
     * The path is not checked against the commitment or the state root here.
     * @throws ParseError on malformed commitment or path text
     */
    void add_state_path(const std::string& commitment, const std::string& state_path);
    void add_state_path(const BFieldElement& commitment, const StatePath& state_path);

    Digest current_state_root() const override { return state_root_; }

    // @throws NotFoundError("State path not found for commitment")
    StatePath get_state_path_for_commitment(const BFieldElement& commitment) const override;
    StatePath get_state_path_for_commitment(const std::string& commitment) const;

    size_t num_state_paths() const { return state_paths_.size(); }

    std::string to_string() const;
    // @throws ParseError on malformed JSON or malformed entries
    static OfflineQuery from_string(const std::string& json);
    static OfflineQuery from_file(const std::string& filepath);

    bool operator==(const OfflineQuery& rhs) const {
        return state_root_ == rhs.state_root_ && state_paths_ == rhs.state_paths_;
    }
    bool operator!=(const OfflineQuery& rhs) const { return !(*this == rhs); }

private:
    Digest state_root_;
    std::map<BFieldElement, StatePath> state_paths_;
};

} // namespace zkverify
