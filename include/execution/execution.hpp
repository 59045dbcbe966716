#pragma once

#include "backend/keys.hpp"
#include "execution/transition.hpp"
#include <string>
#include <vector>

namespace zkverify {

/**
 * Execution - the transitions of one program call, the global state root
 * their record inputs were proven against, and the proof.
 *
 * JSON form, keys in this order:
 *   {"transitions":[...],"global_state_root":"sr1...","proof":"proof1..."}
 * Immutable once built.
 */
class Execution {
public:
    Execution(std::vector<Transition> transitions, const Digest& global_state_root, Proof proof)
        : transitions_(std::move(transitions)),
          global_state_root_(global_state_root),
          proof_(std::move(proof)) {}

    const std::vector<Transition>& transitions() const { return transitions_; }
    const Digest& global_state_root() const { return global_state_root_; }
    const Proof& proof() const { return proof_; }

    std::string to_string() const;
    // @throws ParseError / InvalidIdentifier
    static Execution from_string(const std::string& json);
    static Execution from_file(const std::string& filepath);

    bool operator==(const Execution& rhs) const {
        return transitions_ == rhs.transitions_ && global_state_root_ == rhs.global_state_root_ &&
               proof_ == rhs.proof_;
    }
    bool operator!=(const Execution& rhs) const { return !(*this == rhs); }

private:
    std::vector<Transition> transitions_;
    Digest global_state_root_;
    Proof proof_;
};

} // namespace zkverify
