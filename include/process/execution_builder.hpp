#pragma once

#include "process/process.hpp"
#include <string>
#include <vector>

namespace zkverify {

/**
 * ExecutionBuilder - prover side of a Process: turns plaintext arguments into
 * transitions and proves them.
 *
 * Arguments are given per declared input/output, in order:
 *   constant / public / private : literal text ("10u64", "aleo1...")
 *   record input                : commitment of the consumed record ("<n>field")
 *   record output               : record plaintext text (encrypted here)
 *   external_record             : any text identifying the record
 *   future output               : future text (see Future)
 */
class ExecutionBuilder {
public:
    ExecutionBuilder(const Process& process, ChaCha12Rng& rng) : process_(process), rng_(rng) {}

    /**
     * Append a transition.
     * @throws ProcessError if the function does not exist
     * @throws std::invalid_argument if the arguments do not fit its signature
     */
    ExecutionBuilder& add_transition(const ProgramID& program_id,
                                     const Identifier& function_name,
                                     const ProvingKey& proving_key,
                                     const std::vector<std::string>& inputs,
                                     const std::vector<std::string>& outputs);

    // Prove every transition added so far against the given state root
    Execution build(const Digest& global_state_root);

    // View key of the i-th transition added, for decrypting its values
    const BFieldElement& view_key(size_t index) const { return view_keys_.at(index); }

private:
    const Process& process_;
    ChaCha12Rng& rng_;

    std::vector<Transition> transitions_;
    std::vector<ProvingKey> proving_keys_;
    std::vector<BFieldElement> view_keys_;

    BFieldElement random_element();
};

} // namespace zkverify
