#pragma once

#include "program/identifier.hpp"
#include "program/value_type.hpp"
#include "types/b_field_element.hpp"
#include "types/digest.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace zkverify {

constexpr const char* TRANSITION_ID_HRP = "au";

/**
 * TransitionInput - one public view of a function input.
 *
 *   constant / public : id, value = plaintext literal
 *   private           : id, value = "ciphertext1..."
 *   record            : id = serial number, commitment of the consumed record
 *   external_record   : id
 */
struct TransitionInput {
    ValueKind kind = ValueKind::Public;
    BFieldElement id;
    std::optional<std::string> value;
    std::optional<BFieldElement> commitment;

    nlohmann::ordered_json to_json() const;
    static TransitionInput from_json(const nlohmann::json& j);

    bool operator==(const TransitionInput& rhs) const {
        return kind == rhs.kind && id == rhs.id && value == rhs.value && commitment == rhs.commitment;
    }
};

/**
 * TransitionOutput - one public view of a function output.
 *
 *   constant / public / private : as for inputs
 *   record            : id = commitment, value = "record1..." ciphertext
 *   external_record   : id
 *   future            : id, value = future text
 */
struct TransitionOutput {
    ValueKind kind = ValueKind::Public;
    BFieldElement id;
    std::optional<std::string> value;

    nlohmann::ordered_json to_json() const;
    static TransitionOutput from_json(const nlohmann::json& j);

    bool operator==(const TransitionOutput& rhs) const {
        return kind == rhs.kind && id == rhs.id && value == rhs.value;
    }
};

/**
 * Transition - one function call inside an execution.
 *
 * tpk is the transition public key (group), tcm the transition commitment
 * and scm the signer commitment (fields). Every input and output id is bound
 * to tcm and its position; the transition id binds everything.
 */
struct Transition {
    Digest id;
    ProgramID program_id;
    Identifier function_name;
    std::vector<TransitionInput> inputs;
    std::vector<TransitionOutput> outputs;
    BFieldElement tpk;
    BFieldElement tcm;
    BFieldElement scm;

    // Id recomputed from the other fields
    Digest compute_id() const;

    // Field elements the proof for this transition is checked against
    std::vector<BFieldElement> public_inputs(const Digest& global_state_root) const;

    bool has_record_inputs() const;

    nlohmann::ordered_json to_json() const;
    // @throws ParseError / InvalidIdentifier
    static Transition from_json(const nlohmann::json& j);

    bool operator==(const Transition& rhs) const {
        return id == rhs.id && program_id == rhs.program_id && function_name == rhs.function_name &&
               inputs == rhs.inputs && outputs == rhs.outputs && tpk == rhs.tpk && tcm == rhs.tcm &&
               scm == rhs.scm;
    }
};

/**
 * Id of the value at `index` (inputs first, outputs after them) of a
 * transition of the function with the given function id.
 */
BFieldElement compute_value_id(const Digest& function_id, const BFieldElement& tcm, size_t index,
                               ValueKind kind, const std::string& value);

// Commitment of a record output, derived from its ciphertext
BFieldElement compute_record_commitment(const Digest& function_id, const BFieldElement& tcm, size_t index,
                                        const std::string& ciphertext);

} // namespace zkverify
