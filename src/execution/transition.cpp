#include "execution/transition.hpp"
#include "common/errors.hpp"
#include "encoding/bfield_codec.hpp"
#include "hash/tip5.hpp"
#include "program/program.hpp"

namespace zkverify {
namespace {

std::string get_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        throw ParseError(std::string("missing string field '") + key + "'");
    }
    return it->get<std::string>();
}

std::optional<std::string> get_optional_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return std::nullopt;
    if (!it->is_string()) {
        throw ParseError(std::string("field '") + key + "' is not a string");
    }
    return it->get<std::string>();
}

ValueKind get_kind(const nlohmann::json& j) {
    std::string text = get_string(j, "type");
    auto kind = value_kind_from_string(text);
    if (!kind) {
        throw ParseError("unknown value type '" + text + "'");
    }
    return *kind;
}

void require_object(const nlohmann::json& j, const char* what) {
    if (!j.is_object()) {
        throw ParseError(std::string(what) + " is not a JSON object");
    }
}

} // namespace

nlohmann::ordered_json TransitionInput::to_json() const {
    nlohmann::ordered_json j;
    j["type"] = to_string(kind);
    j["id"] = element_to_literal(id, LiteralType::Field);
    if (commitment) j["commitment"] = element_to_literal(*commitment, LiteralType::Field);
    if (value) j["value"] = *value;
    return j;
}

TransitionInput TransitionInput::from_json(const nlohmann::json& j) {
    require_object(j, "transition input");
    TransitionInput input;
    input.kind = get_kind(j);
    if (input.kind == ValueKind::Future) {
        throw ParseError("a transition input cannot be a future");
    }
    input.id = element_from_literal(get_string(j, "id"), LiteralType::Field);
    input.value = get_optional_string(j, "value");
    if (auto commitment = get_optional_string(j, "commitment")) {
        input.commitment = element_from_literal(*commitment, LiteralType::Field);
    }

    bool carries_value = input.kind == ValueKind::Constant || input.kind == ValueKind::Public ||
                         input.kind == ValueKind::Private;
    if (carries_value != input.value.has_value()) {
        throw ParseError("transition input of type '" + to_string(input.kind) + "' has a misplaced 'value'");
    }
    if ((input.kind == ValueKind::Record) != input.commitment.has_value()) {
        throw ParseError("transition input of type '" + to_string(input.kind) + "' has a misplaced 'commitment'");
    }
    return input;
}

nlohmann::ordered_json TransitionOutput::to_json() const {
    nlohmann::ordered_json j;
    j["type"] = to_string(kind);
    j["id"] = element_to_literal(id, LiteralType::Field);
    if (value) j["value"] = *value;
    return j;
}

TransitionOutput TransitionOutput::from_json(const nlohmann::json& j) {
    require_object(j, "transition output");
    TransitionOutput output;
    output.kind = get_kind(j);
    output.id = element_from_literal(get_string(j, "id"), LiteralType::Field);
    output.value = get_optional_string(j, "value");
    if ((output.kind != ValueKind::ExternalRecord) != output.value.has_value()) {
        throw ParseError("transition output of type '" + to_string(output.kind) + "' has a misplaced 'value'");
    }
    return output;
}

Digest Transition::compute_id() const {
    BFieldWriter writer;
    writer.put_string("transition_id");
    writer.put_digest(compute_function_id(program_id, function_name));
    writer.put_u64(inputs.size());
    for (const auto& input : inputs) {
        writer.put_u64(static_cast<uint64_t>(input.kind));
        writer.put(input.id);
        if (input.commitment) writer.put(*input.commitment);
    }
    writer.put_u64(outputs.size());
    for (const auto& output : outputs) {
        writer.put_u64(static_cast<uint64_t>(output.kind));
        writer.put(output.id);
    }
    writer.put(tpk);
    writer.put(tcm);
    writer.put(scm);
    return Tip5::hash_varlen(writer.elements());
}

std::vector<BFieldElement> Transition::public_inputs(const Digest& global_state_root) const {
    std::vector<BFieldElement> out = id.to_b_field_elements();
    out.push_back(tpk);
    out.push_back(tcm);
    out.push_back(scm);
    for (const auto& input : inputs) {
        out.push_back(input.id);
        if (input.commitment) out.push_back(*input.commitment);
    }
    for (const auto& output : outputs) {
        out.push_back(output.id);
    }
    if (has_record_inputs()) {
        auto root = global_state_root.to_b_field_elements();
        out.insert(out.end(), root.begin(), root.end());
    }
    return out;
}

bool Transition::has_record_inputs() const {
    for (const auto& input : inputs) {
        if (input.kind == ValueKind::Record) return true;
    }
    return false;
}

nlohmann::ordered_json Transition::to_json() const {
    nlohmann::ordered_json j;
    j["id"] = id.to_bech32m(TRANSITION_ID_HRP);
    j["program"] = program_id.to_string();
    j["function"] = function_name.to_string();
    j["inputs"] = nlohmann::ordered_json::array();
    for (const auto& input : inputs) j["inputs"].push_back(input.to_json());
    j["outputs"] = nlohmann::ordered_json::array();
    for (const auto& output : outputs) j["outputs"].push_back(output.to_json());
    j["tpk"] = element_to_literal(tpk, LiteralType::Group);
    j["tcm"] = element_to_literal(tcm, LiteralType::Field);
    j["scm"] = element_to_literal(scm, LiteralType::Field);
    return j;
}

Transition Transition::from_json(const nlohmann::json& j) {
    require_object(j, "transition");
    Transition transition{
        Digest::from_bech32m(TRANSITION_ID_HRP, get_string(j, "id")),
        ProgramID::parse(get_string(j, "program")),
        Identifier::parse(get_string(j, "function")),
        {},
        {},
        element_from_literal(get_string(j, "tpk"), LiteralType::Group),
        element_from_literal(get_string(j, "tcm"), LiteralType::Field),
        element_from_literal(get_string(j, "scm"), LiteralType::Field),
    };

    auto inputs = j.find("inputs");
    auto outputs = j.find("outputs");
    if (inputs == j.end() || !inputs->is_array() || outputs == j.end() || !outputs->is_array()) {
        throw ParseError("transition needs 'inputs' and 'outputs' arrays");
    }
    for (const auto& input : *inputs) transition.inputs.push_back(TransitionInput::from_json(input));
    for (const auto& output : *outputs) transition.outputs.push_back(TransitionOutput::from_json(output));
    return transition;
}

BFieldElement compute_value_id(const Digest& function_id, const BFieldElement& tcm, size_t index,
                               ValueKind kind, const std::string& value) {
    BFieldWriter writer;
    writer.put_string("value_id");
    writer.put_digest(function_id);
    writer.put(tcm);
    writer.put_u64(index);
    writer.put_u64(static_cast<uint64_t>(kind));
    writer.put_string(value);
    return Tip5::hash_varlen(writer.elements())[0];
}

BFieldElement compute_record_commitment(const Digest& function_id, const BFieldElement& tcm, size_t index,
                                        const std::string& ciphertext) {
    BFieldWriter writer;
    writer.put_string("record_commitment");
    writer.put_digest(function_id);
    writer.put(tcm);
    writer.put_u64(index);
    writer.put_string(ciphertext);
    return Tip5::hash_varlen(writer.elements())[0];
}

} // namespace zkverify
