#include "process/execution_builder.hpp"
#include "common/errors.hpp"
#include "encoding/bfield_codec.hpp"
#include "execution/ciphertext.hpp"
#include "execution/future.hpp"
#include "hash/tip5.hpp"

namespace zkverify {
namespace {

BFieldElement tagged_hash(const std::string& tag, const std::vector<BFieldElement>& data) {
    BFieldWriter writer;
    writer.put_string(tag);
    writer.put_elements(data);
    return Tip5::hash_varlen(writer.elements())[0];
}

BFieldElement external_record_id(const BFieldElement& tcm, size_t index, const std::string& record) {
    BFieldWriter writer;
    writer.put_string("external_record");
    writer.put(tcm);
    writer.put_u64(index);
    writer.put_string(record);
    return Tip5::hash_varlen(writer.elements())[0];
}

std::string canonical_literal(const ValueType& type, const std::string& text) {
    Literal literal = Literal::parse(text);
    if (literal.type() != type.literal) {
        throw std::invalid_argument("argument '" + text + "' is not a " + to_string(type.literal));
    }
    return literal.to_string();
}

} // namespace

BFieldElement ExecutionBuilder::random_element() {
    return BFieldElement(1 + rng_.next_below(BFieldElement::MODULUS - 1));
}

ExecutionBuilder& ExecutionBuilder::add_transition(const ProgramID& program_id,
                                                   const Identifier& function_name,
                                                   const ProvingKey& proving_key,
                                                   const std::vector<std::string>& inputs,
                                                   const std::vector<std::string>& outputs) {
    const Function* function = process_.get_program(program_id).find_function(function_name);
    if (!function) {
        throw ProcessError(ProcessError::Kind::UnknownFunction,
                           "Function '" + program_id.to_string() + "/" + function_name.to_string() +
                               "' does not exist");
    }
    if (inputs.size() != function->inputs.size() || outputs.size() != function->outputs.size()) {
        throw std::invalid_argument("argument count does not match '" + function_name.to_string() + "'");
    }

    const BFieldElement view_key = random_element();
    const Digest function_id = compute_function_id(program_id, function_name);

    Transition transition{Digest(), program_id, function_name, {}, {},
                          BFieldElement::generator().pow(1 + rng_.next_below(BFieldElement::GROUP_ORDER - 1)),
                          tagged_hash("tcm", {view_key}),
                          tagged_hash("scm", {random_element()})};
    const BFieldElement tcm = transition.tcm;

    auto literal_value = [&](const ValueType& type, const std::string& arg, size_t index) {
        std::string literal = canonical_literal(type, arg);
        if (type.kind == ValueKind::Private) {
            return encrypt_value(CIPHERTEXT_HRP, literal, view_key, index);
        }
        return literal;
    };

    for (size_t i = 0; i < inputs.size(); ++i) {
        const ValueType& type = function->inputs[i].type;
        TransitionInput input;
        input.kind = type.kind;
        switch (type.kind) {
            case ValueKind::Constant:
            case ValueKind::Public:
            case ValueKind::Private:
                input.value = literal_value(type, inputs[i], i);
                input.id = compute_value_id(function_id, tcm, i, type.kind, *input.value);
                break;
            case ValueKind::Record:
                input.commitment = element_from_literal(inputs[i], LiteralType::Field);
                input.id = tagged_hash("serial_number", {*input.commitment, random_element()});
                break;
            case ValueKind::ExternalRecord:
                input.id = external_record_id(tcm, i, inputs[i]);
                break;
            case ValueKind::Future:
                throw std::invalid_argument("a function input cannot be a future");
        }
        transition.inputs.push_back(std::move(input));
    }

    for (size_t i = 0; i < outputs.size(); ++i) {
        const ValueType& type = function->outputs[i].type;
        const size_t index = inputs.size() + i;
        TransitionOutput output;
        output.kind = type.kind;
        switch (type.kind) {
            case ValueKind::Constant:
            case ValueKind::Public:
            case ValueKind::Private:
                output.value = literal_value(type, outputs[i], index);
                output.id = compute_value_id(function_id, tcm, index, type.kind, *output.value);
                break;
            case ValueKind::Record:
                output.value = encrypt_value(RECORD_CIPHERTEXT_HRP, outputs[i], view_key, index);
                output.id = compute_record_commitment(function_id, tcm, index, *output.value);
                break;
            case ValueKind::ExternalRecord:
                output.id = external_record_id(tcm, index, outputs[i]);
                break;
            case ValueKind::Future: {
                Future future = Future::parse(outputs[i]);
                if (future.program_id != *type.program || future.function_name != *type.name) {
                    throw std::invalid_argument("future output must be " + type.to_string());
                }
                output.value = future.to_string();
                output.id = compute_value_id(function_id, tcm, index, type.kind, *output.value);
                break;
            }
        }
        transition.outputs.push_back(std::move(output));
    }

    transition.id = transition.compute_id();
    transitions_.push_back(std::move(transition));
    proving_keys_.push_back(proving_key);
    view_keys_.push_back(view_key);
    return *this;
}

Execution ExecutionBuilder::build(const Digest& global_state_root) {
    std::vector<ProvingStatement> statements;
    for (size_t i = 0; i < transitions_.size(); ++i) {
        statements.push_back({proving_keys_[i], transitions_[i].public_inputs(global_state_root)});
    }
    Proof proof = process_.backend().prove(statements, rng_);
    return Execution(transitions_, global_state_root, std::move(proof));
}

} // namespace zkverify
