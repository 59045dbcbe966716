#include "process/process.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"
#include "execution/ciphertext.hpp"
#include "execution/future.hpp"
#include <algorithm>
#include <iterator>
#include <sstream>

namespace zkverify {
namespace {

std::string describe(const ProgramID& program_id, const Identifier& function_name) {
    return program_id.to_string() + "/" + function_name.to_string();
}

VerificationResult reject(VerificationResult result, const std::string& reason) {
    ZKVERIFY_DEBUG_COUT("[process] " << to_string(result) << ": " << reason << std::endl);
    return result;
}

// Operands of the "async <name> <operands...> into r<reg>" instruction, if any
std::optional<std::vector<std::string>> async_operands(const Function& function, size_t reg) {
    const std::string target = "r" + std::to_string(reg);
    for (const auto& instruction : function.instructions) {
        std::istringstream iss(instruction);
        std::vector<std::string> tokens{std::istream_iterator<std::string>(iss),
                                        std::istream_iterator<std::string>()};
        if (tokens.size() >= 4 && tokens[0] == "async" && tokens[tokens.size() - 2] == "into" &&
            tokens.back() == target) {
            return std::vector<std::string>(tokens.begin() + 2, tokens.end() - 2);
        }
    }
    return std::nullopt;
}

bool is_register(const std::string& operand) {
    return operand.size() >= 2 && operand[0] == 'r' &&
           std::all_of(operand.begin() + 1, operand.end(), [](char c) { return c >= '0' && c <= '9'; });
}

/**
 * The value a future argument must equal, when the transition reveals it:
 * a public or constant input passed through unchanged, or a literal operand.
 * Computed registers, private inputs and "self."/"block." operands are
 * opaque here and stay with the proof.
 */
std::optional<std::string> expected_argument(const Transition& transition, const Function& function,
                                             const std::string& operand) {
    if (is_register(operand)) {
        for (size_t i = 0; i < function.inputs.size(); ++i) {
            const Parameter& param = function.inputs[i];
            if ("r" + std::to_string(param.reg) != operand) continue;
            if (param.type.kind == ValueKind::Public || param.type.kind == ValueKind::Constant) {
                return transition.inputs[i].value;
            }
            return std::nullopt;
        }
        return std::nullopt;
    }
    if (operand.find('.') != std::string::npos) {
        return std::nullopt;
    }
    return operand;
}

} // namespace

std::string to_string(VerificationResult result) {
    switch (result) {
        case VerificationResult::Valid: return "Valid";
        case VerificationResult::InvalidProof: return "InvalidProof";
        case VerificationResult::WrongArity: return "WrongArity";
        case VerificationResult::MissingPath: return "MissingPath";
        case VerificationResult::MalformedKey: return "MalformedKey";
    }
    return "Unknown";
}

Process::Process(std::unique_ptr<ProofBackend> backend) : backend_(std::move(backend)) {
    if (!backend_) {
        throw std::invalid_argument("Process needs a proof backend");
    }
    Program credits = Program::credits();
    programs_.emplace(credits.id(), std::move(credits));
}

Process Process::load() {
    return Process(ProofBackend::create_from_env());
}

Process Process::load(std::unique_ptr<ProofBackend> backend) {
    return Process(std::move(backend));
}

void Process::add_program(const Program& program) {
    const ProgramID& id = program.id();
    if (programs_.count(id)) {
        throw ProcessError(ProcessError::Kind::AlreadyExists,
                           "Program '" + id.to_string() + "' already exists");
    }

    for (const auto& import : program.imports()) {
        if (!contains_program(import)) {
            throw ProcessError(ProcessError::Kind::Malformed,
                               "Program '" + id.to_string() + "' imports unknown program '" +
                                   import.to_string() + "'");
        }
    }

    auto check_parameter = [&](const Function& function, const Parameter& param) {
        if (param.type.kind != ValueKind::ExternalRecord) return;
        const Program& external = get_program(*param.type.program);
        if (!external.contains_record(*param.type.name)) {
            throw ProcessError(ProcessError::Kind::Malformed,
                               "Function '" + describe(id, function.name) + "' references unknown record '" +
                                   param.type.to_string() + "'");
        }
    };
    for (const auto& function : program.functions()) {
        for (const auto& in : function.inputs) check_parameter(function, in);
        for (const auto& out : function.outputs) check_parameter(function, out);
    }

    programs_.emplace(id, program);
    ZKVERIFY_DEBUG_COUT("[process] added program " << id << " (" << program.functions().size()
                        << " functions)" << std::endl);
}

bool Process::contains_program(const ProgramID& program_id) const {
    return programs_.count(program_id) > 0;
}

const Program& Process::get_program(const ProgramID& program_id) const {
    auto it = programs_.find(program_id);
    if (it == programs_.end()) {
        throw ProcessError(ProcessError::Kind::UnknownProgram,
                           "Program '" + program_id.to_string() + "' does not exist");
    }
    return it->second;
}

const Function& Process::get_function(const ProgramID& program_id, const Identifier& function_name) const {
    const Function* function = get_program(program_id).find_function(function_name);
    if (!function) {
        throw ProcessError(ProcessError::Kind::UnknownFunction,
                           "Function '" + describe(program_id, function_name) + "' does not exist");
    }
    return *function;
}

void Process::insert_verifying_key(const ProgramID& program_id, const Identifier& function_name,
                                   const VerifyingKey& key) {
    get_function(program_id, function_name);
    verifying_keys_[{program_id, function_name}] = key;
}

bool Process::contains_verifying_key(const ProgramID& program_id, const Identifier& function_name) const {
    return verifying_keys_.count({program_id, function_name}) > 0;
}

const VerifyingKey& Process::get_verifying_key(const ProgramID& program_id, const Identifier& function_name) const {
    get_function(program_id, function_name);
    auto it = verifying_keys_.find({program_id, function_name});
    if (it == verifying_keys_.end()) {
        throw ProcessError(ProcessError::Kind::UnknownFunction,
                           "No verifying key for '" + describe(program_id, function_name) + "'");
    }
    return it->second;
}

std::pair<ProvingKey, VerifyingKey> Process::synthesize_key(const ProgramID& program_id,
                                                            const Identifier& function_name,
                                                            ChaCha12Rng& rng) {
    const Function& function = get_function(program_id, function_name);
    ProvingKey proving_key = backend_->synthesize(compute_circuit_id(program_id, function), rng);
    VerifyingKey verifying_key = proving_key.verifying_key();
    insert_verifying_key(program_id, function_name, verifying_key);
    return {proving_key, verifying_key};
}

VerificationResult Process::check_signature(const Transition& transition, const Function& function) const {
    const std::string name = describe(transition.program_id, transition.function_name);
    if (transition.inputs.size() != function.inputs.size() ||
        transition.outputs.size() != function.outputs.size()) {
        return reject(VerificationResult::WrongArity, name + " expects " +
                      std::to_string(function.inputs.size()) + " inputs and " +
                      std::to_string(function.outputs.size()) + " outputs");
    }

    auto check_value = [&](const ValueType& declared, ValueKind kind, const std::optional<std::string>& value,
                           const std::string& where) -> bool {
        if (declared.kind != kind) {
            reject(VerificationResult::WrongArity, name + " " + where + " is " + to_string(kind) +
                   ", expected " + declared.to_string());
            return false;
        }
        if ((declared.is_literal() || declared.kind == ValueKind::Future) && !value) {
            reject(VerificationResult::WrongArity, name + " " + where + " carries no value");
            return false;
        }
        if (declared.kind == ValueKind::Constant || declared.kind == ValueKind::Public) {
            if (Literal::parse(*value).type() != declared.literal) {
                reject(VerificationResult::WrongArity, name + " " + where + " is not a " +
                       to_string(declared.literal));
                return false;
            }
        } else if (declared.kind == ValueKind::Private) {
            check_ciphertext(CIPHERTEXT_HRP, *value);
        } else if (declared.kind == ValueKind::Future) {
            Future future = Future::parse(*value);
            if (future.program_id != *declared.program || future.function_name != *declared.name) {
                reject(VerificationResult::WrongArity, name + " " + where + " is a future of " +
                       describe(future.program_id, future.function_name));
                return false;
            }
        } else if (declared.kind == ValueKind::Record && value) {
            check_ciphertext(RECORD_CIPHERTEXT_HRP, *value);
        }
        return true;
    };

    try {
        for (size_t i = 0; i < function.inputs.size(); ++i) {
            const auto& input = transition.inputs[i];
            if (!check_value(function.inputs[i].type, input.kind, input.value, "input " + std::to_string(i))) {
                return VerificationResult::WrongArity;
            }
        }
        for (size_t i = 0; i < function.outputs.size(); ++i) {
            const auto& output = transition.outputs[i];
            if (!check_value(function.outputs[i].type, output.kind, output.value, "output " + std::to_string(i))) {
                return VerificationResult::WrongArity;
            }
            if (output.kind == ValueKind::Future) {
                VerificationResult result = check_future_arguments(transition, function, i);
                if (result != VerificationResult::Valid) return result;
            }
        }
    } catch (const ParseError& e) {
        return reject(VerificationResult::WrongArity, name + ": " + e.what());
    }
    return VerificationResult::Valid;
}

VerificationResult Process::check_future_arguments(const Transition& transition, const Function& function,
                                                   size_t output_index) const {
    const std::string name = describe(transition.program_id, transition.function_name);
    auto operands = async_operands(function, function.outputs[output_index].reg);
    if (!operands) {
        return VerificationResult::Valid;
    }

    Future future = Future::parse(*transition.outputs[output_index].value);
    if (future.arguments.size() != operands->size()) {
        return reject(VerificationResult::WrongArity, name + " future carries " +
                      std::to_string(future.arguments.size()) + " arguments, expected " +
                      std::to_string(operands->size()));
    }
    for (size_t j = 0; j < operands->size(); ++j) {
        auto expected = expected_argument(transition, function, (*operands)[j]);
        if (!expected) continue;
        if (!(Literal::parse(future.arguments[j]) == Literal::parse(*expected))) {
            return reject(VerificationResult::WrongArity, name + " future argument " + std::to_string(j) +
                          " is " + future.arguments[j] + ", expected " + *expected);
        }
    }
    return VerificationResult::Valid;
}

VerificationResult Process::check_ids(const Transition& transition) const {
    const std::string name = describe(transition.program_id, transition.function_name);
    const Digest function_id = compute_function_id(transition.program_id, transition.function_name);
    const size_t num_inputs = transition.inputs.size();

    for (size_t i = 0; i < num_inputs; ++i) {
        const auto& input = transition.inputs[i];
        if (input.value &&
            input.id != compute_value_id(function_id, transition.tcm, i, input.kind, *input.value)) {
            return reject(VerificationResult::InvalidProof, name + " input " + std::to_string(i) + " id mismatch");
        }
    }
    for (size_t i = 0; i < transition.outputs.size(); ++i) {
        const auto& output = transition.outputs[i];
        if (!output.value) continue;
        size_t index = num_inputs + i;
        BFieldElement expected = (output.kind == ValueKind::Record)
            ? compute_record_commitment(function_id, transition.tcm, index, *output.value)
            : compute_value_id(function_id, transition.tcm, index, output.kind, *output.value);
        if (output.id != expected) {
            return reject(VerificationResult::InvalidProof, name + " output " + std::to_string(i) + " id mismatch");
        }
    }
    if (transition.id != transition.compute_id()) {
        return reject(VerificationResult::InvalidProof, name + " transition id mismatch");
    }
    return VerificationResult::Valid;
}

VerificationResult Process::check_state_paths(const Execution& execution, const Transition& transition,
                                              const StateQuery* query) const {
    for (const auto& input : transition.inputs) {
        if (input.kind != ValueKind::Record) continue;
        if (!input.commitment) {
            return reject(VerificationResult::MissingPath, "record input without a commitment");
        }
        const std::string commitment = element_to_literal(*input.commitment, LiteralType::Field);
        if (!query) {
            return reject(VerificationResult::MissingPath, "no state query for commitment " + commitment);
        }

        StatePath path;
        try {
            path = query->get_state_path_for_commitment(*input.commitment);
        } catch (const std::exception& e) {
            return reject(VerificationResult::MissingPath, commitment + ": " + e.what());
        }

        if (path.commitment != *input.commitment) {
            return reject(VerificationResult::MissingPath, "state path is for a different commitment than " + commitment);
        }
        if (path.global_state_root != execution.global_state_root()) {
            return reject(VerificationResult::MissingPath, "state path for " + commitment +
                          " is not under the execution's global state root");
        }
        if (!path.verify()) {
            return reject(VerificationResult::MissingPath, "state path for " + commitment + " does not verify");
        }
    }
    return VerificationResult::Valid;
}

VerificationResult Process::check_execution(const Execution& execution, const StateQuery* query) const {
    const auto& transitions = execution.transitions();
    if (transitions.size() != 1) {
        return reject(VerificationResult::WrongArity, "expected exactly one transition, found " +
                      std::to_string(transitions.size()));
    }

    std::vector<VerifyingStatement> statements;
    for (const auto& transition : transitions) {
        const std::string name = describe(transition.program_id, transition.function_name);

        auto program = programs_.find(transition.program_id);
        const Function* function = (program == programs_.end())
            ? nullptr : program->second.find_function(transition.function_name);
        auto key = verifying_keys_.find({transition.program_id, transition.function_name});
        if (!function || key == verifying_keys_.end()) {
            return reject(VerificationResult::MalformedKey, "no verifying key bound for " + name);
        }
        if (key->second.circuit_id != compute_circuit_id(transition.program_id, *function)) {
            return reject(VerificationResult::MalformedKey, "verifying key for " + name +
                          " was synthesized for a different circuit");
        }

        VerificationResult result = check_signature(transition, *function);
        if (result != VerificationResult::Valid) return result;
        result = check_ids(transition);
        if (result != VerificationResult::Valid) return result;
        result = check_state_paths(execution, transition, query);
        if (result != VerificationResult::Valid) return result;

        statements.push_back({key->second, transition.public_inputs(execution.global_state_root())});
    }

    bool accepted = false;
    try {
        accepted = backend_->verify(execution.proof(), statements);
    } catch (const std::exception& e) {
        return reject(VerificationResult::InvalidProof, std::string("backend error: ") + e.what());
    }
    if (!accepted) {
        return reject(VerificationResult::InvalidProof, backend_->name() + " backend rejected the proof");
    }
    return VerificationResult::Valid;
}

bool Process::verify_execution(const Execution& execution, const StateQuery* query) const {
    try {
        return check_execution(execution, query) == VerificationResult::Valid;
    } catch (const std::exception& e) {
        ZKVERIFY_DEBUG_COUT("[process] verification aborted: " << e.what() << std::endl);
        return false;
    }
}

} // namespace zkverify
