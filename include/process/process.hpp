#pragma once

#include "backend/backend.hpp"
#include "execution/execution.hpp"
#include "ledger/state_query.hpp"
#include "program/program.hpp"
#include <map>
#include <memory>
#include <string>
#include <utility>

namespace zkverify {

/**
 * Outcome of checking an execution. Only Valid counts as verified; the other
 * values exist for diagnostics and tests.
 */
enum class VerificationResult {
    Valid,
    InvalidProof,   // ids, transition id or proof do not check out
    WrongArity,     // transition count or shape does not match the function
    MissingPath,    // a record input has no valid state path
    MalformedKey    // no usable verifying key for the transition's function
};

std::string to_string(VerificationResult result);

/**
 * Process - execution context holding deployed programs and the verifying
 * keys bound to their functions.
 *
 * Every context starts with its own copy of credits.aleo. Contexts are not
 * shared between threads; create one per verification.
 */
class Process {
public:
    // Fresh context seeded with credits.aleo, using the backend selected by ZKVERIFY_BACKEND
    static Process load();
    static Process load(std::unique_ptr<ProofBackend> backend);

    Process(Process&&) = default;
    Process& operator=(Process&&) = default;

    /**
     * Register a program.
     * @throws ProcessError(AlreadyExists) if the id is taken
     * @throws ProcessError(Malformed) if an import, or a program or record
     *         referenced by a function signature, is not registered
     */
    void add_program(const Program& program);

    bool contains_program(const ProgramID& program_id) const;

    // @throws ProcessError(UnknownProgram)
    const Program& get_program(const ProgramID& program_id) const;

    /**
     * Bind a verifying key to a function, replacing any earlier binding.
     * @throws ProcessError(UnknownProgram | UnknownFunction)
     */
    void insert_verifying_key(const ProgramID& program_id, const Identifier& function_name,
                              const VerifyingKey& key);

    bool contains_verifying_key(const ProgramID& program_id, const Identifier& function_name) const;

    // @throws ProcessError(UnknownProgram | UnknownFunction) when nothing is bound
    const VerifyingKey& get_verifying_key(const ProgramID& program_id, const Identifier& function_name) const;

    /**
     * Derive a key pair for a function and bind its verifying key.
     * @throws ProcessError(UnknownProgram | UnknownFunction)
     */
    std::pair<ProvingKey, VerifyingKey> synthesize_key(const ProgramID& program_id,
                                                       const Identifier& function_name,
                                                       ChaCha12Rng& rng);

    /**
     * Check an execution against the registered programs and keys.
     * `query` supplies state paths for record inputs and may be null when
     * the execution consumes no records. Failures of the query or backend
     * become non-Valid results.
     */
    VerificationResult check_execution(const Execution& execution, const StateQuery* query = nullptr) const;

    // check_execution(...) == Valid; never throws
    bool verify_execution(const Execution& execution, const StateQuery* query = nullptr) const;

    const ProofBackend& backend() const { return *backend_; }

private:
    explicit Process(std::unique_ptr<ProofBackend> backend);

    const Function& get_function(const ProgramID& program_id, const Identifier& function_name) const;

    VerificationResult check_signature(const Transition& transition, const Function& function) const;
    // Future arguments the async instruction copies from public inputs or literals
    VerificationResult check_future_arguments(const Transition& transition, const Function& function,
                                              size_t output_index) const;
    VerificationResult check_ids(const Transition& transition) const;
    VerificationResult check_state_paths(const Execution& execution, const Transition& transition,
                                         const StateQuery* query) const;

    std::map<ProgramID, Program> programs_;
    std::map<std::pair<ProgramID, Identifier>, VerifyingKey> verifying_keys_;
    std::unique_ptr<ProofBackend> backend_;
};

} // namespace zkverify
