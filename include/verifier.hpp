#pragma once

#include "backend/keys.hpp"
#include "execution/execution.hpp"
#include "ledger/state_query.hpp"
#include "program/program.hpp"
#include <string>
#include <vector>

namespace zkverify {

/**
 * Verify that `execution` is a valid execution of `function_name` in
 * `program` under `verifying_key`.
 *
 * A fresh Process is created for the call. credits.aleo is built in and is
 * not registered again. `query` supplies state paths for record inputs.
 * The execution's global state root is not compared against any ledger.
 *
 * @return false for every verification failure, including backend errors
 * @throws InvalidIdentifier if function_name or the program id is malformed
 * @throws ProcessError if the program cannot be registered or the key bound
 */
bool verify_function_execution(const Execution& execution,
                               const VerifyingKey& verifying_key,
                               const Program& program,
                               const std::string& function_name,
                               const StateQuery* query = nullptr);

struct VerificationRequest {
    Execution execution;
    VerifyingKey verifying_key;
    Program program;
    std::string function_name;
};

/**
 * Result of one request in a batch: a verdict, or the structural error
 * that prevented verification.
 */
struct BatchResult {
    bool valid = false;
    std::string error;

    bool has_error() const { return !error.empty(); }
};

/**
 * Read a batch manifest:
 *   {"requests":[{"execution":"exec.json","verifying_key":"fn.vk",
 *                 "program":"prog.aleo" | "credits":true,"function":"name"}, ...]}
 * Relative artifact paths are resolved against the manifest's directory.
 * @throws ParseError on a malformed manifest; file errors from the artifact loaders
 */
std::vector<VerificationRequest> load_manifest(const std::string& manifest_path);

/**
 * Verify independent requests in parallel, one Process each. The query is
 * shared read-only.
 */
std::vector<BatchResult> verify_batch(const std::vector<VerificationRequest>& requests,
                                      const StateQuery* query = nullptr);

} // namespace zkverify
