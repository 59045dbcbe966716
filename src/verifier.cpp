#include "verifier.hpp"
#include "common/debug_control.hpp"
#include "common/errors.hpp"
#include "process/process.hpp"
#include <nlohmann/json.hpp>
#include <tbb/parallel_for.h>
#include <chrono>
#include <filesystem>
#include <fstream>

namespace zkverify {

bool verify_function_execution(const Execution& execution,
                               const VerifyingKey& verifying_key,
                               const Program& program,
                               const std::string& function_name,
                               const StateQuery* query) {
    auto start = std::chrono::high_resolution_clock::now();

    Identifier function = Identifier::parse(function_name);
    ProgramID program_id = ProgramID::parse(program.id().to_string());

    Process process = Process::load();
    if (program_id.to_string() != CREDITS_PROGRAM_ID) {
        process.add_program(program);
    }
    process.insert_verifying_key(program_id, function, verifying_key);

    bool valid = process.verify_execution(execution, query);

    auto end = std::chrono::high_resolution_clock::now();
    double ms = std::chrono::duration_cast<std::chrono::microseconds>(end - start).count() / 1000.0;
    ZKVERIFY_PROFILE_COUT("[verifier] " << program_id << "/" << function << ": "
                          << (valid ? "valid" : "invalid") << " in " << ms << " ms" << std::endl);
    return valid;
}

std::vector<BatchResult> verify_batch(const std::vector<VerificationRequest>& requests,
                                      const StateQuery* query) {
    auto start = std::chrono::high_resolution_clock::now();
    std::vector<BatchResult> results(requests.size());

    tbb::parallel_for(size_t(0), requests.size(), [&](size_t i) {
        const auto& request = requests[i];
        try {
            results[i].valid = verify_function_execution(request.execution, request.verifying_key,
                                                         request.program, request.function_name, query);
        } catch (const std::exception& e) {
            results[i].error = e.what();
        }
    });

    auto end = std::chrono::high_resolution_clock::now();
    double ms = std::chrono::duration_cast<std::chrono::microseconds>(end - start).count() / 1000.0;
    ZKVERIFY_PROFILE_COUT("[verifier] batch of " << requests.size() << " in " << ms << " ms" << std::endl);
    return results;
}

std::vector<VerificationRequest> load_manifest(const std::string& manifest_path) {
    std::ifstream file(manifest_path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + manifest_path);
    }
    nlohmann::json manifest;
    try {
        file >> manifest;
    } catch (const nlohmann::json::parse_error& e) {
        throw ParseError(std::string("malformed manifest: ") + e.what());
    }
    if (!manifest.contains("requests") || !manifest["requests"].is_array()) {
        throw ParseError("manifest needs a 'requests' array");
    }

    const std::filesystem::path base = std::filesystem::path(manifest_path).parent_path();
    auto resolve = [&](const nlohmann::json& entry, const char* key) {
        if (!entry.contains(key) || !entry[key].is_string()) {
            throw ParseError(std::string("manifest request needs a '") + key + "' string");
        }
        std::filesystem::path path = entry[key].get<std::string>();
        return (path.is_absolute() ? path : base / path).string();
    };

    std::vector<VerificationRequest> requests;
    for (const auto& entry : manifest["requests"]) {
        if (!entry.is_object()) {
            throw ParseError("manifest request must be an object");
        }
        bool credits = entry.value("credits", false);
        if (!entry.contains("function") || !entry["function"].is_string()) {
            throw ParseError("manifest request needs a 'function' string");
        }
        requests.push_back(VerificationRequest{
            Execution::from_file(resolve(entry, "execution")),
            VerifyingKey::from_file(resolve(entry, "verifying_key")),
            credits ? Program::credits() : Program::from_file(resolve(entry, "program")),
            entry["function"].get<std::string>(),
        });
    }
    return requests;
}

} // namespace zkverify
