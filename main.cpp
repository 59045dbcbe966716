/**
 * zkverify - offline verification of program executions
 *
 * Usage:
 *   zkverify verify --execution F --verifying-key F --function NAME
 *                   [--program F | --credits] [--offline-query F]
 *   zkverify batch --manifest F [--offline-query F]
 *   zkverify query-init --state-root SR --out F
 *   zkverify query-add --query F --commitment C --path P
 *
 * Exit status: 0 verified, 2 not verified, 1 error.
 *
 * Environment Variables:
 *   ZKVERIFY_THREADS - Number of OpenMP/TBB threads (default: auto)
 *   ZKVERIFY_DEBUG   - Print why an execution was rejected
 *   ZKVERIFY_PROFILE - Print verification timings
 */

#include <iostream>
#include <fstream>
#include <map>
#include <memory>
#include <string>

#include "ledger/offline_query.hpp"
#include "parallel/thread_coordination.h"
#include "verifier.hpp"

using namespace zkverify;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_NOT_VERIFIED = 2;

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " COMMAND [OPTIONS]" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Commands:" << std::endl;
    std::cerr << "  verify      Verify one execution" << std::endl;
    std::cerr << "              --execution F --verifying-key F --function NAME" << std::endl;
    std::cerr << "              [--program F | --credits] [--offline-query F]" << std::endl;
    std::cerr << "  batch       Verify every request of a JSON manifest in parallel" << std::endl;
    std::cerr << "              --manifest F [--offline-query F]" << std::endl;
    std::cerr << "  query-init  Create an empty offline query" << std::endl;
    std::cerr << "              --state-root SR --out F" << std::endl;
    std::cerr << "  query-add   Add a state path to an offline query file" << std::endl;
    std::cerr << "              --query F --commitment C --path P" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Environment Variables:" << std::endl;
    std::cerr << "  ZKVERIFY_THREADS  Number of OpenMP/TBB threads" << std::endl;
    std::cerr << "  ZKVERIFY_DEBUG    Print rejection reasons" << std::endl;
    std::cerr << "  ZKVERIFY_PROFILE  Print timings" << std::endl;
}

// --name value pairs; flags without a value map to "true"
std::map<std::string, std::string> parse_options(int argc, char* argv[], int first) {
    static const std::map<std::string, bool> known = {
        {"--execution", true}, {"--verifying-key", true}, {"--function", true},
        {"--program", true}, {"--credits", false}, {"--offline-query", true},
        {"--manifest", true}, {"--state-root", true}, {"--out", true},
        {"--query", true}, {"--commitment", true}, {"--path", true},
    };

    std::map<std::string, std::string> options;
    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        auto it = known.find(arg);
        if (it == known.end()) {
            throw std::invalid_argument("Unknown option: " + arg);
        }
        if (!it->second) {
            options[arg] = "true";
            continue;
        }
        if (i + 1 >= argc) {
            throw std::invalid_argument(arg + " requires an argument");
        }
        options[arg] = argv[++i];
    }
    return options;
}

const std::string& require(const std::map<std::string, std::string>& options, const std::string& name) {
    auto it = options.find(name);
    if (it == options.end()) {
        throw std::invalid_argument("missing required option " + name);
    }
    return it->second;
}

std::unique_ptr<OfflineQuery> load_query(const std::map<std::string, std::string>& options) {
    auto it = options.find("--offline-query");
    if (it == options.end()) {
        return nullptr;
    }
    return std::make_unique<OfflineQuery>(OfflineQuery::from_file(it->second));
}

void write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file for writing: " + path);
    }
    file << content << std::endl;
}

Program load_program(const std::map<std::string, std::string>& options) {
    bool credits = options.count("--credits") > 0;
    bool file = options.count("--program") > 0;
    if (credits == file) {
        throw std::invalid_argument("exactly one of --program or --credits is required");
    }
    return credits ? Program::credits() : Program::from_file(options.at("--program"));
}

int run_verify(const std::map<std::string, std::string>& options) {
    Execution execution = Execution::from_file(require(options, "--execution"));
    VerifyingKey key = VerifyingKey::from_file(require(options, "--verifying-key"));
    Program program = load_program(options);
    auto query = load_query(options);

    bool valid = verify_function_execution(execution, key, program, require(options, "--function"), query.get());
    std::cout << (valid ? "true" : "false") << std::endl;
    return valid ? EXIT_OK : EXIT_NOT_VERIFIED;
}

int run_batch(const std::map<std::string, std::string>& options) {
    std::vector<VerificationRequest> requests = load_manifest(require(options, "--manifest"));
    auto query = load_query(options);

    auto results = verify_batch(requests, query.get());
    int status = EXIT_OK;
    for (size_t i = 0; i < results.size(); ++i) {
        if (results[i].has_error()) {
            std::cout << i << ": error: " << results[i].error << std::endl;
            status = EXIT_ERROR;
        } else {
            std::cout << i << ": " << (results[i].valid ? "true" : "false") << std::endl;
            if (!results[i].valid && status == EXIT_OK) {
                status = EXIT_NOT_VERIFIED;
            }
        }
    }
    return status;
}

int run_query_init(const std::map<std::string, std::string>& options) {
    OfflineQuery query(require(options, "--state-root"));
    write_file(require(options, "--out"), query.to_string());
    return EXIT_OK;
}

int run_query_add(const std::map<std::string, std::string>& options) {
    const std::string& path = require(options, "--query");
    OfflineQuery query = OfflineQuery::from_file(path);
    query.add_state_path(require(options, "--commitment"), require(options, "--path"));
    write_file(path, query.to_string());
    std::cout << "[query] " << query.num_state_paths() << " state paths" << std::endl;
    return EXIT_OK;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return EXIT_ERROR;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return EXIT_OK;
    }

    parallel::initialize_thread_coordination();

    try {
        auto options = parse_options(argc, argv, 2);
        if (command == "verify") return run_verify(options);
        if (command == "batch") return run_batch(options);
        if (command == "query-init") return run_query_init(options);
        if (command == "query-add") return run_query_add(options);

        std::cerr << "Error: Unknown command: " << command << std::endl;
        print_usage(argv[0]);
        return EXIT_ERROR;
    } catch (const std::exception& e) {
        std::cerr << "[zkverify] Error: " << e.what() << std::endl;
        return EXIT_ERROR;
    }
}
