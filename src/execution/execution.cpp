#include "execution/execution.hpp"
#include "common/errors.hpp"
#include "ledger/state_path.hpp"
#include <fstream>
#include <sstream>

namespace zkverify {

std::string Execution::to_string() const {
    nlohmann::ordered_json j;
    j["transitions"] = nlohmann::ordered_json::array();
    for (const auto& transition : transitions_) {
        j["transitions"].push_back(transition.to_json());
    }
    j["global_state_root"] = state_root_to_string(global_state_root_);
    j["proof"] = proof_.to_string();
    return j.dump();
}

Execution Execution::from_string(const std::string& json) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error& e) {
        throw ParseError(std::string("malformed execution JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw ParseError("execution JSON is not an object");
    }
    auto transitions = j.find("transitions");
    auto root = j.find("global_state_root");
    auto proof = j.find("proof");
    if (transitions == j.end() || !transitions->is_array() || root == j.end() || !root->is_string() ||
        proof == j.end() || !proof->is_string()) {
        throw ParseError("execution JSON needs 'transitions', 'global_state_root' and 'proof'");
    }

    std::vector<Transition> parsed;
    for (const auto& transition : *transitions) {
        parsed.push_back(Transition::from_json(transition));
    }
    return Execution(std::move(parsed), state_root_from_string(root->get<std::string>()),
                     Proof::from_string(proof->get<std::string>()));
}

Execution Execution::from_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_string(buffer.str());
}

} // namespace zkverify
