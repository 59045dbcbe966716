#include "ledger/offline_query.hpp"
#include "common/errors.hpp"
#include "program/value_type.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace zkverify {

OfflineQuery::OfflineQuery(const std::string& state_root)
    : state_root_(state_root_from_string(state_root)) {}

void OfflineQuery::add_state_path(const std::string& commitment, const std::string& state_path) {
    add_state_path(element_from_literal(commitment, LiteralType::Field), StatePath::from_string(state_path));
}

void OfflineQuery::add_state_path(const BFieldElement& commitment, const StatePath& state_path) {
    state_paths_[commitment] = state_path;
}

StatePath OfflineQuery::get_state_path_for_commitment(const BFieldElement& commitment) const {
    auto it = state_paths_.find(commitment);
    if (it == state_paths_.end()) {
        throw NotFoundError("State path not found for commitment");
    }
    return it->second;
}

StatePath OfflineQuery::get_state_path_for_commitment(const std::string& commitment) const {
    return get_state_path_for_commitment(element_from_literal(commitment, LiteralType::Field));
}

std::string OfflineQuery::to_string() const {
    // nlohmann::json keeps object keys sorted, so equal queries print equally
    nlohmann::json paths = nlohmann::json::object();
    for (const auto& [commitment, path] : state_paths_) {
        paths[element_to_literal(commitment, LiteralType::Field)] = path.to_string();
    }
    nlohmann::json j;
    j["state_paths"] = paths;
    j["state_root"] = state_root_to_string(state_root_);
    return j.dump();
}

OfflineQuery OfflineQuery::from_string(const std::string& json) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error& e) {
        throw ParseError(std::string("malformed offline query JSON: ") + e.what());
    }
    if (!j.is_object() || !j.contains("state_root") || !j["state_root"].is_string() ||
        !j.contains("state_paths") || !j["state_paths"].is_object()) {
        throw ParseError("offline query JSON needs a string 'state_root' and an object 'state_paths'");
    }

    OfflineQuery query(j["state_root"].get<std::string>());
    for (const auto& [commitment, path] : j["state_paths"].items()) {
        if (!path.is_string()) {
            throw ParseError("state path for '" + commitment + "' is not a string");
        }
        query.add_state_path(commitment, path.get<std::string>());
    }
    return query;
}

OfflineQuery OfflineQuery::from_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_string(buffer.str());
}

} // namespace zkverify
