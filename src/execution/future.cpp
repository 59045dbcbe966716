#include "execution/future.hpp"
#include "common/errors.hpp"
#include "program/value_type.hpp"
#include <sstream>

namespace zkverify {

std::string Future::to_string() const {
    std::ostringstream oss;
    oss << "{ program_id: " << program_id << ", function_name: " << function_name << ", arguments: [";
    for (size_t i = 0; i < arguments.size(); ++i) {
        oss << " " << arguments[i] << (i + 1 < arguments.size() ? "," : "");
    }
    oss << " ] }";
    return oss.str();
}

Future Future::parse(const std::string& text) {
    std::istringstream iss(text);
    std::vector<std::string> tokens;
    std::string token;
    while (iss >> token) tokens.push_back(token);

    // {  program_id:  <id>,  function_name:  <name>,  arguments:  [  ...  ]  }
    if (tokens.size() < 9 || tokens[0] != "{" || tokens[1] != "program_id:" ||
        tokens[3] != "function_name:" || tokens[5] != "arguments:" || tokens[6] != "[" ||
        tokens[tokens.size() - 2] != "]" || tokens.back() != "}" ||
        tokens[2].back() != ',' || tokens[4].back() != ',') {
        throw ParseError("malformed future '" + text + "'");
    }

    Future future{ProgramID::parse(tokens[2].substr(0, tokens[2].size() - 1)),
                  Identifier::parse(tokens[4].substr(0, tokens[4].size() - 1)),
                  {}};
    for (size_t i = 7; i + 2 < tokens.size(); ++i) {
        std::string arg = tokens[i];
        bool last = (i + 3 == tokens.size());
        if (!last) {
            if (arg.back() != ',') {
                throw ParseError("malformed future arguments in '" + text + "'");
            }
            arg.pop_back();
        }
        future.arguments.push_back(Literal::parse(arg).to_string());
    }
    return future;
}

} // namespace zkverify
