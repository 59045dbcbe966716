#pragma once

#include "program/identifier.hpp"
#include <string>
#include <vector>

namespace zkverify {

/**
 * Future - deferred on-chain call returned by an async function.
 *
 * Text form:
 *   { program_id: credits.aleo, function_name: transfer_public, arguments: [ a, b ] }
 */
struct Future {
    ProgramID program_id;
    Identifier function_name;
    std::vector<std::string> arguments;

    std::string to_string() const;
    // @throws ParseError
    static Future parse(const std::string& text);

    bool operator==(const Future& rhs) const {
        return program_id == rhs.program_id && function_name == rhs.function_name &&
               arguments == rhs.arguments;
    }
};

} // namespace zkverify
