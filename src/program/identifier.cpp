#include "program/identifier.hpp"
#include "common/errors.hpp"
#include <set>

namespace zkverify {
namespace {

bool is_reserved(const std::string& text) {
    static const std::set<std::string> reserved = {
        // keywords
        "as", "async", "await", "call", "closure", "constant", "finalize", "function",
        "future", "import", "input", "into", "mapping", "output", "private", "program",
        "public", "record", "self", "struct", "true", "false", "aleo",
        // literal types
        "address", "boolean", "field", "group", "scalar", "signature", "string",
        "u8", "u16", "u32", "u64", "u128", "i8", "i16", "i32", "i64", "i128"
    };
    return reserved.count(text) > 0;
}

bool is_ascii_letter(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool is_ascii_digit(char c) {
    return c >= '0' && c <= '9';
}

} // namespace

bool Identifier::is_valid(const std::string& text) {
    if (text.empty() || text.size() > MAX_LENGTH) {
        return false;
    }
    if (!is_ascii_letter(text[0])) {
        return false;
    }
    for (char c : text) {
        if (!is_ascii_letter(c) && !is_ascii_digit(c) && c != '_') {
            return false;
        }
    }
    return !is_reserved(text);
}

Identifier Identifier::parse(const std::string& text) {
    if (!is_valid(text)) {
        throw InvalidIdentifier("invalid identifier '" + text + "'");
    }
    return Identifier(text);
}

ProgramID ProgramID::parse(const std::string& text) {
    const std::string suffix = std::string(".") + NETWORK;
    if (text.size() <= suffix.size() ||
        text.compare(text.size() - suffix.size(), suffix.size(), suffix) != 0) {
        throw InvalidIdentifier("invalid program id '" + text + "': expected '<name>.aleo'");
    }
    std::string name = text.substr(0, text.size() - suffix.size());
    if (name.find(NETWORK) != std::string::npos) {
        throw InvalidIdentifier("invalid program id '" + text + "': name must not contain 'aleo'");
    }
    if (!Identifier::is_valid(name)) {
        throw InvalidIdentifier("invalid program id '" + text + "'");
    }
    return ProgramID(Identifier::parse(name));
}

} // namespace zkverify
