#pragma once

#include <stdexcept>
#include <string>

namespace zkverify {

/**
 * ParseError - a textual or binary encoding could not be decoded.
 */
class ParseError : public std::invalid_argument {
public:
    explicit ParseError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * InvalidIdentifier - a program or function identifier is malformed.
 */
class InvalidIdentifier : public ParseError {
public:
    explicit InvalidIdentifier(const std::string& what) : ParseError(what) {}
};

/**
 * NotFoundError - a lookup key (e.g. a commitment) has no entry.
 */
class NotFoundError : public std::out_of_range {
public:
    explicit NotFoundError(const std::string& what) : std::out_of_range(what) {}
};

/**
 * ProcessError - setup of an execution context failed.
 */
class ProcessError : public std::runtime_error {
public:
    enum class Kind {
        AlreadyExists,
        Malformed,
        UnknownProgram,
        UnknownFunction
    };

    ProcessError(Kind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

} // namespace zkverify
