#pragma once

#include <string>
#include <ostream>

namespace zkverify {

/**
 * Identifier - name of a program, function, record, mapping or struct.
 *
 * ASCII letter first, then letters, digits or '_'; at most MAX_LENGTH bytes;
 * never a keyword or a literal type name.
 */
class Identifier {
public:
    static constexpr size_t MAX_LENGTH = 31;

    // @throws InvalidIdentifier
    static Identifier parse(const std::string& text);
    static bool is_valid(const std::string& text);

    const std::string& to_string() const { return name_; }

    bool operator==(const Identifier& rhs) const { return name_ == rhs.name_; }
    bool operator!=(const Identifier& rhs) const { return name_ != rhs.name_; }
    bool operator<(const Identifier& rhs) const { return name_ < rhs.name_; }

    friend std::ostream& operator<<(std::ostream& os, const Identifier& id) {
        return os << id.name_;
    }

private:
    explicit Identifier(std::string name) : name_(std::move(name)) {}

    std::string name_;
};

/**
 * ProgramID - "<name>.aleo"
 */
class ProgramID {
public:
    static constexpr const char* NETWORK = "aleo";

    // @throws InvalidIdentifier
    static ProgramID parse(const std::string& text);

    const Identifier& name() const { return name_; }
    std::string to_string() const { return name_.to_string() + "." + NETWORK; }

    bool operator==(const ProgramID& rhs) const { return name_ == rhs.name_; }
    bool operator!=(const ProgramID& rhs) const { return name_ != rhs.name_; }
    bool operator<(const ProgramID& rhs) const { return name_ < rhs.name_; }

    friend std::ostream& operator<<(std::ostream& os, const ProgramID& id) {
        return os << id.to_string();
    }

private:
    explicit ProgramID(Identifier name) : name_(std::move(name)) {}

    Identifier name_;
};

// Id of the native program every fresh process is seeded with
constexpr const char* CREDITS_PROGRAM_ID = "credits.aleo";

} // namespace zkverify
