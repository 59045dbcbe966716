#pragma once

#include "program/identifier.hpp"
#include "program/value_type.hpp"
#include "types/digest.hpp"
#include <string>
#include <vector>
#include <optional>

namespace zkverify {

/**
 * Parameter - "input r0 as u64.public;" / "output r2 as credits.record;"
 */
struct Parameter {
    size_t reg = 0;
    ValueType type;

    bool operator==(const Parameter& rhs) const { return reg == rhs.reg && type == rhs.type; }
};

/**
 * Member - "owner as address.private;" inside a record or struct.
 * The type text is kept as written (structs may nest other structs).
 */
struct Member {
    Identifier name;
    std::string type;

    bool operator==(const Member& rhs) const { return name == rhs.name && type == rhs.type; }
};

struct Mapping {
    Identifier name;
    ValueType key;
    ValueType value;

    bool operator==(const Mapping& rhs) const {
        return name == rhs.name && key == rhs.key && value == rhs.value;
    }
};

struct StructType {
    Identifier name;
    std::vector<Member> members;

    bool operator==(const StructType& rhs) const { return name == rhs.name && members == rhs.members; }
};

struct RecordType {
    Identifier name;
    std::vector<Member> entries;

    bool operator==(const RecordType& rhs) const { return name == rhs.name && entries == rhs.entries; }
};

/**
 * Closure / Finalize - bodies are kept as whitespace-normalised statements.
 * They never contribute to the transition's public inputs.
 */
struct Closure {
    Identifier name;
    std::vector<std::string> statements;

    bool operator==(const Closure& rhs) const { return name == rhs.name && statements == rhs.statements; }
};

struct Finalize {
    Identifier name;
    std::vector<std::string> statements;

    bool operator==(const Finalize& rhs) const { return name == rhs.name && statements == rhs.statements; }
};

/**
 * Function - an externally callable circuit. Its inputs and outputs define
 * the shape every transition of the function must have.
 */
struct Function {
    Identifier name;
    std::vector<Parameter> inputs;
    std::vector<std::string> instructions;
    std::vector<Parameter> outputs;
    std::optional<Finalize> finalize;

    bool has_future_output() const;

    bool operator==(const Function& rhs) const {
        return name == rhs.name && inputs == rhs.inputs && instructions == rhs.instructions &&
               outputs == rhs.outputs && finalize == rhs.finalize;
    }
};

/**
 * Program - a deployed program: id, imports, and its named components.
 *
 * Parsed from Aleo-instructions text. Statements end in ';', block headers
 * ("function name:") end in ':', and "//" starts a comment. to_string()
 * prints a canonical form that parses back to an equal program.
 */
class Program {
public:
    /**
     * Parse program source.
     * @throws ParseError (or InvalidIdentifier) describing the offending statement
     */
    static Program parse(const std::string& source);

    static Program from_file(const std::string& filepath);

    // The native credits program seeded into every fresh process
    static Program credits();

    const ProgramID& id() const { return id_; }
    const std::vector<ProgramID>& imports() const { return imports_; }
    const std::vector<Mapping>& mappings() const { return mappings_; }
    const std::vector<StructType>& structs() const { return structs_; }
    const std::vector<RecordType>& records() const { return records_; }
    const std::vector<Closure>& closures() const { return closures_; }
    const std::vector<Function>& functions() const { return functions_; }

    const Function* find_function(const Identifier& name) const;
    bool contains_function(const Identifier& name) const { return find_function(name) != nullptr; }
    bool contains_record(const Identifier& name) const;

    std::string to_string() const;

    bool operator==(const Program& rhs) const;
    bool operator!=(const Program& rhs) const { return !(*this == rhs); }

private:
    enum class BlockKind { Mapping, Struct, Record, Closure, Function };

    explicit Program(ProgramID id) : id_(std::move(id)) {}

    ProgramID id_;
    std::vector<ProgramID> imports_;
    std::vector<Mapping> mappings_;
    std::vector<StructType> structs_;
    std::vector<RecordType> records_;
    std::vector<Closure> closures_;
    std::vector<Function> functions_;

    // Declaration order, for canonical printing
    std::vector<std::pair<BlockKind, size_t>> order_;

    friend class ProgramParser;
};

/**
 * Function id: binds (network, program id, function name). Input and output
 * ids of a transition are derived from it.
 */
Digest compute_function_id(const ProgramID& program_id, const Identifier& function_name);

/**
 * Circuit id: binds the function id to the function's full definition
 * (signature and instructions). Verifying keys carry the circuit id they
 * were synthesized for.
 */
Digest compute_circuit_id(const ProgramID& program_id, const Function& function);

} // namespace zkverify
