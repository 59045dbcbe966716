#include "program/program.hpp"
#include "common/errors.hpp"
#include "encoding/bfield_codec.hpp"
#include "hash/tip5.hpp"
#include <fstream>
#include <set>
#include <sstream>

namespace zkverify {
namespace {

// One ';'- or ':'-terminated statement, whitespace split into tokens
struct Statement {
    std::vector<std::string> tokens;
    char terminator = ';';
    size_t line = 0;

    bool is_header() const { return terminator == ':'; }

    std::string text() const {
        std::string out;
        for (size_t i = 0; i < tokens.size(); ++i) {
            if (i) out += ' ';
            out += tokens[i];
        }
        return out;
    }
};

std::vector<Statement> split_statements(const std::string& source) {
    std::vector<Statement> statements;
    std::istringstream iss(source);
    std::string line;
    size_t line_no = 0;
    Statement current;
    std::string token;

    auto flush_token = [&]() {
        if (!token.empty()) {
            current.tokens.push_back(token);
            token.clear();
        }
    };

    while (std::getline(iss, line)) {
        ++line_no;
        if (auto pos = line.find("//"); pos != std::string::npos) line = line.substr(0, pos);
        for (char c : line) {
            if (c == ' ' || c == '\t' || c == '\r') {
                flush_token();
            } else if (c == ';' || c == ':') {
                flush_token();
                if (current.tokens.empty()) {
                    throw ParseError("empty statement at line " + std::to_string(line_no));
                }
                current.terminator = c;
                current.line = line_no;
                statements.push_back(std::move(current));
                current = Statement{};
            } else {
                token += c;
            }
        }
        flush_token();
    }
    if (!current.tokens.empty()) {
        throw ParseError("unterminated statement '" + current.text() + "'");
    }
    return statements;
}

ParseError statement_error(const Statement& st, const std::string& message) {
    return ParseError(message + " at line " + std::to_string(st.line) + ": '" + st.text() + "'");
}

size_t parse_register(const Statement& st, const std::string& text) {
    if (text.size() < 2 || text[0] != 'r' || (text.size() > 2 && text[1] == '0')) {
        throw statement_error(st, "malformed register '" + text + "'");
    }
    size_t value = 0;
    for (size_t i = 1; i < text.size(); ++i) {
        char c = text[i];
        if (c < '0' || c > '9' || value > 1000000) {
            throw statement_error(st, "malformed register '" + text + "'");
        }
        value = value * 10 + static_cast<size_t>(c - '0');
    }
    return value;
}

// "input r0 as u64.public" / "output r1 as credits.record"
Parameter parse_parameter(const Statement& st) {
    if (st.tokens.size() != 4 || st.tokens[2] != "as") {
        throw statement_error(st, "malformed " + st.tokens[0] + " statement");
    }
    Parameter param;
    param.reg = parse_register(st, st.tokens[1]);
    param.type = ValueType::parse(st.tokens[3]);
    return param;
}

// "owner as address.private"
Member parse_member(const Statement& st) {
    if (st.tokens.size() != 3 || st.tokens[1] != "as") {
        throw statement_error(st, "malformed member");
    }
    return Member{Identifier::parse(st.tokens[0]), st.tokens[2]};
}

std::string function_to_string(const Function& function) {
    std::ostringstream oss;
    oss << "function " << function.name << ":\n";
    for (const auto& in : function.inputs) {
        oss << "    input r" << in.reg << " as " << in.type.to_string() << ";\n";
    }
    for (const auto& instruction : function.instructions) {
        oss << "    " << instruction << ";\n";
    }
    for (const auto& out : function.outputs) {
        oss << "    output r" << out.reg << " as " << out.type.to_string() << ";\n";
    }
    if (function.finalize) {
        oss << "\nfinalize " << function.finalize->name << ":\n";
        for (const auto& statement : function.finalize->statements) {
            oss << "    " << statement << ";\n";
        }
    }
    return oss.str();
}

} // namespace

/**
 * ProgramParser - walks the statement list block by block and fills a Program.
 */
class ProgramParser {
public:
    explicit ProgramParser(const std::string& source) : statements_(split_statements(source)) {}

    Program run() {
        std::vector<ProgramID> imports;
        while (pos_ < statements_.size() && statements_[pos_].tokens[0] == "import") {
            const auto& st = statements_[pos_++];
            if (st.is_header() || st.tokens.size() != 2) {
                throw statement_error(st, "malformed import");
            }
            imports.push_back(ProgramID::parse(st.tokens[1]));
        }

        if (pos_ >= statements_.size() || statements_[pos_].tokens[0] != "program") {
            throw ParseError("expected 'program <name>.aleo;' after imports");
        }
        const auto& header = statements_[pos_++];
        if (header.is_header() || header.tokens.size() != 2) {
            throw statement_error(header, "malformed program statement");
        }

        Program program(ProgramID::parse(header.tokens[1]));
        for (const auto& import : imports) {
            if (import == program.id_) {
                throw ParseError("program '" + program.id_.to_string() + "' imports itself");
            }
            for (const auto& seen : program.imports_) {
                if (seen == import) {
                    throw ParseError("duplicate import '" + import.to_string() + "'");
                }
            }
            program.imports_.push_back(import);
        }

        while (pos_ < statements_.size()) {
            parse_block(program);
        }

        validate(program);
        return program;
    }

private:
    const Statement& expect_header() {
        const auto& st = statements_[pos_++];
        if (!st.is_header() || st.tokens.size() != 2) {
            throw statement_error(st, "expected a block header");
        }
        return st;
    }

    // Collects ';' statements up to the next block header
    std::vector<const Statement*> block_body() {
        std::vector<const Statement*> body;
        while (pos_ < statements_.size() && !statements_[pos_].is_header()) {
            body.push_back(&statements_[pos_++]);
        }
        return body;
    }

    void parse_block(Program& program) {
        const auto& st = expect_header();
        const std::string& keyword = st.tokens[0];
        Identifier name = Identifier::parse(st.tokens[1]);
        if (!names_.insert(name.to_string()).second) {
            throw statement_error(st, "duplicate name '" + name.to_string() + "'");
        }
        auto body = block_body();

        if (keyword == "mapping") {
            if (body.size() != 2 || body[0]->tokens.size() != 3 || body[0]->tokens[0] != "key" ||
                body[0]->tokens[1] != "as" || body[1]->tokens.size() != 3 ||
                body[1]->tokens[0] != "value" || body[1]->tokens[1] != "as") {
                throw statement_error(st, "mapping expects 'key as T;' and 'value as T;'");
            }
            Mapping mapping{name, ValueType::parse(body[0]->tokens[2]), ValueType::parse(body[1]->tokens[2])};
            if (mapping.key.kind != ValueKind::Public || mapping.value.kind != ValueKind::Public) {
                throw statement_error(st, "mapping key and value must be public literals");
            }
            program.order_.emplace_back(Program::BlockKind::Mapping, program.mappings_.size());
            program.mappings_.push_back(std::move(mapping));
        } else if (keyword == "struct") {
            StructType type{name, {}};
            for (const auto* member : body) type.members.push_back(parse_member(*member));
            if (type.members.empty()) {
                throw statement_error(st, "struct must have at least one member");
            }
            check_unique_members(st, type.members);
            program.order_.emplace_back(Program::BlockKind::Struct, program.structs_.size());
            program.structs_.push_back(std::move(type));
        } else if (keyword == "record") {
            RecordType record{name, {}};
            for (const auto* entry : body) record.entries.push_back(parse_member(*entry));
            if (record.entries.empty() || record.entries[0].name.to_string() != "owner" ||
                (record.entries[0].type != "address.private" && record.entries[0].type != "address.public")) {
                throw statement_error(st, "record must start with 'owner as address.<visibility>;'");
            }
            check_unique_members(st, record.entries);
            program.order_.emplace_back(Program::BlockKind::Record, program.records_.size());
            program.records_.push_back(std::move(record));
        } else if (keyword == "closure") {
            Closure closure{name, {}};
            for (const auto* statement : body) closure.statements.push_back(statement->text());
            if (closure.statements.empty()) {
                throw statement_error(st, "closure must not be empty");
            }
            program.order_.emplace_back(Program::BlockKind::Closure, program.closures_.size());
            program.closures_.push_back(std::move(closure));
        } else if (keyword == "function") {
            Function function = parse_function(st, name, body);
            if (pos_ < statements_.size() && statements_[pos_].is_header() &&
                statements_[pos_].tokens[0] == "finalize") {
                const auto& fin = expect_header();
                Identifier fin_name = Identifier::parse(fin.tokens[1]);
                if (fin_name != name) {
                    throw statement_error(fin, "finalize must be named after its function '" +
                                                   name.to_string() + "'");
                }
                Finalize finalize{fin_name, {}};
                for (const auto* statement : block_body()) finalize.statements.push_back(statement->text());
                function.finalize = std::move(finalize);
            }
            program.order_.emplace_back(Program::BlockKind::Function, program.functions_.size());
            program.functions_.push_back(std::move(function));
        } else {
            throw statement_error(st, "unknown block '" + keyword + "'");
        }
    }

    Function parse_function(const Statement& header, const Identifier& name,
                            const std::vector<const Statement*>& body) {
        Function function{name, {}, {}, {}, std::nullopt};
        size_t i = 0;
        while (i < body.size() && body[i]->tokens[0] == "input") {
            Parameter input = parse_parameter(*body[i]);
            if (input.reg != function.inputs.size()) {
                throw statement_error(*body[i], "inputs must use registers r0..rN-1 in order");
            }
            if (input.type.kind == ValueKind::Future) {
                throw statement_error(*body[i], "a function input cannot be a future");
            }
            function.inputs.push_back(std::move(input));
            ++i;
        }
        while (i < body.size() && body[i]->tokens[0] != "output") {
            if (body[i]->tokens[0] == "input") {
                throw statement_error(*body[i], "input after instructions");
            }
            function.instructions.push_back(body[i]->text());
            ++i;
        }
        while (i < body.size()) {
            if (body[i]->tokens[0] != "output") {
                throw statement_error(*body[i], "instruction after outputs");
            }
            function.outputs.push_back(parse_parameter(*body[i]));
            ++i;
        }
        if (function.inputs.empty() && function.outputs.empty() && function.instructions.empty()) {
            throw statement_error(header, "function must not be empty");
        }
        return function;
    }

    static void check_unique_members(const Statement& st, const std::vector<Member>& members) {
        std::set<std::string> seen;
        for (const auto& member : members) {
            if (!seen.insert(member.name.to_string()).second) {
                throw statement_error(st, "duplicate member '" + member.name.to_string() + "'");
            }
        }
    }

    static void validate_parameter(const Program& program, const Function& function, const Parameter& param) {
        const auto& type = param.type;
        const std::string where = "'" + type.to_string() + "' in function '" + function.name.to_string() + "'";
        if (type.kind == ValueKind::Record && !program.contains_record(*type.name)) {
            throw ParseError("unknown record type " + where);
        }
        if (type.kind == ValueKind::ExternalRecord || type.kind == ValueKind::Future) {
            bool is_self = *type.program == program.id();
            bool imported = false;
            for (const auto& import : program.imports()) imported = imported || import == *type.program;
            if (type.kind == ValueKind::ExternalRecord && !imported) {
                throw ParseError("external record from a program that is not imported: " + where);
            }
            if (type.kind == ValueKind::Future && !is_self && !imported) {
                throw ParseError("future from a program that is not imported: " + where);
            }
            if (type.kind == ValueKind::Future && is_self && *type.name != function.name) {
                throw ParseError("future must be named after its function: " + where);
            }
        }
    }

    static void validate(const Program& program) {
        if (program.functions_.empty()) {
            throw ParseError("program '" + program.id_.to_string() + "' declares no function");
        }
        for (const auto& function : program.functions_) {
            for (const auto& in : function.inputs) validate_parameter(program, function, in);
            for (const auto& out : function.outputs) validate_parameter(program, function, out);
            if (function.has_future_output() && !function.finalize) {
                throw ParseError("function '" + function.name.to_string() +
                                 "' returns a future but has no finalize block");
            }
            if (function.finalize && !function.has_future_output()) {
                throw ParseError("finalize '" + function.name.to_string() +
                                 "' has no future output to run it");
            }
        }
    }

    std::vector<Statement> statements_;
    size_t pos_ = 0;
    std::set<std::string> names_;
};

bool Function::has_future_output() const {
    for (const auto& out : outputs) {
        if (out.type.kind == ValueKind::Future) return true;
    }
    return false;
}

Program Program::parse(const std::string& source) {
    return ProgramParser(source).run();
}

Program Program::from_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str());
}

const Function* Program::find_function(const Identifier& name) const {
    for (const auto& function : functions_) {
        if (function.name == name) return &function;
    }
    return nullptr;
}

bool Program::contains_record(const Identifier& name) const {
    for (const auto& record : records_) {
        if (record.name == name) return true;
    }
    return false;
}

std::string Program::to_string() const {
    std::ostringstream oss;
    for (const auto& import : imports_) {
        oss << "import " << import << ";\n";
    }
    if (!imports_.empty()) oss << "\n";
    oss << "program " << id_ << ";\n";

    for (const auto& [kind, index] : order_) {
        oss << "\n";
        switch (kind) {
            case BlockKind::Mapping: {
                const auto& m = mappings_[index];
                oss << "mapping " << m.name << ":\n"
                    << "    key as " << m.key.to_string() << ";\n"
                    << "    value as " << m.value.to_string() << ";\n";
                break;
            }
            case BlockKind::Struct: {
                const auto& s = structs_[index];
                oss << "struct " << s.name << ":\n";
                for (const auto& member : s.members) {
                    oss << "    " << member.name << " as " << member.type << ";\n";
                }
                break;
            }
            case BlockKind::Record: {
                const auto& r = records_[index];
                oss << "record " << r.name << ":\n";
                for (const auto& entry : r.entries) {
                    oss << "    " << entry.name << " as " << entry.type << ";\n";
                }
                break;
            }
            case BlockKind::Closure: {
                const auto& c = closures_[index];
                oss << "closure " << c.name << ":\n";
                for (const auto& statement : c.statements) {
                    oss << "    " << statement << ";\n";
                }
                break;
            }
            case BlockKind::Function:
                oss << function_to_string(functions_[index]);
                break;
        }
    }
    return oss.str();
}

bool Program::operator==(const Program& rhs) const {
    return id_ == rhs.id_ && imports_ == rhs.imports_ && mappings_ == rhs.mappings_ &&
           structs_ == rhs.structs_ && records_ == rhs.records_ && closures_ == rhs.closures_ &&
           functions_ == rhs.functions_ && order_ == rhs.order_;
}

Digest compute_function_id(const ProgramID& program_id, const Identifier& function_name) {
    BFieldWriter writer;
    writer.put_string("function_id");
    writer.put_string(ProgramID::NETWORK);
    writer.put_string(program_id.to_string());
    writer.put_string(function_name.to_string());
    return Tip5::hash_varlen(writer.elements());
}

Digest compute_circuit_id(const ProgramID& program_id, const Function& function) {
    BFieldWriter writer;
    writer.put_string("circuit_id");
    writer.put_digest(compute_function_id(program_id, function.name));
    writer.put_string(function_to_string(function));
    return Tip5::hash_varlen(writer.elements());
}

} // namespace zkverify
