#pragma once

#include "program/identifier.hpp"
#include "types/b_field_element.hpp"
#include <optional>
#include <string>

namespace zkverify {

enum class LiteralType {
    Address,
    Boolean,
    Field,
    Group,
    Scalar,
    U8, U16, U32, U64, U128,
    I8, I16, I32, I64, I128
};

std::string to_string(LiteralType type);
std::optional<LiteralType> literal_type_from_string(const std::string& text);

/**
 * Literal - a plaintext value in canonical text form, e.g. "10u64",
 * "-3i8", "42field", "true", "aleo1...".
 */
class Literal {
public:
    // @throws ParseError on malformed text or out-of-range values
    static Literal parse(const std::string& text);

    LiteralType type() const { return type_; }
    const std::string& to_string() const { return text_; }

    bool operator==(const Literal& rhs) const { return type_ == rhs.type_ && text_ == rhs.text_; }

private:
    Literal(LiteralType type, std::string text) : type_(type), text_(std::move(text)) {}

    LiteralType type_;
    std::string text_;
};

/**
 * Field-like literals ("<n>field", "<n>group", "<n>scalar") carried as one
 * field element. Commitments, serial numbers, ids and tpk/tcm/scm use these.
 * @throws ParseError if the text is not a literal of the expected type
 */
BFieldElement element_from_literal(const std::string& text, LiteralType expected);
std::string element_to_literal(const BFieldElement& value, LiteralType type);

/**
 * ValueKind - how a transition input or output is represented.
 * Serialized as the "type" field of transition inputs/outputs.
 */
enum class ValueKind {
    Constant,
    Public,
    Private,
    Record,
    ExternalRecord,
    Future
};

std::string to_string(ValueKind kind);
std::optional<ValueKind> value_kind_from_string(const std::string& text);

/**
 * ValueType - declared type of a function input or output:
 *   u64.public | credits.record | credits.aleo/credits.record |
 *   credits.aleo/transfer_public.future
 */
struct ValueType {
    ValueKind kind = ValueKind::Public;
    LiteralType literal = LiteralType::Field;   // Constant, Public, Private
    std::optional<ProgramID> program;           // ExternalRecord, Future
    std::optional<Identifier> name;             // record name, or function name of a future

    // @throws ParseError / InvalidIdentifier
    static ValueType parse(const std::string& text);

    bool is_literal() const {
        return kind == ValueKind::Constant || kind == ValueKind::Public || kind == ValueKind::Private;
    }

    std::string to_string() const;

    bool operator==(const ValueType& rhs) const;
    bool operator!=(const ValueType& rhs) const { return !(*this == rhs); }
};

} // namespace zkverify
