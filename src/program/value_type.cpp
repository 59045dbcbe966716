#include "program/value_type.hpp"
#include "common/errors.hpp"
#include "encoding/bech32.hpp"
#include "types/b_field_element.hpp"
#include <array>
#include <utility>

namespace zkverify {
namespace {

const std::array<std::pair<LiteralType, const char*>, 15>& literal_type_names() {
    static const std::array<std::pair<LiteralType, const char*>, 15> names = {{
        {LiteralType::Address, "address"},
        {LiteralType::Boolean, "boolean"},
        {LiteralType::Field, "field"},
        {LiteralType::Group, "group"},
        {LiteralType::Scalar, "scalar"},
        {LiteralType::U8, "u8"},
        {LiteralType::U16, "u16"},
        {LiteralType::U32, "u32"},
        {LiteralType::U64, "u64"},
        {LiteralType::U128, "u128"},
        {LiteralType::I8, "i8"},
        {LiteralType::I16, "i16"},
        {LiteralType::I32, "i32"},
        {LiteralType::I64, "i64"},
        {LiteralType::I128, "i128"},
    }};
    return names;
}

// Bit width and signedness of the integer literal types; 0 for the others
std::pair<unsigned, bool> integer_shape(LiteralType type) {
    switch (type) {
        case LiteralType::U8: return {8, false};
        case LiteralType::U16: return {16, false};
        case LiteralType::U32: return {32, false};
        case LiteralType::U64: return {64, false};
        case LiteralType::U128: return {128, false};
        case LiteralType::I8: return {8, true};
        case LiteralType::I16: return {16, true};
        case LiteralType::I32: return {32, true};
        case LiteralType::I64: return {64, true};
        case LiteralType::I128: return {128, true};
        default: return {0, false};
    }
}

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Parses canonical decimal digits; false on empty, leading zeros, non-digits or overflow
bool parse_magnitude(const std::string& digits, uint128_t& out) {
    if (digits.empty() || (digits.size() > 1 && digits[0] == '0')) {
        return false;
    }
    const uint128_t max = ~static_cast<uint128_t>(0);
    uint128_t acc = 0;
    for (char c : digits) {
        if (c < '0' || c > '9') return false;
        uint128_t d = static_cast<uint128_t>(c - '0');
        if (acc > (max - d) / 10) return false;
        acc = acc * 10 + d;
    }
    out = acc;
    return true;
}

void check_numeric(const std::string& text, LiteralType type, const std::string& number);

} // namespace

std::string to_string(LiteralType type) {
    for (const auto& [t, name] : literal_type_names()) {
        if (t == type) return name;
    }
    return "unknown";
}

std::optional<LiteralType> literal_type_from_string(const std::string& text) {
    for (const auto& [t, name] : literal_type_names()) {
        if (text == name) return t;
    }
    return std::nullopt;
}

Literal Literal::parse(const std::string& text) {
    if (text == "true" || text == "false") {
        return Literal(LiteralType::Boolean, text);
    }

    const std::string address_prefix = std::string(ProgramID::NETWORK) + "1";
    if (text.size() > address_prefix.size() &&
        (text.compare(0, address_prefix.size(), address_prefix) == 0 ||
         text.compare(0, address_prefix.size(), "ALEO1") == 0)) {
        auto payload = bech32::decode_expecting(ProgramID::NETWORK, text);
        if (payload.empty()) {
            throw ParseError("address literal has an empty payload");
        }
        return Literal(LiteralType::Address, bech32::encode(ProgramID::NETWORK, payload));
    }

    for (const auto& [type, name] : literal_type_names()) {
        if (type == LiteralType::Address || type == LiteralType::Boolean) continue;
        if (!ends_with(text, name)) continue;
        std::string number = text.substr(0, text.size() - std::string(name).size());
        if (number.empty()) continue;
        char last = number.back();
        if (last < '0' || last > '9') continue;
        check_numeric(text, type, number);
        return Literal(type, text);
    }

    throw ParseError("unrecognized literal '" + text + "'");
}

namespace {

void check_numeric(const std::string& text, LiteralType type, const std::string& number) {
    bool negative = !number.empty() && number[0] == '-';
    std::string digits = negative ? number.substr(1) : number;

    uint128_t magnitude = 0;
    if (!parse_magnitude(digits, magnitude)) {
        throw ParseError("malformed number in literal '" + text + "'");
    }
    if (negative && magnitude == 0) {
        throw ParseError("negative zero in literal '" + text + "'");
    }

    auto [bits, is_signed] = integer_shape(type);
    if (bits == 0) {
        if (negative) {
            throw ParseError("negative value in literal '" + text + "'");
        }
        uint128_t bound = (type == LiteralType::Scalar) ? BFieldElement::GROUP_ORDER
                                                        : BFieldElement::MODULUS;
        if (magnitude >= bound) {
            throw ParseError("literal '" + text + "' exceeds the field modulus");
        }
        if (type == LiteralType::Group && magnitude == 0) {
            throw ParseError("group literal must be non-zero");
        }
    } else if (!is_signed) {
        if (negative) {
            throw ParseError("negative value in unsigned literal '" + text + "'");
        }
        if (bits < 128 && magnitude > ((static_cast<uint128_t>(1) << bits) - 1)) {
            throw ParseError("literal '" + text + "' out of range");
        }
    } else {
        uint128_t limit = static_cast<uint128_t>(1) << (bits - 1);
        if ((negative && magnitude > limit) || (!negative && magnitude >= limit)) {
            throw ParseError("literal '" + text + "' out of range");
        }
    }
}

} // namespace

BFieldElement element_from_literal(const std::string& text, LiteralType expected) {
    Literal literal = Literal::parse(text);
    if (literal.type() != expected) {
        throw ParseError("expected a " + zkverify::to_string(expected) + " literal, got '" + text + "'");
    }
    const std::string suffix = zkverify::to_string(expected);
    return BFieldElement::from_decimal(text.substr(0, text.size() - suffix.size()));
}

std::string element_to_literal(const BFieldElement& value, LiteralType type) {
    return value.to_string() + zkverify::to_string(type);
}

std::string to_string(ValueKind kind) {
    switch (kind) {
        case ValueKind::Constant: return "constant";
        case ValueKind::Public: return "public";
        case ValueKind::Private: return "private";
        case ValueKind::Record: return "record";
        case ValueKind::ExternalRecord: return "external_record";
        case ValueKind::Future: return "future";
    }
    return "unknown";
}

std::optional<ValueKind> value_kind_from_string(const std::string& text) {
    if (text == "constant") return ValueKind::Constant;
    if (text == "public") return ValueKind::Public;
    if (text == "private") return ValueKind::Private;
    if (text == "record") return ValueKind::Record;
    if (text == "external_record") return ValueKind::ExternalRecord;
    if (text == "future") return ValueKind::Future;
    return std::nullopt;
}

ValueType ValueType::parse(const std::string& text) {
    size_t dot = text.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == text.size()) {
        throw ParseError("malformed value type '" + text + "'");
    }
    std::string head = text.substr(0, dot);
    std::string tail = text.substr(dot + 1);

    ValueType vt;
    if (tail == "record" || tail == "future") {
        size_t slash = head.find('/');
        if (slash == std::string::npos) {
            if (tail == "future") {
                throw ParseError("future type must name its program: '" + text + "'");
            }
            vt.kind = ValueKind::Record;
            vt.name = Identifier::parse(head);
        } else {
            vt.kind = (tail == "record") ? ValueKind::ExternalRecord : ValueKind::Future;
            vt.program = ProgramID::parse(head.substr(0, slash));
            vt.name = Identifier::parse(head.substr(slash + 1));
        }
        return vt;
    }

    auto kind = value_kind_from_string(tail);
    if (!kind || (*kind != ValueKind::Constant && *kind != ValueKind::Public && *kind != ValueKind::Private)) {
        throw ParseError("unknown visibility in value type '" + text + "'");
    }
    auto literal = literal_type_from_string(head);
    if (!literal) {
        throw ParseError("unsupported type '" + head + "' in value type '" + text + "'");
    }
    vt.kind = *kind;
    vt.literal = *literal;
    return vt;
}

std::string ValueType::to_string() const {
    switch (kind) {
        case ValueKind::Constant:
        case ValueKind::Public:
        case ValueKind::Private:
            return zkverify::to_string(literal) + "." + zkverify::to_string(kind);
        case ValueKind::Record:
            return name->to_string() + ".record";
        case ValueKind::ExternalRecord:
            return program->to_string() + "/" + name->to_string() + ".record";
        case ValueKind::Future:
            return program->to_string() + "/" + name->to_string() + ".future";
    }
    return "";
}

bool ValueType::operator==(const ValueType& rhs) const {
    if (kind != rhs.kind) return false;
    if (is_literal()) return literal == rhs.literal;
    return program == rhs.program && name == rhs.name;
}

} // namespace zkverify
