#pragma once

#include <cstdint>
#include <string>
#include <ostream>
#include <vector>

namespace zkverify {

// 128-bit unsigned integer type for intermediate calculations
using uint128_t = __uint128_t;

/**
 * BFieldElement - Base Field Element
 *
 * Element of the Goldilocks prime field with modulus p = 2^64 - 2^32 + 1.
 * Every field-typed value in the system (commitments, ids, group elements,
 * key material) is a BFieldElement in canonical representation.
 */
class BFieldElement {
public:
    // The Goldilocks prime: 2^64 - 2^32 + 1
    static constexpr uint64_t MODULUS = 18446744069414584321ULL;

    // Order of the multiplicative group (p - 1)
    static constexpr uint64_t GROUP_ORDER = MODULUS - 1;

    // Generator of the multiplicative group
    static constexpr uint64_t GENERATOR = 7ULL;

    // Constructors
    constexpr BFieldElement() : value_(0) {}
    constexpr explicit BFieldElement(uint64_t value) : value_(value % MODULUS) {}

    // Factory methods
    static constexpr BFieldElement zero() { return BFieldElement(0); }
    static constexpr BFieldElement one() { return BFieldElement(1); }
    static constexpr BFieldElement generator() { return BFieldElement(GENERATOR); }

    /**
     * Parse a canonical decimal representation.
     * @throws ParseError on empty input, non-digits, or values >= MODULUS
     */
    static BFieldElement from_decimal(const std::string& digits);

    // Accessors
    constexpr uint64_t value() const { return value_; }

    // Arithmetic operations
    BFieldElement operator+(const BFieldElement& rhs) const;
    BFieldElement operator-(const BFieldElement& rhs) const;
    BFieldElement operator*(const BFieldElement& rhs) const;

    BFieldElement& operator+=(const BFieldElement& rhs);
    BFieldElement& operator-=(const BFieldElement& rhs);
    BFieldElement& operator*=(const BFieldElement& rhs);

    // Comparison
    bool operator==(const BFieldElement& rhs) const { return value_ == rhs.value_; }
    bool operator!=(const BFieldElement& rhs) const { return value_ != rhs.value_; }
    bool operator<(const BFieldElement& rhs) const { return value_ < rhs.value_; }

    // Field operations
    BFieldElement pow(uint64_t exp) const;

    // Decimal string representation
    std::string to_string() const;

    friend std::ostream& operator<<(std::ostream& os, const BFieldElement& elem);

private:
    uint64_t value_;

    static uint64_t reduce(uint128_t value);
};

} // namespace zkverify
