#include "types/b_field_element.hpp"
#include "common/errors.hpp"
#include <stdexcept>

namespace zkverify {

// The 128-bit modulo is well-optimized by GCC/Clang for this specific modulus
uint64_t BFieldElement::reduce(uint128_t value) {
    return static_cast<uint64_t>(value % MODULUS);
}

BFieldElement BFieldElement::from_decimal(const std::string& digits) {
    if (digits.empty()) {
        throw ParseError("empty field element");
    }
    if (digits.size() > 1 && digits[0] == '0') {
        throw ParseError("field element has leading zeros: " + digits);
    }
    uint128_t acc = 0;
    for (char c : digits) {
        if (c < '0' || c > '9') {
            throw ParseError("invalid digit in field element: " + digits);
        }
        acc = acc * 10 + static_cast<uint128_t>(c - '0');
        if (acc >= MODULUS) {
            throw ParseError("field element exceeds modulus: " + digits);
        }
    }
    return BFieldElement(static_cast<uint64_t>(acc));
}

BFieldElement BFieldElement::operator+(const BFieldElement& rhs) const {
    // Branchless addition: compute sum, then subtract MODULUS on overflow
    uint64_t sum = value_ + rhs.value_;
    uint64_t overflow = static_cast<uint64_t>(sum < value_);
    uint64_t too_large = static_cast<uint64_t>(sum >= MODULUS);
    sum -= MODULUS & (-(overflow | too_large));
    return BFieldElement(sum);
}

BFieldElement BFieldElement::operator-(const BFieldElement& rhs) const {
    uint64_t diff = value_ - rhs.value_;
    uint64_t underflow = static_cast<uint64_t>(value_ < rhs.value_);
    diff += MODULUS & (-underflow);
    return BFieldElement(diff);
}

BFieldElement BFieldElement::operator*(const BFieldElement& rhs) const {
    uint128_t product = static_cast<uint128_t>(value_) * static_cast<uint128_t>(rhs.value_);
    return BFieldElement(reduce(product));
}

BFieldElement& BFieldElement::operator+=(const BFieldElement& rhs) {
    *this = *this + rhs;
    return *this;
}

BFieldElement& BFieldElement::operator-=(const BFieldElement& rhs) {
    *this = *this - rhs;
    return *this;
}

BFieldElement& BFieldElement::operator*=(const BFieldElement& rhs) {
    *this = *this * rhs;
    return *this;
}

BFieldElement BFieldElement::pow(uint64_t exp) const {
    BFieldElement result = BFieldElement::one();
    BFieldElement base = *this;

    while (exp > 0) {
        if (exp & 1) {
            result *= base;
        }
        base *= base;
        exp >>= 1;
    }

    return result;
}

std::string BFieldElement::to_string() const {
    return std::to_string(value_);
}

std::ostream& operator<<(std::ostream& os, const BFieldElement& elem) {
    return os << elem.value_;
}

} // namespace zkverify
