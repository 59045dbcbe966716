#pragma once

#include "types/b_field_element.hpp"
#include "types/digest.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace zkverify {

/**
 * BFieldWriter - builds a field-element encoding of a structured value.
 *
 * Dynamic-length sequences are prefixed with their length; fixed-size values
 * (digests) are written without a prefix. The byte form writes every element
 * as 8 little-endian bytes and is the payload of the bech32m artifact strings.
 */
class BFieldWriter {
public:
    void put(const BFieldElement& element) { elements_.push_back(element); }
    void put_u64(uint64_t value);
    void put_digest(const Digest& digest);
    void put_digests(const std::vector<Digest>& digests);
    void put_elements(const std::vector<BFieldElement>& elements);

    // Length-prefixed, 7 bytes per element so every chunk stays below the modulus
    void put_bytes(const std::vector<uint8_t>& bytes);
    void put_string(const std::string& text);

    const std::vector<BFieldElement>& elements() const { return elements_; }
    std::vector<uint8_t> to_bytes() const;

private:
    std::vector<BFieldElement> elements_;
};

/**
 * BFieldReader - consumes an encoding produced by BFieldWriter.
 *
 * Every failure (truncation, non-canonical element, trailing data) throws
 * ParseError.
 */
class BFieldReader {
public:
    explicit BFieldReader(std::vector<BFieldElement> elements);
    explicit BFieldReader(const std::vector<uint8_t>& bytes);

    BFieldElement take();
    uint64_t take_u64();
    // Length prefix, rejected when larger than the remaining input allows
    size_t take_len(size_t element_width = 1);
    Digest take_digest();
    std::vector<Digest> take_digests();
    std::vector<BFieldElement> take_elements();
    std::vector<uint8_t> take_bytes();
    std::string take_string();

    size_t remaining() const { return elements_.size() - index_; }
    void expect_end() const;

private:
    std::vector<BFieldElement> elements_;
    size_t index_ = 0;
};

} // namespace zkverify
