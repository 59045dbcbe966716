#include "encoding/bfield_codec.hpp"
#include "common/errors.hpp"
#include <algorithm>

namespace zkverify {

void BFieldWriter::put_u64(uint64_t value) {
    if (value >= BFieldElement::MODULUS) {
        throw std::invalid_argument("BFieldWriter: integer does not fit a field element");
    }
    elements_.push_back(BFieldElement(value));
}

void BFieldWriter::put_digest(const Digest& digest) {
    for (size_t i = 0; i < Digest::LEN; ++i) {
        elements_.push_back(digest[i]);
    }
}

void BFieldWriter::put_digests(const std::vector<Digest>& digests) {
    put_u64(digests.size());
    for (const auto& digest : digests) {
        put_digest(digest);
    }
}

void BFieldWriter::put_elements(const std::vector<BFieldElement>& elements) {
    put_u64(elements.size());
    elements_.insert(elements_.end(), elements.begin(), elements.end());
}

void BFieldWriter::put_bytes(const std::vector<uint8_t>& bytes) {
    put_u64(bytes.size());
    for (size_t offset = 0; offset < bytes.size(); offset += 7) {
        uint64_t chunk = 0;
        for (size_t i = 0; i < 7 && offset + i < bytes.size(); ++i) {
            chunk |= static_cast<uint64_t>(bytes[offset + i]) << (8 * i);
        }
        elements_.push_back(BFieldElement(chunk));
    }
}

void BFieldWriter::put_string(const std::string& text) {
    put_bytes(std::vector<uint8_t>(text.begin(), text.end()));
}

std::vector<uint8_t> BFieldWriter::to_bytes() const {
    std::vector<uint8_t> bytes;
    bytes.reserve(elements_.size() * 8);
    for (const auto& element : elements_) {
        uint64_t v = element.value();
        for (size_t i = 0; i < 8; ++i) {
            bytes.push_back(static_cast<uint8_t>(v >> (8 * i)));
        }
    }
    return bytes;
}

BFieldReader::BFieldReader(std::vector<BFieldElement> elements)
    : elements_(std::move(elements)) {}

BFieldReader::BFieldReader(const std::vector<uint8_t>& bytes) {
    if (bytes.size() % 8 != 0) {
        throw ParseError("encoding length is not a multiple of 8 bytes");
    }
    elements_.reserve(bytes.size() / 8);
    for (size_t offset = 0; offset < bytes.size(); offset += 8) {
        uint64_t v = 0;
        for (size_t i = 0; i < 8; ++i) {
            v |= static_cast<uint64_t>(bytes[offset + i]) << (8 * i);
        }
        if (v >= BFieldElement::MODULUS) {
            throw ParseError("non-canonical field element in encoding");
        }
        elements_.push_back(BFieldElement(v));
    }
}

BFieldElement BFieldReader::take() {
    if (index_ >= elements_.size()) {
        throw ParseError("encoding truncated");
    }
    return elements_[index_++];
}

uint64_t BFieldReader::take_u64() {
    return take().value();
}

size_t BFieldReader::take_len(size_t element_width) {
    uint64_t len = take_u64();
    if (element_width != 0 && len > remaining() / element_width) {
        throw ParseError("encoding declares more items than it contains");
    }
    return static_cast<size_t>(len);
}

Digest BFieldReader::take_digest() {
    Digest digest;
    for (size_t i = 0; i < Digest::LEN; ++i) {
        digest[i] = take();
    }
    return digest;
}

std::vector<Digest> BFieldReader::take_digests() {
    size_t count = take_len(Digest::LEN);
    std::vector<Digest> digests;
    digests.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        digests.push_back(take_digest());
    }
    return digests;
}

std::vector<BFieldElement> BFieldReader::take_elements() {
    size_t count = take_len();
    std::vector<BFieldElement> out(elements_.begin() + index_, elements_.begin() + index_ + count);
    index_ += count;
    return out;
}

std::vector<uint8_t> BFieldReader::take_bytes() {
    uint64_t len = take_u64();
    if (len > remaining() * 7) {
        throw ParseError("encoding declares a longer byte string than it contains");
    }
    std::vector<uint8_t> bytes;
    bytes.reserve(static_cast<size_t>(len));
    while (bytes.size() < len) {
        uint64_t chunk = take_u64();
        size_t n = std::min<size_t>(7, static_cast<size_t>(len) - bytes.size());
        if ((chunk >> (8 * n)) != 0) {
            throw ParseError("non-canonical byte chunk in encoding");
        }
        for (size_t i = 0; i < n; ++i) {
            bytes.push_back(static_cast<uint8_t>((chunk >> (8 * i)) & 0xFF));
        }
    }
    return bytes;
}

std::string BFieldReader::take_string() {
    std::vector<uint8_t> bytes = take_bytes();
    return std::string(bytes.begin(), bytes.end());
}

void BFieldReader::expect_end() const {
    if (index_ != elements_.size()) {
        throw ParseError("trailing data in encoding");
    }
}

} // namespace zkverify
