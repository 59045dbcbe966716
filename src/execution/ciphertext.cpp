#include "execution/ciphertext.hpp"
#include "common/errors.hpp"
#include "encoding/bech32.hpp"
#include "encoding/bfield_codec.hpp"
#include "hash/tip5.hpp"

namespace zkverify {
namespace {

constexpr uint64_t CIPHERTEXT_VERSION = 1;

// Five mask elements per Tip5 call
std::vector<BFieldElement> keystream(const BFieldElement& view_key, uint64_t slot, size_t length) {
    std::vector<BFieldElement> stream;
    stream.reserve(length + Digest::LEN);
    for (uint64_t block = 0; stream.size() < length; ++block) {
        Digest d = Tip5::hash_varlen({view_key, BFieldElement(slot), BFieldElement(block)});
        for (size_t i = 0; i < Digest::LEN; ++i) stream.push_back(d[i]);
    }
    stream.resize(length);
    return stream;
}

std::vector<BFieldElement> decode(const std::string& hrp, const std::string& ciphertext) {
    BFieldReader reader(bech32::decode_expecting(hrp, ciphertext));
    uint64_t version = reader.take_u64();
    if (version != CIPHERTEXT_VERSION) {
        throw ParseError("unsupported ciphertext version " + std::to_string(version));
    }
    auto elements = reader.take_elements();
    reader.expect_end();
    if (elements.empty()) {
        throw ParseError("empty ciphertext");
    }
    return elements;
}

} // namespace

std::string encrypt_value(const std::string& hrp, const std::string& plaintext,
                          const BFieldElement& view_key, uint64_t slot) {
    BFieldWriter plain;
    plain.put_string(plaintext);
    std::vector<BFieldElement> elements = plain.elements();
    auto mask = keystream(view_key, slot, elements.size());
    for (size_t i = 0; i < elements.size(); ++i) {
        elements[i] += mask[i];
    }

    BFieldWriter writer;
    writer.put_u64(CIPHERTEXT_VERSION);
    writer.put_elements(elements);
    return bech32::encode(hrp, writer.to_bytes());
}

std::string decrypt_value(const std::string& hrp, const std::string& ciphertext,
                          const BFieldElement& view_key, uint64_t slot) {
    auto elements = decode(hrp, ciphertext);
    auto mask = keystream(view_key, slot, elements.size());
    for (size_t i = 0; i < elements.size(); ++i) {
        elements[i] -= mask[i];
    }
    BFieldReader reader(std::move(elements));
    std::string plaintext = reader.take_string();
    reader.expect_end();
    return plaintext;
}

void check_ciphertext(const std::string& hrp, const std::string& ciphertext) {
    decode(hrp, ciphertext);
}

} // namespace zkverify
