#include "backend/keys.hpp"
#include "common/errors.hpp"
#include "encoding/bech32.hpp"
#include "encoding/bfield_codec.hpp"
#include <algorithm>
#include <fstream>
#include <sstream>

namespace zkverify {
namespace {

void expect_version(BFieldReader& reader, uint64_t expected, const char* what) {
    uint64_t version = reader.take_u64();
    if (version != expected) {
        throw ParseError(std::string("unsupported ") + what + " version " + std::to_string(version));
    }
}

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

template <size_t N>
void put_array(BFieldWriter& writer, const std::array<uint8_t, N>& bytes) {
    writer.put_bytes(std::vector<uint8_t>(bytes.begin(), bytes.end()));
}

template <size_t N>
std::array<uint8_t, N> take_array(BFieldReader& reader, const char* what) {
    std::vector<uint8_t> bytes = reader.take_bytes();
    if (bytes.size() != N) {
        throw ParseError(std::string(what) + " must be " + std::to_string(N) + " bytes, found " +
                         std::to_string(bytes.size()));
    }
    std::array<uint8_t, N> out;
    std::copy(bytes.begin(), bytes.end(), out.begin());
    return out;
}

template <size_t N>
bool all_zero(const std::array<uint8_t, N>& bytes) {
    return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
}

} // namespace

std::string VerifyingKey::to_string() const {
    BFieldWriter writer;
    writer.put_u64(VERSION);
    put_array(writer, public_key);
    writer.put_digest(circuit_id);
    return bech32::encode(HRP, writer.to_bytes());
}

VerifyingKey VerifyingKey::from_string(const std::string& text) {
    BFieldReader reader(bech32::decode_expecting(HRP, text));
    expect_version(reader, VERSION, "verifying key");
    VerifyingKey key;
    key.public_key = take_array<PUBLIC_KEY_SIZE>(reader, "verifying key public key");
    key.circuit_id = reader.take_digest();
    reader.expect_end();
    if (all_zero(key.public_key)) {
        throw ParseError("verifying key has a zero public key");
    }
    return key;
}

VerifyingKey VerifyingKey::from_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filepath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_string(trim(buffer.str()));
}

std::string ProvingKey::to_string() const {
    BFieldWriter writer;
    writer.put_u64(VERSION);
    put_array(writer, seed);
    put_array(writer, public_key);
    writer.put_digest(circuit_id);
    return bech32::encode(HRP, writer.to_bytes());
}

ProvingKey ProvingKey::from_string(const std::string& text) {
    BFieldReader reader(bech32::decode_expecting(HRP, text));
    expect_version(reader, VERSION, "proving key");
    ProvingKey key;
    key.seed = take_array<SEED_SIZE>(reader, "proving key seed");
    key.public_key = take_array<VerifyingKey::PUBLIC_KEY_SIZE>(reader, "proving key public key");
    key.circuit_id = reader.take_digest();
    reader.expect_end();
    if (all_zero(key.seed) || all_zero(key.public_key)) {
        throw ParseError("proving key is unset");
    }
    return key;
}

std::string Proof::to_string() const {
    BFieldWriter writer;
    writer.put_u64(VERSION);
    writer.put_u64(signatures.size());
    for (const auto& signature : signatures) {
        put_array(writer, signature);
    }
    return bech32::encode(HRP, writer.to_bytes());
}

Proof Proof::from_string(const std::string& text) {
    BFieldReader reader(bech32::decode_expecting(HRP, text));
    expect_version(reader, VERSION, "proof");
    Proof proof;
    // 1 length element plus 10 chunk elements per signature
    size_t count = reader.take_len(1 + (SIGNATURE_SIZE + 6) / 7);
    proof.signatures.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        proof.signatures.push_back(take_array<SIGNATURE_SIZE>(reader, "proof signature"));
    }
    reader.expect_end();
    return proof;
}

} // namespace zkverify
