#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace zkverify {

/**
 * ChaCha12Rng - ChaCha12 stream-cipher based random number generator
 *
 * Source of prover-side randomness: key seeds, view keys, transition
 * nonces and record serial numbers. The same seed reproduces the same artifacts.
 */
class ChaCha12Rng {
private:
    std::array<uint32_t, 16> state_;
    std::array<uint8_t, 64> buffer_;
    size_t index_;

    // ChaCha quarter round function
    static void quarter_round(uint32_t& a, uint32_t& b, uint32_t& c, uint32_t& d);

    // Generate next block of keystream
    void generate_block();

public:
    using Seed = std::array<uint8_t, 32>;

    // Initialize with 32-byte seed
    explicit ChaCha12Rng(const Seed& seed);

    // Generate random u64
    uint64_t next_u64();

    // Uniform value in [0, bound) by rejection sampling; bound must be non-zero
    uint64_t next_below(uint64_t bound);

    // Seed derived from a single integer (fixtures, CLI)
    static Seed seed_from_u64(uint64_t value);
};

} // namespace zkverify
