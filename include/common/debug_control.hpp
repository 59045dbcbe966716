#pragma once

#include <cstdlib>
#include <cstdio>
#include <cstring>
#include <iostream>

namespace zkverify {
namespace debug {

/**
 * Debug and Profile Control
 *
 * Environment variables:
 * - ZKVERIFY_PROFILE: Enable/disable profiling output (timing measurements)
 *   Set to "1" or "true" to enable, "0" or "false" (or unset) to disable
 *
 * - ZKVERIFY_DEBUG: Enable/disable debug output (rejection reasons, parsed artifacts)
 *   Set to "1" or "true" to enable, "0" or "false" (or unset) to disable
 */

inline bool env_flag_enabled(const char* name) {
    const char* env = std::getenv(name);
    return env && (strcmp(env, "1") == 0 || strcmp(env, "true") == 0);
}

// Check if profiling is enabled
inline bool is_profile_enabled() {
    static const bool cached = env_flag_enabled("ZKVERIFY_PROFILE");
    return cached;
}

// Check if debug printing is enabled
inline bool is_debug_enabled() {
    static const bool cached = env_flag_enabled("ZKVERIFY_DEBUG");
    return cached;
}

} // namespace debug
} // namespace zkverify

// Profile printing (timing measurements)
#define ZKVERIFY_PROFILE_COUT(expr) \
    do { \
        if (zkverify::debug::is_profile_enabled()) { \
            std::cout << expr; \
        } \
    } while(0)

// Debug printing to stderr
#define ZKVERIFY_DEBUG_COUT(expr) \
    do { \
        if (zkverify::debug::is_debug_enabled()) { \
            std::cerr << expr; \
        } \
    } while(0)

