#pragma once

/**
 * Thread Coordination Utility
 *
 * Coordinates thread counts between OpenMP (Merkle tree construction) and
 * TBB (batch verification) so the two do not oversubscribe the machine.
 *
 * Thread allocation:
 * - If ZKVERIFY_THREADS is set, use that
 * - Else if OMP_NUM_THREADS is set, use that
 * - Otherwise, use the hardware thread count
 */

#include <cstdlib>
#include <thread>
#include <algorithm>

#ifdef _OPENMP
#include <omp.h>
#endif

#include <tbb/global_control.h>

namespace zkverify::parallel {

inline int thread_count_from_env(const char* name) {
    const char* value = std::getenv(name);
    if (value) {
        int count = std::atoi(value);
        if (count > 0) {
            return count;
        }
    }
    return 0;
}

/**
 * Get the thread count for parallel execution
 */
inline int get_optimal_thread_count() {
    if (int count = thread_count_from_env("ZKVERIFY_THREADS")) {
        return count;
    }
    if (int count = thread_count_from_env("OMP_NUM_THREADS")) {
        return count;
    }
    return std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
}

/**
 * Initialize thread coordination for both parallel libraries.
 * Call this once at program startup; the limit lasts for the process lifetime.
 */
inline void initialize_thread_coordination() {
    int thread_count = get_optimal_thread_count();

#ifdef _OPENMP
    omp_set_num_threads(thread_count);
#endif

    static tbb::global_control tbb_control(
        tbb::global_control::max_allowed_parallelism,
        static_cast<size_t>(thread_count)
    );
}

} // namespace zkverify::parallel
