#pragma once
#include "errors.hpp"
#include <chrono>
#include <random>

struct RetryPolicy {
    int max_retries{2};                          // attempts = max_retries + 1
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{30000};
    bool jitter{true};

    // attempts_made counts the attempt that just failed (1-based).
    bool should_retry(ErrorClass cls, int attempts_made) const;

    // base_delay * 2^(attempts_made-1), capped at max_delay. With jitter the
    // delay is drawn uniformly from [delay/2, delay].
    std::chrono::milliseconds backoff(int attempts_made, std::mt19937_64& rng) const;
};
