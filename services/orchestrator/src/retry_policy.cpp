#include "../include/retry_policy.hpp"
#include <algorithm>

bool RetryPolicy::should_retry(ErrorClass cls, int attempts_made) const {
    return cls == ErrorClass::TransientInference && attempts_made <= max_retries;
}

std::chrono::milliseconds RetryPolicy::backoff(int attempts_made, std::mt19937_64& rng) const {
    using ms = std::chrono::milliseconds;
    long long cap = std::max<long long>(0, max_delay.count());
    long long delay = std::max<long long>(0, base_delay.count());
    for (int i = 1; i < attempts_made && delay < cap; ++i) delay *= 2;
    delay = std::min(delay, cap);
    if (jitter && delay > 1) {
        std::uniform_int_distribution<long long> dist(delay / 2, delay);
        delay = dist(rng);
    }
    return ms(delay);
}
