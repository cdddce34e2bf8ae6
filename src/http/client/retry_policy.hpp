#ifndef PARCEL_BRIDGE_RETRY_POLICY_HPP
#define PARCEL_BRIDGE_RETRY_POLICY_HPP

#include <chrono>
#include <cstddef>

#include "../../utils/constants.hpp"

namespace http::client {
    struct RetryPolicy {
        size_t max_tries_ = constants::MAX_ATTEMPTS;
        std::chrono::milliseconds base_delay_{constants::BASE_DELAY_MS};
        std::chrono::milliseconds max_delay_{constants::MAX_DELAY_MS};
        std::chrono::milliseconds timeout_{constants::DEFAULT_TIMEOUT_MS};
        bool jitter_ = true;
    };

    // min(base * 2^(retry - 1), max) scaled by jitter_factor. retry is 1-based and counts backoff retries only.
    std::chrono::milliseconds compute_backoff(const RetryPolicy& p, size_t retry, double jitter_factor = 1.0);

    // Uniform in [JITTER_MIN, JITTER_MAX], or 1.0 when the policy disables jitter.
    double jitter_factor(const RetryPolicy& p);
}  // namespace http::client

#endif
