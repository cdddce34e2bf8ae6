#include "retry_policy.hpp"

#include <algorithm>
#include <cmath>
#include <random>

namespace http::client {
    std::chrono::milliseconds compute_backoff(const RetryPolicy& p, size_t retry, double jitter_factor) {
        const size_t exponent = retry == 0 ? 0 : retry - 1;
        const double raw = static_cast<double>(p.base_delay_.count()) * std::pow(2.0, static_cast<double>(exponent));
        const double capped = std::min(raw, static_cast<double>(p.max_delay_.count()));
        return std::chrono::milliseconds{static_cast<long long>(capped * jitter_factor)};
    }

    double jitter_factor(const RetryPolicy& p) {
        if (!p.jitter_) {
            return 1.0;
        }
        thread_local std::minstd_rand rng{std::random_device{}()};
        std::uniform_real_distribution<double> d(constants::JITTER_MIN, constants::JITTER_MAX);
        return d(rng);
    }
}  // namespace http::client
