#ifndef PARCEL_BRIDGE_IDEMPOTENCY_KEYS_HPP
#define PARCEL_BRIDGE_IDEMPOTENCY_KEYS_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>

#include "../../utils/clock.hpp"
#include "../../utils/constants.hpp"

namespace http::idempotency {
    struct IdempotencyRecord {
        std::string token_;
        utils::Clock::time_point created_at_;
    };

    // Process-wide cache of idempotency tokens keyed by (endpoint, canonical body).
    //
    // Within one window the same pair always maps to the same token, including for callers racing on the
    // same key: lookup, expiry check and insert all happen under a single lock.
    //
    // key_for evicts expired records itself once a full window has passed since the last eviction, so the
    // map never holds more than about two windows' worth of keys.
    class IdempotencyKeyManager {
       public:
        explicit IdempotencyKeyManager(std::shared_ptr<utils::Clock> clock, std::chrono::seconds window = std::chrono::seconds{constants::ONE_DAY_S});

        ~IdempotencyKeyManager() = default;
        IdempotencyKeyManager(const IdempotencyKeyManager&) = delete;
        IdempotencyKeyManager& operator=(const IdempotencyKeyManager&) = delete;
        IdempotencyKeyManager(IdempotencyKeyManager&&) = delete;
        IdempotencyKeyManager& operator=(IdempotencyKeyManager&&) = delete;

        std::string key_for(const std::string& endpoint, const std::string& canonical_body);

        // Drops every expired record and returns how many were removed.
        size_t sweep();

        [[nodiscard]] size_t size() const;
        [[nodiscard]] std::chrono::seconds window() const { return window_; }

        static std::string make_cache_key(const std::string& endpoint, const std::string& canonical_body);

       private:
        [[nodiscard]] bool expired(const IdempotencyRecord& record, utils::Clock::time_point now) const;
        size_t sweep_locked(utils::Clock::time_point now);
        std::string generate_token();

        std::shared_ptr<utils::Clock> clock_;
        std::chrono::seconds window_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, IdempotencyRecord> records_;
        utils::Clock::time_point last_sweep_;
        std::mt19937_64 rng_;
    };
}  // namespace http::idempotency

#endif
