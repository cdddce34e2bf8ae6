#include "idempotency_keys.hpp"

#include <array>
#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <string>

#include "../../utils/logger.hpp"

namespace http::idempotency {
    namespace {
        std::mt19937_64 seeded_engine() {
            std::random_device rd;
            std::seed_seq seq{rd(), rd(), rd(), rd()};
            return std::mt19937_64(seq);
        }
    }  // namespace

    IdempotencyKeyManager::IdempotencyKeyManager(std::shared_ptr<utils::Clock> clock, std::chrono::seconds window)
        : clock_(std::move(clock)), window_(window), rng_(seeded_engine()) {
        if (clock_ == nullptr) {
            throw std::invalid_argument("IdempotencyKeyManager requires a clock");
        }
        if (window_.count() <= 0) {
            throw std::invalid_argument("Idempotency window must be positive");
        }
        last_sweep_ = clock_->now();
    }

    std::string IdempotencyKeyManager::make_cache_key(const std::string& endpoint, const std::string& canonical_body) {
        return endpoint + ":" + canonical_body;
    }

    bool IdempotencyKeyManager::expired(const IdempotencyRecord& record, utils::Clock::time_point now) const {
        return now - record.created_at_ >= window_;
    }

    std::string IdempotencyKeyManager::key_for(const std::string& endpoint, const std::string& canonical_body) {
        const std::string cache_key = make_cache_key(endpoint, canonical_body);

        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_->now();

        if (now - last_sweep_ >= window_) {
            const size_t removed = sweep_locked(now);
            if (removed > 0) {
                logger::debug("evicted expired idempotency keys", {{"removed", std::to_string(removed)}, {"remaining", std::to_string(records_.size())}});
            }
        }

        auto it = records_.find(cache_key);
        if (it != records_.end() && !expired(it->second, now)) {
            return it->second.token_;
        }

        IdempotencyRecord record{.token_ = generate_token(), .created_at_ = now};
        logger::debug("issued idempotency key", {{"endpoint", endpoint}, {"renewed", it != records_.end() ? "true" : "false"}});

        if (it != records_.end()) {
            it->second = record;
        } else {
            records_.emplace(cache_key, record);
        }
        return record.token_;
    }

    size_t IdempotencyKeyManager::sweep() {
        std::lock_guard<std::mutex> lock(mutex_);
        return sweep_locked(clock_->now());
    }

    // Caller holds mutex_.
    size_t IdempotencyKeyManager::sweep_locked(utils::Clock::time_point now) {
        last_sweep_ = now;

        size_t removed = 0;
        for (auto it = records_.begin(); it != records_.end();) {
            if (expired(it->second, now)) {
                it = records_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    size_t IdempotencyKeyManager::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

    // RFC 4122 version 4 layout. Caller holds mutex_.
    std::string IdempotencyKeyManager::generate_token() {
        const uint64_t hi = (rng_() & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
        const uint64_t lo = (rng_() & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

        std::array<char, 37> buf{};
        std::snprintf(buf.data(), buf.size(), "%08x-%04x-%04x-%04x-%012llx", static_cast<unsigned int>(hi >> 32U),
                      static_cast<unsigned int>((hi >> 16U) & 0xFFFFU), static_cast<unsigned int>(hi & 0xFFFFU),
                      static_cast<unsigned int>(lo >> 48U), static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
        return {buf.data()};
    }
}  // namespace http::idempotency
