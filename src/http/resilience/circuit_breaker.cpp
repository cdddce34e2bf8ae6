#include "circuit_breaker.hpp"

#include <stdexcept>
#include <string>

#include "../../utils/logger.hpp"

namespace http::resilience {
    const char* to_string(BreakerState state) {
        switch (state) {
            case BreakerState::CLOSED:
                return "CLOSED";
            case BreakerState::OPEN:
                return "OPEN";
            case BreakerState::HALF_OPEN:
                return "HALF_OPEN";
        }
        return "CLOSED";
    }

    CircuitBreaker::CircuitBreaker(std::string service, BreakerConfig config, std::shared_ptr<utils::Clock> clock)
        : service_(std::move(service)), config_(config), clock_(std::move(clock)) {
        if (clock_ == nullptr) {
            throw std::invalid_argument("CircuitBreaker requires a clock");
        }
        if (config_.failure_threshold_ == 0) {
            throw std::invalid_argument("Circuit breaker threshold must be positive");
        }
    }

    void CircuitBreaker::admit() {
        std::unique_lock<std::mutex> lock(mutex_);

        if (state_ == BreakerState::CLOSED) {
            return;
        }

        const auto now = clock_->now();

        if (state_ == BreakerState::OPEN) {
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - opened_at_.value_or(now));
            if (elapsed >= config_.reset_timeout_) {
                transition(BreakerState::HALF_OPEN);
                probe_in_flight_ = true;
                return;
            }

            http_error::ErrorDetails details;
            details.service_ = service_;
            details.cooldown_remaining_ = config_.reset_timeout_ - elapsed;
            const auto failures = failures_;
            lock.unlock();

            logger::debug("circuit breaker rejected call",
                          {{"service", service_}, {"failures", std::to_string(failures)}, {"cooldown_ms", std::to_string(details.cooldown_remaining_->count())}});
            throw http_error::HttpError(http_error::ErrorKind::SERVICE_UNAVAILABLE, std::move(details), std::string{}, std::string{},
                                        "Circuit breaker is OPEN - " + service_ + " temporarily unavailable");
        }

        // HALF_OPEN: only the probe goes through.
        if (!probe_in_flight_) {
            probe_in_flight_ = true;
            return;
        }

        http_error::ErrorDetails details;
        details.service_ = service_;
        details.cooldown_remaining_ = std::chrono::milliseconds{0};
        throw http_error::HttpError(http_error::ErrorKind::SERVICE_UNAVAILABLE, std::move(details), std::string{}, std::string{},
                                    "Circuit breaker is HALF_OPEN - " + service_ + " probe in flight");
    }

    void CircuitBreaker::record_success() {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_ = 0;
        probe_in_flight_ = false;
        if (state_ != BreakerState::CLOSED) {
            transition(BreakerState::CLOSED);
        }
    }

    void CircuitBreaker::record_failure() {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_->now();
        ++failures_;
        last_failure_ = now;

        switch (state_) {
            case BreakerState::HALF_OPEN:
                probe_in_flight_ = false;
                opened_at_ = now;
                transition(BreakerState::OPEN);
                break;
            case BreakerState::CLOSED:
                if (failures_ >= config_.failure_threshold_) {
                    opened_at_ = now;
                    transition(BreakerState::OPEN);
                }
                break;
            case BreakerState::OPEN:
                // Late result of a call admitted before the trip; the cool-down keeps running.
                break;
        }
    }

    BreakerStatus CircuitBreaker::status() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return BreakerStatus{
            .state_ = state_,
            .failures_ = failures_,
            .threshold_ = config_.failure_threshold_,
            .last_failure_ = last_failure_,
            .opened_at_ = opened_at_,
        };
    }

    BreakerState CircuitBreaker::state() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return state_;
    }

    // Caller holds mutex_.
    void CircuitBreaker::transition(BreakerState next) {
        const BreakerState previous = state_;
        state_ = next;

        const logger::Fields fields{{"service", service_}, {"from", to_string(previous)}, {"to", to_string(next)}, {"failures", std::to_string(failures_)}};
        if (next == BreakerState::OPEN) {
            logger::warn("circuit breaker opened", fields);
        } else {
            logger::info("circuit breaker state change", fields);
        }
    }
}  // namespace http::resilience
