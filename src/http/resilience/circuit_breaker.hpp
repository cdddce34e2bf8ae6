#ifndef PARCEL_BRIDGE_CIRCUIT_BREAKER_HPP
#define PARCEL_BRIDGE_CIRCUIT_BREAKER_HPP

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>

#include "../../utils/clock.hpp"
#include "../../utils/constants.hpp"
#include "../error/http_error.hpp"

namespace http::resilience {
    enum class BreakerState { CLOSED, OPEN, HALF_OPEN };

    const char* to_string(BreakerState state);

    struct BreakerConfig {
        size_t failure_threshold_ = constants::BREAKER_FAILURE_THRESHOLD;
        std::chrono::milliseconds reset_timeout_{constants::BREAKER_RESET_TIMEOUT_MS};
    };

    struct BreakerStatus {
        BreakerState state_ = BreakerState::CLOSED;
        size_t failures_ = 0;
        size_t threshold_ = 0;
        std::optional<utils::Clock::time_point> last_failure_;
        std::optional<utils::Clock::time_point> opened_at_;
    };

    /*
     * One instance per downstream dependency, shared by every concurrent caller.
     *
     *   CLOSED    --failure (count < threshold)--> CLOSED
     *   CLOSED    --failure (count == threshold)--> OPEN
     *   OPEN      --call before reset timeout--> OPEN (rejected, no I/O)
     *   OPEN      --call after reset timeout--> HALF_OPEN (call runs as the probe)
     *   HALF_OPEN --probe success--> CLOSED
     *   HALF_OPEN --probe failure--> OPEN
     *
     * The breaker never retries.
     */
    class CircuitBreaker {
       public:
        CircuitBreaker(std::string service, BreakerConfig config, std::shared_ptr<utils::Clock> clock);

        ~CircuitBreaker() = default;
        CircuitBreaker(const CircuitBreaker&) = delete;
        CircuitBreaker& operator=(const CircuitBreaker&) = delete;
        CircuitBreaker(CircuitBreaker&&) = delete;
        CircuitBreaker& operator=(CircuitBreaker&&) = delete;

        // Throws http_error::HttpError (SERVICE_UNAVAILABLE, cool-down attached) when the call is not admitted.
        void admit();
        void record_success();
        void record_failure();

        // Runs op if admitted. Any exception escaping op counts as a failure and is rethrown.
        template <typename Operation>
        auto execute(Operation&& op) -> decltype(op()) {
            admit();
            try {
                if constexpr (std::is_void_v<decltype(op())>) {
                    op();
                    record_success();
                } else {
                    auto result = op();
                    record_success();
                    return result;
                }
            } catch (...) {
                record_failure();
                throw;
            }
        }

        [[nodiscard]] BreakerStatus status() const;
        [[nodiscard]] BreakerState state() const;
        [[nodiscard]] const std::string& service() const { return service_; }
        [[nodiscard]] const BreakerConfig& config() const { return config_; }

       private:
        void transition(BreakerState next);

        std::string service_;
        BreakerConfig config_;
        std::shared_ptr<utils::Clock> clock_;

        mutable std::mutex mutex_;
        BreakerState state_ = BreakerState::CLOSED;
        size_t failures_ = 0;
        bool probe_in_flight_ = false;
        std::optional<utils::Clock::time_point> last_failure_;
        std::optional<utils::Clock::time_point> opened_at_;
    };
}  // namespace http::resilience

#endif
