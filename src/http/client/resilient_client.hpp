#ifndef PARCEL_BRIDGE_RESILIENT_CLIENT_HPP
#define PARCEL_BRIDGE_RESILIENT_CLIENT_HPP

#include <memory>
#include <string>

#include "../../utils/clock.hpp"
#include "../error/error_collector.hpp"
#include "../error/http_error.hpp"
#include "../idempotency/idempotency_keys.hpp"
#include "../model/model.hpp"
#include "../resilience/circuit_breaker.hpp"
#include "interface.hpp"
#include "retry_policy.hpp"

namespace http::client {
    struct ResilientClientDeps {
        std::shared_ptr<ITransport> transport_;
        std::shared_ptr<resilience::CircuitBreaker> breaker_;
        std::shared_ptr<idempotency::IdempotencyKeyManager> idempotency_;
        std::shared_ptr<utils::Clock> clock_;
        std::shared_ptr<http_error::ErrorCollector> errors_;
    };

    /*
     * Executes one Request to completion for a single vendor dependency.
     *
     * Each attempt goes through the dependency's circuit breaker and is bounded by the request timeout (or the
     * policy's). Transient kinds (see http_error::is_retryable) are retried up to max_tries_; 429 waits for the
     * vendor's Retry-After and leaves the exponential schedule untouched. Anything else is terminal.
     *
     * send() returns a 2xx Response or throws http_error::HttpError. Safe to call from many threads.
     */
    class ResilientClient {
       public:
        ResilientClient(std::string service, ResilientClientDeps deps, RetryPolicy policy = {});

        ~ResilientClient() = default;
        ResilientClient(const ResilientClient&) = delete;
        ResilientClient& operator=(const ResilientClient&) = delete;
        ResilientClient(ResilientClient&&) = delete;
        ResilientClient& operator=(ResilientClient&&) = delete;

        http::model::Response send(const http::model::Request& req, const http::model::CallOptions& options = {});

        [[nodiscard]] const std::string& service() const { return service_; }
        [[nodiscard]] const RetryPolicy& policy() const { return policy_; }
        [[nodiscard]] const std::shared_ptr<resilience::CircuitBreaker>& breaker() const { return deps_.breaker_; }

       private:
        [[nodiscard]] http::model::Request prepare(const http::model::Request& req) const;
        http::model::AttemptResult attempt_once(const http::model::Request& req, std::chrono::milliseconds timeout);
        [[noreturn]] void fail(http_error::HttpError& err, const http::model::Request& req);

        std::string service_;
        ResilientClientDeps deps_;
        RetryPolicy policy_;
    };
}  // namespace http::client

#endif
