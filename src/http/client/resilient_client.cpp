#include "resilient_client.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>

#include "../../utils/constants.hpp"
#include "../../utils/json_utils.hpp"
#include "../../utils/logger.hpp"

using namespace std::chrono;

namespace http::client {
    namespace {
        std::string endpoint_of(const http::model::Request& req) { return req.endpoint_.empty() ? req.url_ : req.endpoint_; }

        logger::Fields error_fields(const std::string& service, const http::model::Request& req, const http_error::HttpError& err) {
            return {
                {"service", service},
                {"method", req.method_},
                {"endpoint", endpoint_of(req)},
                {"kind", http_error::to_string(err.kind_)},
                {"status", std::to_string(err.status_)},
                {"attempts", std::to_string(err.attempts_)},
            };
        }
    }  // namespace

    ResilientClient::ResilientClient(std::string service, ResilientClientDeps deps, RetryPolicy policy)
        : service_(std::move(service)), deps_(std::move(deps)), policy_(policy) {
        if (deps_.transport_ == nullptr) {
            throw std::invalid_argument("ResilientClient requires a transport");
        }
        if (deps_.breaker_ == nullptr) {
            throw std::invalid_argument("ResilientClient requires a circuit breaker");
        }
        if (deps_.clock_ == nullptr) {
            throw std::invalid_argument("ResilientClient requires a clock");
        }
        if (policy_.max_tries_ == 0) {
            throw std::invalid_argument("Retry policy needs at least one attempt");
        }
    }

    http::model::Request ResilientClient::prepare(const http::model::Request& req) const {
        http::model::Request prepared = req;

        if (req.mutating_ && req.deduplicate_) {
            const std::string canonical_body = json_utils::canonicalize(req.body_.value_or(std::string{}));
            prepared.headers_[constants::IDEMPOTENCY_HEADER] = deps_.idempotency_->key_for(endpoint_of(req), canonical_body);
        }

        return prepared;
    }

    http::model::AttemptResult ResilientClient::attempt_once(const http::model::Request& req, milliseconds timeout) {
        try {
            return deps_.transport_->perform(req, timeout);
        } catch (const std::exception& e) {
            return {http::model::TransportFailure{.code_ = http::model::TransportErrorCode::OTHER, .message_ = e.what()}};
        } catch (...) {
            // The breaker must still see this attempt finish, or a HALF_OPEN trial never ends.
            return {http::model::TransportFailure{.code_ = http::model::TransportErrorCode::OTHER, .message_ = "unknown exception from transport"}};
        }
    }

    void ResilientClient::fail(http_error::HttpError& err, const http::model::Request& req) {
        logger::error("request failed", error_fields(service_, req, err));
        if (deps_.errors_ != nullptr) {
            deps_.errors_->add(err);
        }
        throw err;
    }

    http::model::Response ResilientClient::send(const http::model::Request& req, const http::model::CallOptions& options) {
        if (req.mutating_ && req.deduplicate_ && deps_.idempotency_ == nullptr) {
            http_error::ErrorDetails details;
            details.service_ = service_;
            http_error::HttpError err(http_error::ErrorKind::INTERNAL_ERROR, std::move(details), req.url_, std::string{},
                                      service_ + ": idempotency manager is not configured");
            fail(err, req);
        }

        const http::model::Request prepared = prepare(req);
        const milliseconds attempt_timeout = req.timeout_.value_or(policy_.timeout_);

        std::optional<utils::Clock::time_point> deadline;
        if (options.deadline_) {
            deadline = deps_.clock_->now() + *options.deadline_;
        }

        size_t backoff_retries = 0;

        for (size_t attempt = 1;; ++attempt) {
            milliseconds timeout = attempt_timeout;
            if (deadline) {
                const auto remaining = duration_cast<milliseconds>(*deadline - deps_.clock_->now());
                if (remaining.count() <= 0) {
                    http_error::ErrorDetails details;
                    details.service_ = service_;
                    http_error::HttpError err(http_error::ErrorKind::TIMEOUT, std::move(details), prepared.url_, std::string{},
                                              "Request to " + service_ + " exceeded its deadline");
                    err.attempts_ = attempt - 1;
                    fail(err, prepared);
                }
                timeout = std::min(timeout, remaining);
            }

            try {
                deps_.breaker_->admit();
            } catch (http_error::HttpError& rejected) {
                rejected.url_ = prepared.url_;
                rejected.attempts_ = attempt - 1;
                fail(rejected, prepared);
            }

            http::model::AttemptResult result = attempt_once(prepared, timeout);

            if (result.has_response() && result.response().ok()) {
                deps_.breaker_->record_success();
                return std::move(result.response());
            }

            deps_.breaker_->record_failure();

            http_error::HttpError err = http_error::to_http_error(service_, prepared.url_, result);
            err.attempts_ = attempt;

            if (!http_error::is_retryable(err.kind_) || attempt >= policy_.max_tries_) {
                fail(err, prepared);
            }

            milliseconds delay{0};
            if (err.kind_ == http_error::ErrorKind::RATE_LIMITED) {
                // Vendor supplied waits are authoritative and do not advance the exponential schedule.
                delay = http_error::suggested_delay(err.kind_, err.details_).value_or(seconds{constants::DEFAULT_RETRY_AFTER_S});
            } else {
                ++backoff_retries;
                delay = compute_backoff(policy_, backoff_retries, jitter_factor(policy_));
            }

            if (deadline && deps_.clock_->now() + delay >= *deadline) {
                http_error::ErrorDetails details = err.details_;
                http_error::HttpError expired(http_error::ErrorKind::TIMEOUT, std::move(details), prepared.url_, err.body_preview_,
                                              "Request to " + service_ + " exceeded its deadline after " + std::to_string(attempt) +
                                                  " attempts: " + err.what());
                expired.attempts_ = attempt;
                fail(expired, prepared);
            }

            logger::warn("retrying request", {
                                                 {"service", service_},
                                                 {"method", prepared.method_},
                                                 {"endpoint", endpoint_of(prepared)},
                                                 {"attempt", std::to_string(attempt)},
                                                 {"delay_ms", std::to_string(delay.count())},
                                                 {"kind", http_error::to_string(err.kind_)},
                                                 {"status", std::to_string(err.status_)},
                                             });

            deps_.clock_->sleep_for(delay);
        }
    }
}  // namespace http::client
