#ifndef PARCEL_BRIDGE_MODEL_HPP
#define PARCEL_BRIDGE_MODEL_HPP

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace http::model {
    // One logical call, built by a provider right before dispatch.
    struct Request {
        std::string url_;
        std::string endpoint_;
        std::string method_ = "GET";
        std::optional<std::string> body_;
        std::optional<std::chrono::milliseconds> timeout_;

        std::map<std::string, std::string> headers_;

        bool mutating_ = false;
        bool deduplicate_ = false;
    };

    struct Response {
        long rate_limit_remaining_ = -1;
        long rate_limit_reset_ = -1;
        long status_ = 0;

        std::string body_;
        std::string effective_url_;

        std::string retry_after_;
        std::string content_type_;

        // Names are lower-cased.
        std::map<std::string, std::string> headers_;

        [[nodiscard]] bool ok() const { return status_ >= 200 && status_ < 300; }
    };

    enum class TransportErrorCode { TIMEOUT, DNS_FAILURE, CONNECTION_REFUSED, ABORTED, OTHER };

    struct TransportFailure {
        TransportErrorCode code_ = TransportErrorCode::OTHER;
        std::string message_;
    };

    // Outcome of a single physical attempt.
    struct AttemptResult {
        std::variant<Response, TransportFailure> outcome_;

        [[nodiscard]] bool has_response() const { return std::holds_alternative<Response>(outcome_); }
        [[nodiscard]] const Response& response() const { return std::get<Response>(outcome_); }
        [[nodiscard]] Response& response() { return std::get<Response>(outcome_); }
        [[nodiscard]] const TransportFailure& failure() const { return std::get<TransportFailure>(outcome_); }
    };

    struct CallOptions {
        // Bounds the whole retry loop, sleeps included. Unset means each attempt is only bounded by its own timeout.
        std::optional<std::chrono::milliseconds> deadline_;
    };
}  // namespace http::model

#endif
