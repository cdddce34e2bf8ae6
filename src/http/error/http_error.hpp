#ifndef PARCEL_BRIDGE_HTTP_ERROR_HPP
#define PARCEL_BRIDGE_HTTP_ERROR_HPP

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../model/model.hpp"

namespace http::http_error {
    const long ERROR_MESSAGE_LENGTH = 512;

    enum class ErrorKind {
        INVALID_INPUT,
        UNAUTHORIZED,
        FORBIDDEN,
        NOT_FOUND,
        RATE_LIMITED,
        SERVICE_UNAVAILABLE,
        TIMEOUT,
        NETWORK_ERROR,
        EXTERNAL_ERROR,
        INTERNAL_ERROR,
    };

    // Best effort view of a vendor error body. raw_ is always kept.
    struct VendorErrorPayload {
        std::string raw_;
        bool parsed_ = false;
        std::string message_;
        std::string code_;
        std::vector<std::string> field_errors_;
    };

    struct ErrorDetails {
        std::string service_;
        std::optional<long> status_;
        std::optional<std::chrono::seconds> retry_after_;
        std::optional<std::chrono::milliseconds> cooldown_remaining_;
        std::optional<model::TransportErrorCode> transport_code_;
        VendorErrorPayload vendor_;
    };

    struct HttpError : public std::runtime_error {
        ErrorKind kind_;
        long status_;
        std::string url_;
        std::string body_preview_;
        ErrorDetails details_;
        size_t attempts_ = 0;

        HttpError(ErrorKind kind, ErrorDetails details, std::string u, std::string preview, const std::string& msg);

        [[nodiscard]] bool breaker_rejected() const { return details_.cooldown_remaining_.has_value(); }
    };

    const char* to_string(ErrorKind kind);

    ErrorKind classify_status(long status);
    ErrorKind classify_transport(model::TransportErrorCode code);
    ErrorKind classify(const model::AttemptResult& result);

    bool is_retryable(ErrorKind kind);

    // Integer seconds; missing or unparseable values fall back to DEFAULT_RETRY_AFTER_S.
    std::chrono::seconds parse_retry_after(const std::string& value);

    std::optional<std::chrono::milliseconds> suggested_delay(ErrorKind kind, const ErrorDetails& details);

    VendorErrorPayload parse_vendor_payload(const std::string& body);

    // Builds the classified error for a failed attempt. Never throws on malformed input.
    HttpError to_http_error(const std::string& service, const std::string& url, const model::AttemptResult& result);
}  // namespace http::http_error

#endif
