#include "http_error.hpp"

#include <simdjson.h>

#include <stdexcept>
#include <string>
#include <string_view>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"

namespace http::http_error {
    HttpError::HttpError(ErrorKind kind, ErrorDetails details, std::string u, std::string preview, const std::string &msg)
        : std::runtime_error(msg),
          kind_(kind),
          status_(details.status_.value_or(0)),
          url_(std::move(u)),
          body_preview_(std::move(preview)),
          details_(std::move(details)) {}

    const char *to_string(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::INVALID_INPUT:
                return "INVALID_INPUT";
            case ErrorKind::UNAUTHORIZED:
                return "UNAUTHORIZED";
            case ErrorKind::FORBIDDEN:
                return "FORBIDDEN";
            case ErrorKind::NOT_FOUND:
                return "NOT_FOUND";
            case ErrorKind::RATE_LIMITED:
                return "RATE_LIMITED";
            case ErrorKind::SERVICE_UNAVAILABLE:
                return "SERVICE_UNAVAILABLE";
            case ErrorKind::TIMEOUT:
                return "TIMEOUT";
            case ErrorKind::NETWORK_ERROR:
                return "NETWORK_ERROR";
            case ErrorKind::EXTERNAL_ERROR:
                return "EXTERNAL_ERROR";
            case ErrorKind::INTERNAL_ERROR:
                return "INTERNAL_ERROR";
        }
        return "EXTERNAL_ERROR";
    }

    ErrorKind classify_status(long status) {
        switch (status) {
            case 400:
                return ErrorKind::INVALID_INPUT;
            case 401:
                return ErrorKind::UNAUTHORIZED;
            case 403:
                return ErrorKind::FORBIDDEN;
            case 404:
                return ErrorKind::NOT_FOUND;
            case 429:
                return ErrorKind::RATE_LIMITED;
            case 500:
            case 502:
            case 503:
                return ErrorKind::SERVICE_UNAVAILABLE;
            case 504:
                return ErrorKind::TIMEOUT;
            default:
                return ErrorKind::EXTERNAL_ERROR;
        }
    }

    ErrorKind classify_transport(model::TransportErrorCode code) {
        switch (code) {
            case model::TransportErrorCode::TIMEOUT:
                return ErrorKind::TIMEOUT;
            case model::TransportErrorCode::DNS_FAILURE:
            case model::TransportErrorCode::CONNECTION_REFUSED:
                return ErrorKind::NETWORK_ERROR;
            case model::TransportErrorCode::ABORTED:
            case model::TransportErrorCode::OTHER:
                return ErrorKind::EXTERNAL_ERROR;
        }
        return ErrorKind::EXTERNAL_ERROR;
    }

    ErrorKind classify(const model::AttemptResult &result) {
        if (result.has_response()) {
            return classify_status(result.response().status_);
        }
        return classify_transport(result.failure().code_);
    }

    bool is_retryable(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::TIMEOUT:
            case ErrorKind::SERVICE_UNAVAILABLE:
            case ErrorKind::RATE_LIMITED:
            case ErrorKind::NETWORK_ERROR:
                return true;
            default:
                return false;
        }
    }

    std::chrono::seconds parse_retry_after(const std::string &value) {
        const auto parsed = string_utils::parse_long(value);
        if (!parsed || *parsed < 0) {
            return std::chrono::seconds{constants::DEFAULT_RETRY_AFTER_S};
        }
        return std::chrono::seconds{*parsed};
    }

    std::optional<std::chrono::milliseconds> suggested_delay(ErrorKind kind, const ErrorDetails &details) {
        if (kind == ErrorKind::RATE_LIMITED) {
            return details.retry_after_.value_or(std::chrono::seconds{constants::DEFAULT_RETRY_AFTER_S});
        }
        if (kind == ErrorKind::SERVICE_UNAVAILABLE) {
            return std::chrono::seconds{constants::SERVICE_UNAVAILABLE_DELAY_S};
        }
        return std::nullopt;
    }

    VendorErrorPayload parse_vendor_payload(const std::string &body) {
        VendorErrorPayload out;
        out.raw_ = body;

        if (string_utils::trim(body).empty()) {
            return out;
        }

        simdjson::dom::parser parser;
        simdjson::dom::element doc;
        if (parser.parse(body).get(doc) != simdjson::SUCCESS) {
            return out;
        }

        simdjson::dom::object root;
        if (doc.get_object().get(root) != simdjson::SUCCESS) {
            return out;
        }
        out.parsed_ = true;

        // EasyPost nests everything under "error", Veeqo keeps it at the top level.
        simdjson::dom::object source = root;
        simdjson::dom::element error_elem;
        if (root["error"].get(error_elem) == simdjson::SUCCESS) {
            simdjson::dom::object nested;
            std::string_view text;
            if (error_elem.get_object().get(nested) == simdjson::SUCCESS) {
                source = nested;
            } else if (error_elem.get_string().get(text) == simdjson::SUCCESS) {
                out.message_ = std::string(text);
            }
        }

        std::string_view text;
        if (out.message_.empty() && source["message"].get_string().get(text) == simdjson::SUCCESS) {
            out.message_ = std::string(text);
        }
        if (source["code"].get_string().get(text) == simdjson::SUCCESS) {
            out.code_ = std::string(text);
        }

        simdjson::dom::array errors;
        if (source["errors"].get_array().get(errors) == simdjson::SUCCESS) {
            for (simdjson::dom::element e : errors) {
                simdjson::dom::object entry;
                if (e.get_object().get(entry) == simdjson::SUCCESS) {
                    std::string_view field;
                    std::string_view message;
                    std::string line;
                    if (entry["field"].get_string().get(field) == simdjson::SUCCESS) {
                        line = std::string(field) + ": ";
                    }
                    if (entry["message"].get_string().get(message) == simdjson::SUCCESS) {
                        line += std::string(message);
                    }
                    if (!line.empty()) {
                        out.field_errors_.push_back(std::move(line));
                    }
                } else if (e.get_string().get(text) == simdjson::SUCCESS) {
                    out.field_errors_.emplace_back(text);
                }
            }
        }

        return out;
    }

    namespace {
        std::string message_for_status(const std::string &service, ErrorKind kind, const VendorErrorPayload &vendor) {
            switch (kind) {
                case ErrorKind::INVALID_INPUT:
                    return service + " API: " + (vendor.message_.empty() ? "Bad request" : vendor.message_);
                case ErrorKind::UNAUTHORIZED:
                    return service + " API: Unauthorized - check API key";
                case ErrorKind::FORBIDDEN:
                    return service + " API: Forbidden - insufficient permissions";
                case ErrorKind::NOT_FOUND:
                    return service + " API: Resource not found";
                case ErrorKind::RATE_LIMITED:
                    return service + " API: Rate limit exceeded";
                case ErrorKind::SERVICE_UNAVAILABLE:
                    return service + " API: Service temporarily unavailable";
                case ErrorKind::TIMEOUT:
                    return service + " API: Request timeout";
                default:
                    return service + " API error: " + (vendor.message_.empty() ? "Unknown error" : vendor.message_);
            }
        }

        std::string message_for_transport(const std::string &service, ErrorKind kind, const model::TransportFailure &failure) {
            switch (kind) {
                case ErrorKind::NETWORK_ERROR:
                    return "Network error connecting to " + service + ": " + failure.message_;
                case ErrorKind::TIMEOUT:
                    return "Request to " + service + " timed out";
                default:
                    return "Unexpected " + service + " error: " + failure.message_;
            }
        }
    }  // namespace

    HttpError to_http_error(const std::string &service, const std::string &url, const model::AttemptResult &result) {
        const ErrorKind kind = classify(result);

        ErrorDetails details;
        details.service_ = service;

        if (!result.has_response()) {
            const auto &failure = result.failure();
            details.transport_code_ = failure.code_;
            details.vendor_.raw_ = failure.message_;
            return {kind, std::move(details), url, std::string{}, message_for_transport(service, kind, failure)};
        }

        const auto &resp = result.response();
        details.status_ = resp.status_;
        details.vendor_ = parse_vendor_payload(resp.body_);
        if (kind == ErrorKind::RATE_LIMITED) {
            details.retry_after_ = parse_retry_after(resp.retry_after_);
        }

        std::string message = message_for_status(service, kind, details.vendor_);
        return {kind, std::move(details), url, string_utils::preview(resp.body_, ERROR_MESSAGE_LENGTH), message};
    }
}  // namespace http::http_error
