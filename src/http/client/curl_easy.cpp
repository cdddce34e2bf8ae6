#include "curl_easy.hpp"

#include <curl/curl.h>

#include <stdexcept>
#include <string>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../model/model.hpp"

using namespace std::chrono;

namespace http::client {

    struct CurlDefaults {
        static constexpr long FOLLOW_LOCATION = 1L;
        static constexpr long MAX_REDIRECTS = 10L;
        static constexpr long CONNECT_TIMEOUT_MS = 10'000L;
        static constexpr const char* ACCEPT_ENCODING = "";
        static constexpr long NO_PROGRESS = 1L;
        static constexpr long NO_SIGNAL = 1L;
        static constexpr long TCP_KEEPALIVE = 1L;
        static constexpr long TCP_KEEPIDLE = 120L;
        static constexpr long TCP_KEEPINTVL = 60L;
        static constexpr long HTTP_GET = 1L;
        static constexpr long POST = 1L;
    };

    struct HeaderKeys {
        static constexpr const char* CONTENT_TYPE = "content-type";
        static constexpr const char* RETRY_AFTER = "retry-after";
        static constexpr const char* X_RATELIMIT_REMAINING = "x-ratelimit-remaining";
        static constexpr const char* X_RATELIMIT_RESET = "x-ratelimit-reset";
    };

    template <typename T>
    void CurlEasy::setopt(CURLoption option, T value) {
        const auto rc = curl_easy_setopt(handle_, option, value);

        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
        }
    }

    CurlEasy::CurlEasy() : handle_(curl_easy_init()) {
        if (handle_ == nullptr) {
            throw std::runtime_error("Failed to create CURL easy handle");
        }

        error_buf_[0] = '\0';
    }

    CurlEasy::~CurlEasy() {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }

        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }
    }

    void CurlEasy::set_url(const std::string& u) { setopt(CURLOPT_URL, u.c_str()); }

    void CurlEasy::set_headers(const std::map<std::string, std::string>& hs) {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
        for (const auto& [name, value] : hs) {
            const std::string line = name + ": " + value;
            curl_slist* next = curl_slist_append(headers_, line.c_str());
            if (next == nullptr) {
                throw std::runtime_error("curl_slist_append failed");
            }
            headers_ = next;
        }
        if (headers_ != nullptr) {
            setopt(CURLOPT_HTTPHEADER, headers_);
        }
    }

    void CurlEasy::apply_defaults() {
        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        setopt(CURLOPT_FOLLOWLOCATION, CurlDefaults::FOLLOW_LOCATION);
        setopt(CURLOPT_MAXREDIRS, CurlDefaults::MAX_REDIRECTS);
        setopt(CURLOPT_CONNECTTIMEOUT_MS, CurlDefaults::CONNECT_TIMEOUT_MS);
        setopt(CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        setopt(CURLOPT_USERAGENT, constants::USER_AGENT);
        setopt(CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);  // safe in multithreaded apps
        setopt(CURLOPT_ACCEPT_ENCODING, CurlDefaults::ACCEPT_ENCODING);
        setopt(CURLOPT_TCP_KEEPALIVE, CurlDefaults::TCP_KEEPALIVE);
        setopt(CURLOPT_TCP_KEEPIDLE, CurlDefaults::TCP_KEEPIDLE);
        setopt(CURLOPT_TCP_KEEPINTVL, CurlDefaults::TCP_KEEPINTVL);
    }

    void CurlEasy::prepare_for_new_request(std::string& body, milliseconds timeout) {
        // reset keeps the connection cache, so keep-alive survives across attempts
        curl_easy_reset(handle_);
        apply_defaults();

        last_response_headers_.clear();
        last_retry_after_.clear();
        last_content_type_.clear();
        last_rl_remaining_ = -1;
        last_rl_reset_ = -1;
        error_buf_[0] = '\0';
        body.clear();

        setopt(CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        setopt(CURLOPT_WRITEFUNCTION, &::string_utils::write_to_string);
        setopt(CURLOPT_WRITEDATA, &body);
        setopt(CURLOPT_HEADERFUNCTION, &CurlEasy::header_cb);
        setopt(CURLOPT_HEADERDATA, this);
    }

    void CurlEasy::set_method(const http::model::Request& req) {
        const std::string method = req.method_.empty() ? std::string("GET") : req.method_;

        if (method == "GET") {
            setopt(CURLOPT_HTTPGET, CurlDefaults::HTTP_GET);
            return;
        }

        if (method == "POST") {
            setopt(CURLOPT_POST, CurlDefaults::POST);
        } else {
            setopt(CURLOPT_CUSTOMREQUEST, method.c_str());
        }

        // body_ outlives perform(): libcurl does not copy POSTFIELDS
        const char* data = req.body_ ? req.body_->c_str() : "";
        const auto size = static_cast<curl_off_t>(req.body_ ? req.body_->size() : 0);
        setopt(CURLOPT_POSTFIELDS, data);
        setopt(CURLOPT_POSTFIELDSIZE_LARGE, size);
    }

    size_t CurlEasy::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* self = static_cast<CurlEasy*>(userdata);
        const size_t bytes = size * n_items;
        const std::string_view line(buffer, bytes);

        // A new status line starts a new response (redirects, 100-continue).
        if (string_utils::ieq_prefix(buffer, bytes, "HTTP/")) {
            self->last_response_headers_.clear();
            return bytes;
        }

        auto header = string_utils::parse_header_line(line);
        if (!header) {
            return bytes;
        }

        auto& [name, value] = *header;
        if (name == HeaderKeys::RETRY_AFTER) {
            self->last_retry_after_ = value;
        } else if (name == HeaderKeys::CONTENT_TYPE) {
            self->last_content_type_ = value;
        } else if (name == HeaderKeys::X_RATELIMIT_REMAINING) {
            self->last_rl_remaining_ = string_utils::parse_long(value).value_or(-1);
        } else if (name == HeaderKeys::X_RATELIMIT_RESET) {
            self->last_rl_reset_ = string_utils::parse_long(value).value_or(-1);
        }
        self->last_response_headers_[name] = std::move(value);

        return bytes;
    }

    http::model::AttemptResult CurlEasy::perform(const http::model::Request& req, milliseconds timeout) {
        std::string body;

        try {
            prepare_for_new_request(body, timeout);
            set_url(req.url_);
            set_headers(req.headers_);
            set_method(req);
        } catch (const std::runtime_error& e) {
            return {http::model::TransportFailure{.code_ = http::model::TransportErrorCode::OTHER, .message_ = e.what()}};
        }

        const auto rc = curl_easy_perform(handle_);

        if (rc != CURLE_OK) {
            std::string err = error_buf_[0] != '\0' ? std::string(error_buf_.data()) : std::string(curl_easy_strerror(rc));
            return {http::model::TransportFailure{.code_ = map_curl_code(rc), .message_ = std::move(err)}};
        }

        return {make_response(body)};
    }

    http::model::TransportErrorCode CurlEasy::map_curl_code(CURLcode rc) {
        switch (rc) {
            case CURLE_OPERATION_TIMEDOUT:
                return http::model::TransportErrorCode::TIMEOUT;
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_RESOLVE_PROXY:
                return http::model::TransportErrorCode::DNS_FAILURE;
            case CURLE_COULDNT_CONNECT:
                return http::model::TransportErrorCode::CONNECTION_REFUSED;
            case CURLE_ABORTED_BY_CALLBACK:
                return http::model::TransportErrorCode::ABORTED;
            default:
                return http::model::TransportErrorCode::OTHER;
        }
    }

    http::model::Response CurlEasy::make_response(std::string& incoming_body) {
        long code = 0;
        char* eff = nullptr;
        curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);
        curl_easy_getinfo(handle_, CURLINFO_EFFECTIVE_URL, &eff);

        http::model::Response r;
        r.status_ = code;
        r.body_ = std::move(incoming_body);
        r.effective_url_ = eff != nullptr ? eff : std::string{};
        r.retry_after_ = std::move(last_retry_after_);
        r.rate_limit_remaining_ = last_rl_remaining_;
        r.rate_limit_reset_ = last_rl_reset_;
        r.content_type_ = std::move(last_content_type_);
        r.headers_ = std::move(last_response_headers_);
        return r;
    }

}  // namespace http::client
