#ifndef PARCEL_BRIDGE_CURL_EASY_HPP
#define PARCEL_BRIDGE_CURL_EASY_HPP

#include <curl/curl.h>

#include <array>
#include <chrono>
#include <map>
#include <string>

#include "../model/model.hpp"

struct curl_slist;

namespace http::client {
    const size_t ERROR_BUFFER_SIZE = CURL_ERROR_SIZE;

    // One libcurl easy handle. Not thread-safe: one attempt at a time.
    class CurlEasy {
       public:
        CurlEasy();

        ~CurlEasy();
        CurlEasy(const CurlEasy&) = delete;
        CurlEasy& operator=(const CurlEasy&) = delete;
        CurlEasy(CurlEasy&&) = delete;
        CurlEasy& operator=(CurlEasy&&) = delete;

        http::model::AttemptResult perform(const http::model::Request& req, std::chrono::milliseconds timeout);

        static http::model::TransportErrorCode map_curl_code(CURLcode rc);

       private:
        template <typename T>
        void setopt(CURLoption option, T value);

        void set_url(const std::string& u);
        void set_headers(const std::map<std::string, std::string>& hs);
        void set_method(const http::model::Request& req);
        void apply_defaults();
        void prepare_for_new_request(std::string& body, std::chrono::milliseconds timeout);
        http::model::Response make_response(std::string& incoming_body);
        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);

        long last_rl_remaining_ = -1;
        long last_rl_reset_ = -1;

        std::string last_retry_after_;
        std::string last_content_type_;

        std::map<std::string, std::string> last_response_headers_;
        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        curl_slist* headers_{};

        CURL* handle_{};
    };
}  // namespace http::client

#endif
