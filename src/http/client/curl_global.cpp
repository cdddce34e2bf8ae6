#include "curl_global.hpp"

#include <curl/curl.h>

#include <mutex>
#include <stdexcept>
#include <string>

#include "../../utils/logger.hpp"

namespace http::client {
    namespace {
        std::mutex& init_mutex() {
            static std::mutex m;
            return m;
        }

        // Guards currently alive; libcurl is initialised by the first and cleaned up by the last.
        size_t live_guards = 0;
    }  // namespace

    CurlGlobal::CurlGlobal() {
        std::lock_guard<std::mutex> lock(init_mutex());
        if (live_guards == 0) {
            const auto rc = curl_global_init(CURL_GLOBAL_ALL);
            if (rc != CURLE_OK) {
                throw std::runtime_error(std::string("Failed to initialize libcurl: ") + curl_easy_strerror(rc));
            }
            logger::debug("libcurl initialized", {{"version", curl_version()}});
        }
        ++live_guards;
    }

    CurlGlobal::~CurlGlobal() {
        std::lock_guard<std::mutex> lock(init_mutex());
        if (--live_guards == 0) {
            curl_global_cleanup();
        }
    }

    size_t CurlGlobal::live() {
        std::lock_guard<std::mutex> lock(init_mutex());
        return live_guards;
    }
}  // namespace http::client
