#include "curl_transport.hpp"

#include <stdexcept>

namespace http::client {
    CurlTransport::CurlTransport(size_t max_idle_handles) : max_idle_handles_(max_idle_handles) { idle_.reserve(max_idle_handles_); }

    std::unique_ptr<CurlEasy> CurlTransport::checkout() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!idle_.empty()) {
                auto handle = std::move(idle_.back());
                idle_.pop_back();
                return handle;
            }
        }
        return std::make_unique<CurlEasy>();
    }

    void CurlTransport::checkin(std::unique_ptr<CurlEasy> handle) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (idle_.size() < max_idle_handles_) {
            idle_.push_back(std::move(handle));
        }
    }

    http::model::AttemptResult CurlTransport::perform(const http::model::Request& req, std::chrono::milliseconds timeout) {
        std::unique_ptr<CurlEasy> handle;
        try {
            handle = checkout();
        } catch (const std::runtime_error& e) {
            return {http::model::TransportFailure{.code_ = http::model::TransportErrorCode::OTHER, .message_ = e.what()}};
        }

        auto result = handle->perform(req, timeout);
        checkin(std::move(handle));
        return result;
    }

    size_t CurlTransport::idle_handles() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return idle_.size();
    }
}  // namespace http::client
