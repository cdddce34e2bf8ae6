#ifndef PARCEL_BRIDGE_CURL_TRANSPORT_HPP
#define PARCEL_BRIDGE_CURL_TRANSPORT_HPP

#include <memory>
#include <mutex>
#include <vector>

#include "curl_easy.hpp"
#include "interface.hpp"

namespace http::client {
    // Thread-safe transport over a pool of easy handles; each in-flight attempt checks out its own handle.
    class CurlTransport : public ITransport {
       public:
        explicit CurlTransport(size_t max_idle_handles = 8);

        http::model::AttemptResult perform(const http::model::Request& req, std::chrono::milliseconds timeout) override;

        [[nodiscard]] size_t idle_handles() const;

       private:
        std::unique_ptr<CurlEasy> checkout();
        void checkin(std::unique_ptr<CurlEasy> handle);

        size_t max_idle_handles_;
        mutable std::mutex mutex_;
        std::vector<std::unique_ptr<CurlEasy>> idle_;
    };
}  // namespace http::client

#endif
