#ifndef PARCEL_BRIDGE_ERROR_COLLECTOR_HPP
#define PARCEL_BRIDGE_ERROR_COLLECTOR_HPP

#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "../../utils/clock.hpp"
#include "../../utils/constants.hpp"
#include "http_error.hpp"

namespace http::http_error {
    struct CollectedError {
        ErrorKind kind_;
        std::string service_;
        std::string message_;
        long status_ = 0;
        size_t attempts_ = 0;
        utils::Clock::time_point at_;
    };

    struct ErrorSummary {
        size_t total_ = 0;
        size_t recent_ = 0;
        std::map<ErrorKind, size_t> by_kind_;
    };

    // Bounded history of terminal errors, oldest dropped first.
    class ErrorCollector {
       public:
        explicit ErrorCollector(std::shared_ptr<utils::Clock> clock, size_t max_errors = constants::ERROR_HISTORY_SIZE);

        void add(const HttpError& error);
        [[nodiscard]] std::vector<CollectedError> recent(std::chrono::minutes window = std::chrono::minutes{10}) const;
        [[nodiscard]] std::vector<CollectedError> by_kind(ErrorKind kind) const;
        [[nodiscard]] ErrorSummary summary(std::chrono::minutes window = std::chrono::minutes{10}) const;
        [[nodiscard]] size_t size() const;
        void clear();

       private:
        std::shared_ptr<utils::Clock> clock_;
        size_t max_errors_;
        mutable std::mutex mutex_;
        std::deque<CollectedError> errors_;
    };
}  // namespace http::http_error

#endif
