#include "error_collector.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace http::http_error {
    ErrorCollector::ErrorCollector(std::shared_ptr<utils::Clock> clock, size_t max_errors) : clock_(std::move(clock)), max_errors_(max_errors) {
        if (clock_ == nullptr) {
            throw std::invalid_argument("ErrorCollector requires a clock");
        }
        if (max_errors_ == 0) {
            throw std::invalid_argument("ErrorCollector capacity must be positive");
        }
    }

    void ErrorCollector::add(const HttpError& error) {
        CollectedError entry{
            .kind_ = error.kind_,
            .service_ = error.details_.service_,
            .message_ = error.what(),
            .status_ = error.status_,
            .attempts_ = error.attempts_,
            .at_ = clock_->now(),
        };

        std::lock_guard<std::mutex> lock(mutex_);
        errors_.push_back(std::move(entry));
        while (errors_.size() > max_errors_) {
            errors_.pop_front();
        }
    }

    std::vector<CollectedError> ErrorCollector::recent(std::chrono::minutes window) const {
        const auto cutoff = clock_->now() - window;

        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<CollectedError> out;
        std::copy_if(errors_.begin(), errors_.end(), std::back_inserter(out), [cutoff](const CollectedError& e) { return e.at_ > cutoff; });
        return out;
    }

    std::vector<CollectedError> ErrorCollector::by_kind(ErrorKind kind) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<CollectedError> out;
        std::copy_if(errors_.begin(), errors_.end(), std::back_inserter(out), [kind](const CollectedError& e) { return e.kind_ == kind; });
        return out;
    }

    ErrorSummary ErrorCollector::summary(std::chrono::minutes window) const {
        const auto cutoff = clock_->now() - window;

        std::lock_guard<std::mutex> lock(mutex_);
        ErrorSummary out;
        out.total_ = errors_.size();
        for (const auto& e : errors_) {
            ++out.by_kind_[e.kind_];
            if (e.at_ > cutoff) {
                ++out.recent_;
            }
        }
        return out;
    }

    size_t ErrorCollector::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return errors_.size();
    }

    void ErrorCollector::clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        errors_.clear();
    }
}  // namespace http::http_error
