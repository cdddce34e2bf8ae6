#ifndef PARCEL_BRIDGE_TESTS_MANUAL_CLOCK_HPP
#define PARCEL_BRIDGE_TESTS_MANUAL_CLOCK_HPP

#include <chrono>
#include <mutex>
#include <vector>

#include "../../src/utils/clock.hpp"

namespace testing_support {
    // Time only moves when a test advances it or when code under test sleeps.
    class ManualClock : public utils::Clock {
       public:
        [[nodiscard]] time_point now() const override {
            std::lock_guard<std::mutex> lock(mutex_);
            return now_;
        }

        void sleep_for(std::chrono::milliseconds duration) override {
            std::lock_guard<std::mutex> lock(mutex_);
            sleeps_.push_back(duration);
            now_ += duration;
        }

        template <typename Duration>
        void advance(Duration d) {
            std::lock_guard<std::mutex> lock(mutex_);
            now_ += std::chrono::duration_cast<std::chrono::steady_clock::duration>(d);
        }

        [[nodiscard]] std::vector<std::chrono::milliseconds> sleeps() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return sleeps_;
        }

       private:
        mutable std::mutex mutex_;
        time_point now_ = time_point{} + std::chrono::hours{1000};
        std::vector<std::chrono::milliseconds> sleeps_;
    };
}  // namespace testing_support

#endif
