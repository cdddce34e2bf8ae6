#include "clock.hpp"

#include <thread>

namespace utils {
    Clock::time_point SystemClock::now() const { return std::chrono::steady_clock::now(); }

    void SystemClock::sleep_for(std::chrono::milliseconds duration) {
        if (duration.count() > 0) {
            std::this_thread::sleep_for(duration);
        }
    }
}  // namespace utils
