#ifndef PARCEL_BRIDGE_CLOCK_HPP
#define PARCEL_BRIDGE_CLOCK_HPP

#include <chrono>

namespace utils {
    // Monotonic time source and the only place the retry loop sleeps.
    class Clock {
       public:
        using time_point = std::chrono::steady_clock::time_point;

        Clock() = default;
        virtual ~Clock() = default;
        Clock(const Clock&) = delete;
        Clock& operator=(const Clock&) = delete;
        Clock(Clock&&) = delete;
        Clock& operator=(Clock&&) = delete;

        [[nodiscard]] virtual time_point now() const = 0;
        virtual void sleep_for(std::chrono::milliseconds duration) = 0;
    };

    class SystemClock : public Clock {
       public:
        [[nodiscard]] time_point now() const override;
        void sleep_for(std::chrono::milliseconds duration) override;
    };
}  // namespace utils

#endif
