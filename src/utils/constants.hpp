#ifndef PARCEL_BRIDGE_CONSTANTS_HPP
#define PARCEL_BRIDGE_CONSTANTS_HPP

#include <cstddef>

namespace constants {
    inline constexpr int BASE_10 = 10;
    inline constexpr int ASCII_LOWERCASE_BIT = 0x20;
    inline constexpr long ONE_DAY_S = 60L * 60L * 24L;
    inline constexpr long DEFAULT_RETRY_AFTER_S = 60;
    inline constexpr long SERVICE_UNAVAILABLE_DELAY_S = 30;
    inline constexpr long DEFAULT_TIMEOUT_MS = 30'000;
    inline constexpr size_t MAX_ATTEMPTS = 3;
    inline constexpr long BASE_DELAY_MS = 1000;
    inline constexpr long MAX_DELAY_MS = 10'000;
    inline constexpr size_t BREAKER_FAILURE_THRESHOLD = 5;
    inline constexpr long BREAKER_RESET_TIMEOUT_MS = 30'000;
    inline constexpr size_t ERROR_HISTORY_SIZE = 100;
    inline constexpr size_t BODY_PREVIEW_LENGTH = 512;
    inline constexpr double JITTER_MIN = 0.5;
    inline constexpr double JITTER_MAX = 1.0;
    inline constexpr const char* IDEMPOTENCY_HEADER = "X-Idempotency-Key";
    inline constexpr const char* USER_AGENT = "parcel-bridge/1.0";

}  // namespace constants

#endif
