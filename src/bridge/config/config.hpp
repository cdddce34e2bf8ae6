#ifndef PARCEL_BRIDGE_CONFIG_HPP
#define PARCEL_BRIDGE_CONFIG_HPP

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "../../utils/constants.hpp"

namespace bridge::config {
    struct VendorConfig {
        std::string api_key_;
        std::string base_url_;
        std::chrono::milliseconds timeout_{constants::DEFAULT_TIMEOUT_MS};
    };

    struct BridgeConfig {
        VendorConfig easypost_;
        VendorConfig veeqo_;

        long max_attempts_ = constants::MAX_ATTEMPTS;
        std::chrono::milliseconds base_delay_{constants::BASE_DELAY_MS};
        std::chrono::milliseconds max_delay_{constants::MAX_DELAY_MS};

        long breaker_threshold_ = constants::BREAKER_FAILURE_THRESHOLD;
        std::chrono::milliseconds breaker_reset_timeout_{constants::BREAKER_RESET_TIMEOUT_MS};

        std::chrono::seconds idempotency_window_{constants::ONE_DAY_S};

        std::string log_level_ = "info";
    };

    // Returns the value of an environment variable, nullopt when unset.
    using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

    EnvLookup process_env();

    // Reads every setting, falling back to defaults for unset optional ones. Throws std::runtime_error listing
    // every malformed or missing value.
    BridgeConfig load_config(const EnvLookup& env = process_env());

    std::vector<std::string> config_problems(const BridgeConfig& cfg);

    void validate_config(const BridgeConfig& cfg);
}  // namespace bridge::config

#endif
