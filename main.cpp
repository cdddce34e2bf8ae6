#include <iostream>

#include "src/bridge/bridge.hpp"
#include "src/bridge/config/config.hpp"
#include "src/http/client/curl_global.hpp"
#include "src/http/error/http_error.hpp"
#include "src/utils/logger.hpp"

int main() {
    try {
        //
        // Configure
        //

        const bridge::config::BridgeConfig cfg = bridge::config::load_config();
        logger::create_console_logger(logger::level_from_str(cfg.log_level_));

        http::client::CurlGlobal curl_global;

        auto parcel_bridge = bridge::BridgeBuilder().with_config(cfg).with_io_threads(2).validate().build();

        //
        // Probe
        //

        const bridge::HealthReport report = parcel_bridge->probe_health();

        for (const auto& vendor : report.vendors_) {
            std::cout << vendor.service_ << ": " << (vendor.healthy_ ? "healthy" : "unhealthy") << " (" << vendor.response_time_.count() << " ms, breaker "
                      << http::resilience::to_string(vendor.breaker_.state_) << ", failures " << vendor.breaker_.failures_ << "/" << vendor.breaker_.threshold_
                      << ")";
            if (!vendor.healthy_) {
                std::cout << " - " << vendor.error_;
            }
            std::cout << "\n";
        }

        std::cout << "errors: " << report.errors_.total_ << " total, " << report.errors_.recent_ << " recent\n";
        for (const auto& [kind, count] : report.errors_.by_kind_) {
            std::cout << "  " << http::http_error::to_string(kind) << ": " << count << "\n";
        }

        return report.healthy() ? 0 : 2;
    } catch (const http::http_error::HttpError& e) {
        std::cerr << "HTTP Error: " << e.what() << " (URL: " << e.url_ << ")\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }
}
