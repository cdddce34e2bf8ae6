#ifndef PARCEL_BRIDGE_BRIDGE_HPP
#define PARCEL_BRIDGE_BRIDGE_HPP

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../http/api/inventory_api.hpp"
#include "../http/api/shipping_api.hpp"
#include "../http/client/interface.hpp"
#include "../http/client/resilient_client.hpp"
#include "../http/error/error_collector.hpp"
#include "../http/idempotency/idempotency_keys.hpp"
#include "../http/resilience/circuit_breaker.hpp"
#include "../utils/clock.hpp"
#include "config/config.hpp"

namespace bridge {
    struct VendorHealth {
        std::string service_;
        bool healthy_ = false;
        std::chrono::milliseconds response_time_{0};
        http::resilience::BreakerStatus breaker_;
        std::optional<http::http_error::ErrorKind> error_kind_;
        std::string error_;
    };

    struct HealthReport {
        std::vector<VendorHealth> vendors_;
        http::http_error::ErrorSummary errors_;

        [[nodiscard]] bool healthy() const;
    };

    // Process-lifetime context. Owns one breaker per vendor plus the shared idempotency manager, error
    // collector, clock and transport, and the facades wired on top of them.
    class Bridge {
       public:
        void set_config(const config::BridgeConfig& cfg);
        void set_clock(std::shared_ptr<utils::Clock> clock);
        void set_transport(std::shared_ptr<http::client::ITransport> transport);
        void set_idempotency(std::shared_ptr<http::idempotency::IdempotencyKeyManager> idempotency);
        void set_error_collector(std::shared_ptr<http::http_error::ErrorCollector> errors);
        void set_shipping(std::unique_ptr<http::shipping_api::ShippingAPI> shipping);
        void set_inventory(std::unique_ptr<http::inventory_api::InventoryAPI> inventory);
        void set_io_threads(unsigned int io_threads);

        [[nodiscard]] const config::BridgeConfig& get_config() const;
        [[nodiscard]] http::shipping_api::ShippingAPI& shipping() const;
        [[nodiscard]] http::inventory_api::InventoryAPI& inventory() const;
        [[nodiscard]] const std::shared_ptr<http::http_error::ErrorCollector>& errors() const;
        [[nodiscard]] const std::shared_ptr<http::idempotency::IdempotencyKeyManager>& idempotency() const;

        // Keyed by service name.
        [[nodiscard]] std::map<std::string, http::resilience::BreakerStatus> breaker_statuses() const;

        // Pings every vendor concurrently. Never throws for vendor failures; they are reported per vendor.
        [[nodiscard]] HealthReport probe_health(const http::model::CallOptions& opts = {}) const;

        size_t sweep_idempotency_keys() const;

       private:
        config::BridgeConfig config_;
        unsigned int io_threads_ = 2;
        std::shared_ptr<utils::Clock> clock_;
        std::shared_ptr<http::client::ITransport> transport_;
        std::shared_ptr<http::idempotency::IdempotencyKeyManager> idempotency_;
        std::shared_ptr<http::http_error::ErrorCollector> errors_;
        std::unique_ptr<http::shipping_api::ShippingAPI> shipping_;
        std::unique_ptr<http::inventory_api::InventoryAPI> inventory_;
    };

    class BridgeBuilder {
       public:
        BridgeBuilder();

        BridgeBuilder& with_config(const config::BridgeConfig& cfg);
        BridgeBuilder& with_clock(std::shared_ptr<utils::Clock> clock);
        BridgeBuilder& with_transport(std::shared_ptr<http::client::ITransport> transport);
        BridgeBuilder& with_shipping_provider(std::shared_ptr<http::shipping_api::IShippingProvider> provider);
        BridgeBuilder& with_inventory_provider(std::shared_ptr<http::inventory_api::IInventoryProvider> provider);
        BridgeBuilder& with_io_threads(unsigned int io_threads);
        BridgeBuilder& with_jitter(bool enabled);
        BridgeBuilder& validate();
        std::unique_ptr<Bridge> build();

       private:
        [[nodiscard]] http::client::RetryPolicy policy_for(const config::VendorConfig& vendor) const;
        [[nodiscard]] std::shared_ptr<http::client::ResilientClient> client_for(const std::string& service, const config::VendorConfig& vendor,
                                                                                const std::shared_ptr<utils::Clock>& clock,
                                                                                const std::shared_ptr<http::client::ITransport>& transport,
                                                                                const std::shared_ptr<http::idempotency::IdempotencyKeyManager>& idempotency,
                                                                                const std::shared_ptr<http::http_error::ErrorCollector>& errors) const;

        std::unique_ptr<Bridge> bridge_;
        config::BridgeConfig config_;
        std::shared_ptr<utils::Clock> clock_;
        std::shared_ptr<http::client::ITransport> transport_;
        std::shared_ptr<http::shipping_api::IShippingProvider> shipping_provider_;
        std::shared_ptr<http::inventory_api::IInventoryProvider> inventory_provider_;
        unsigned int io_threads_ = 2;
        bool jitter_ = true;
    };
}  // namespace bridge

#endif
