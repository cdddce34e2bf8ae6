#include "bridge.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "../http/client/curl_transport.hpp"
#include "../http/provider/easypost.hpp"
#include "../http/provider/veeqo.hpp"
#include "../utils/logger.hpp"
#include "../utils/thread_pool.hpp"

using namespace std::chrono;

namespace bridge {

    //
    // BridgeBuilder implementation
    //

    BridgeBuilder::BridgeBuilder() : bridge_(std::make_unique<Bridge>()) {}

    BridgeBuilder& BridgeBuilder::with_config(const config::BridgeConfig& cfg) {
        config_ = cfg;
        return *this;
    }

    BridgeBuilder& BridgeBuilder::with_clock(std::shared_ptr<utils::Clock> clock) {
        clock_ = std::move(clock);
        return *this;
    }

    BridgeBuilder& BridgeBuilder::with_transport(std::shared_ptr<http::client::ITransport> transport) {
        transport_ = std::move(transport);
        return *this;
    }

    BridgeBuilder& BridgeBuilder::with_shipping_provider(std::shared_ptr<http::shipping_api::IShippingProvider> provider) {
        shipping_provider_ = std::move(provider);
        return *this;
    }

    BridgeBuilder& BridgeBuilder::with_inventory_provider(std::shared_ptr<http::inventory_api::IInventoryProvider> provider) {
        inventory_provider_ = std::move(provider);
        return *this;
    }

    BridgeBuilder& BridgeBuilder::with_io_threads(unsigned int io_threads) {
        io_threads_ = io_threads;
        return *this;
    }

    BridgeBuilder& BridgeBuilder::with_jitter(bool enabled) {
        jitter_ = enabled;
        return *this;
    }

    BridgeBuilder& BridgeBuilder::validate() {
        if (bridge_ == nullptr) {
            throw std::runtime_error("Bridge has already been built");
        }
        if (io_threads_ == 0) {
            throw std::runtime_error("IO threads are required");
        }
        config::validate_config(config_);
        return *this;
    }

    http::client::RetryPolicy BridgeBuilder::policy_for(const config::VendorConfig& vendor) const {
        return http::client::RetryPolicy{
            .max_tries_ = static_cast<size_t>(config_.max_attempts_),
            .base_delay_ = config_.base_delay_,
            .max_delay_ = config_.max_delay_,
            .timeout_ = vendor.timeout_,
            .jitter_ = jitter_,
        };
    }

    std::shared_ptr<http::client::ResilientClient> BridgeBuilder::client_for(const std::string& service, const config::VendorConfig& vendor,
                                                                             const std::shared_ptr<utils::Clock>& clock,
                                                                             const std::shared_ptr<http::client::ITransport>& transport,
                                                                             const std::shared_ptr<http::idempotency::IdempotencyKeyManager>& idempotency,
                                                                             const std::shared_ptr<http::http_error::ErrorCollector>& errors) const {
        auto breaker = std::make_shared<http::resilience::CircuitBreaker>(service,
                                                                          http::resilience::BreakerConfig{
                                                                              .failure_threshold_ = static_cast<size_t>(config_.breaker_threshold_),
                                                                              .reset_timeout_ = config_.breaker_reset_timeout_,
                                                                          },
                                                                          clock);

        return std::make_shared<http::client::ResilientClient>(service,
                                                               http::client::ResilientClientDeps{
                                                                   .transport_ = transport,
                                                                   .breaker_ = std::move(breaker),
                                                                   .idempotency_ = idempotency,
                                                                   .clock_ = clock,
                                                                   .errors_ = errors,
                                                               },
                                                               policy_for(vendor));
    }

    std::unique_ptr<Bridge> BridgeBuilder::build() {
        if (bridge_ == nullptr) {
            throw std::runtime_error("Bridge has already been built");
        }

        auto clock = clock_ != nullptr ? clock_ : std::make_shared<utils::SystemClock>();
        auto transport = transport_ != nullptr ? transport_ : std::make_shared<http::client::CurlTransport>();
        auto idempotency = std::make_shared<http::idempotency::IdempotencyKeyManager>(clock, config_.idempotency_window_);
        auto errors = std::make_shared<http::http_error::ErrorCollector>(clock);

        auto shipping_provider = shipping_provider_;
        if (shipping_provider == nullptr) {
            shipping_provider = std::make_shared<http::provider::EasyPostProvider>(config_.easypost_.api_key_, config_.easypost_.base_url_);
        }
        auto inventory_provider = inventory_provider_;
        if (inventory_provider == nullptr) {
            inventory_provider = std::make_shared<http::provider::VeeqoProvider>(config_.veeqo_.api_key_, config_.veeqo_.base_url_);
        }

        auto shipping_client = client_for(shipping_provider->service_name(), config_.easypost_, clock, transport, idempotency, errors);
        auto inventory_client = client_for(inventory_provider->service_name(), config_.veeqo_, clock, transport, idempotency, errors);

        bridge_->set_config(config_);
        bridge_->set_io_threads(io_threads_);
        bridge_->set_clock(clock);
        bridge_->set_transport(transport);
        bridge_->set_idempotency(idempotency);
        bridge_->set_error_collector(errors);
        bridge_->set_shipping(std::make_unique<http::shipping_api::ShippingAPI>(std::move(shipping_provider), std::move(shipping_client)));
        bridge_->set_inventory(std::make_unique<http::inventory_api::InventoryAPI>(std::move(inventory_provider), std::move(inventory_client)));

        logger::info("bridge ready", {{"io_threads", std::to_string(io_threads_)},
                                      {"max_attempts", std::to_string(config_.max_attempts_)},
                                      {"breaker_threshold", std::to_string(config_.breaker_threshold_)}});
        return std::move(bridge_);
    }

    //
    // Bridge implementation
    //

    bool HealthReport::healthy() const {
        for (const auto& v : vendors_) {
            if (!v.healthy_) {
                return false;
            }
        }
        return true;
    }

    void Bridge::set_config(const config::BridgeConfig& cfg) { config_ = cfg; }

    void Bridge::set_clock(std::shared_ptr<utils::Clock> clock) { clock_ = std::move(clock); }

    void Bridge::set_transport(std::shared_ptr<http::client::ITransport> transport) { transport_ = std::move(transport); }

    void Bridge::set_idempotency(std::shared_ptr<http::idempotency::IdempotencyKeyManager> idempotency) { idempotency_ = std::move(idempotency); }

    void Bridge::set_error_collector(std::shared_ptr<http::http_error::ErrorCollector> errors) { errors_ = std::move(errors); }

    void Bridge::set_shipping(std::unique_ptr<http::shipping_api::ShippingAPI> shipping) { shipping_ = std::move(shipping); }

    void Bridge::set_inventory(std::unique_ptr<http::inventory_api::InventoryAPI> inventory) { inventory_ = std::move(inventory); }

    void Bridge::set_io_threads(unsigned int io_threads) { io_threads_ = io_threads; }

    const config::BridgeConfig& Bridge::get_config() const { return config_; }

    http::shipping_api::ShippingAPI& Bridge::shipping() const { return *shipping_; }

    http::inventory_api::InventoryAPI& Bridge::inventory() const { return *inventory_; }

    const std::shared_ptr<http::http_error::ErrorCollector>& Bridge::errors() const { return errors_; }

    const std::shared_ptr<http::idempotency::IdempotencyKeyManager>& Bridge::idempotency() const { return idempotency_; }

    std::map<std::string, http::resilience::BreakerStatus> Bridge::breaker_statuses() const {
        std::map<std::string, http::resilience::BreakerStatus> out;
        for (const auto* client : {shipping_->client().get(), inventory_->client().get()}) {
            out[client->service()] = client->breaker()->status();
        }
        return out;
    }

    HealthReport Bridge::probe_health(const http::model::CallOptions& opts) const {
        HealthReport report;
        report.vendors_.resize(2);
        report.vendors_[0].service_ = shipping_->client()->service();
        report.vendors_[1].service_ = inventory_->client()->service();

        auto probe = [this, &opts](VendorHealth* out, auto&& ping) {
            const auto started = clock_->now();
            try {
                ping(opts);
                out->healthy_ = true;
            } catch (const http::http_error::HttpError& e) {
                out->error_kind_ = e.kind_;
                out->error_ = e.what();
            } catch (const std::exception& e) {
                out->error_ = e.what();
            }
            out->response_time_ = duration_cast<milliseconds>(clock_->now() - started);
        };

        {
            concurrency::ThreadPool pool(io_threads_);
            auto* shipping = shipping_.get();
            auto* inventory = inventory_.get();
            VendorHealth* shipping_slot = &report.vendors_[0];
            VendorHealth* inventory_slot = &report.vendors_[1];

            pool.enqueue([probe, shipping, shipping_slot]() { probe(shipping_slot, [shipping](const auto& o) { shipping->ping(o); }); });
            pool.enqueue([probe, inventory, inventory_slot]() { probe(inventory_slot, [inventory](const auto& o) { inventory->ping(o); }); });
            pool.wait_all();
        }

        const auto statuses = breaker_statuses();
        for (auto& v : report.vendors_) {
            auto it = statuses.find(v.service_);
            if (it != statuses.end()) {
                v.breaker_ = it->second;
            }
            logger::log(v.healthy_ ? logger::Level::INFO : logger::Level::WARN, "health probe",
                        {{"service", v.service_},
                         {"healthy", v.healthy_ ? "true" : "false"},
                         {"response_ms", std::to_string(v.response_time_.count())},
                         {"breaker", http::resilience::to_string(v.breaker_.state_)}});
        }
        report.errors_ = errors_->summary();
        return report;
    }

    size_t Bridge::sweep_idempotency_keys() const { return idempotency_->sweep(); }
}  // namespace bridge
