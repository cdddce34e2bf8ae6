#ifndef PARCEL_BRIDGE_INVENTORY_API_HPP
#define PARCEL_BRIDGE_INVENTORY_API_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../client/resilient_client.hpp"
#include "../model/model.hpp"

namespace http::inventory_api {

    struct InventoryLevel {
        std::string id_;
        std::string product_id_;
        std::string variant_id_;
        std::string location_id_;
        long available_quantity_{};
        long reserved_quantity_{};
        long total_quantity_{};
        std::string sku_;
        std::string product_name_;
        std::string updated_at_;
    };

    // Sets the on-hand quantity of one variant at one location.
    struct InventoryUpdate {
        std::string product_id_;
        std::string variant_id_;
        std::string location_id_;
        long quantity_{};
    };

    struct OrdersQuery {
        int limit_ = 100;
        int page_ = 1;
        std::optional<std::string> status_;
    };

    struct OrderLineItem {
        std::string sellable_id_;
        std::string sku_;
        long quantity_{};
        std::string price_;
    };

    struct Order {
        std::string id_;
        std::string number_;
        std::string status_;
        std::string total_price_;
        std::string customer_email_;
        std::string created_at_;
        std::vector<OrderLineItem> line_items_;
    };

    class IInventoryProvider {
       public:
        IInventoryProvider() = default;
        virtual ~IInventoryProvider() = default;
        IInventoryProvider(const IInventoryProvider&) = delete;
        IInventoryProvider& operator=(const IInventoryProvider&) = delete;
        IInventoryProvider(IInventoryProvider&&) = delete;
        IInventoryProvider& operator=(IInventoryProvider&&) = delete;

        [[nodiscard]] virtual std::string service_name() const = 0;

        // Cheap authenticated read used by health probes.
        [[nodiscard]] virtual http::model::Request build_ping() const = 0;

        [[nodiscard]] virtual http::model::Request build_get_inventory_levels(const std::string& product_id) const = 0;
        [[nodiscard]] virtual std::vector<InventoryLevel> parse_inventory_levels(const http::model::Response& resp) const = 0;

        [[nodiscard]] virtual http::model::Request build_update_inventory_level(const InventoryUpdate& u) const = 0;
        [[nodiscard]] virtual InventoryLevel parse_inventory_level(const http::model::Response& resp, const InventoryUpdate& u) const = 0;

        [[nodiscard]] virtual http::model::Request build_get_orders(const OrdersQuery& q) const = 0;
        [[nodiscard]] virtual std::vector<Order> parse_orders(const http::model::Response& resp) const = 0;

        [[nodiscard]] virtual http::model::Request build_get_order(const std::string& order_id) const = 0;
        [[nodiscard]] virtual Order parse_order(const http::model::Response& resp) const = 0;
    };

    class InventoryAPI {
       public:
        explicit InventoryAPI(std::shared_ptr<IInventoryProvider> p, std::shared_ptr<http::client::ResilientClient> c);

        void ping(const http::model::CallOptions& opts = {});

        std::vector<InventoryLevel> get_inventory_levels(const std::string& product_id, const http::model::CallOptions& opts = {});
        InventoryLevel update_inventory_level(const InventoryUpdate& update, const http::model::CallOptions& opts = {});
        std::vector<Order> get_orders(const OrdersQuery& query = {}, const http::model::CallOptions& opts = {});
        Order get_order(const std::string& order_id, const http::model::CallOptions& opts = {});

        [[nodiscard]] const std::shared_ptr<http::client::ResilientClient>& client() const { return http_; }

       private:
        std::shared_ptr<IInventoryProvider> provider_;
        std::shared_ptr<http::client::ResilientClient> http_;
    };

}  // namespace http::inventory_api

#endif
