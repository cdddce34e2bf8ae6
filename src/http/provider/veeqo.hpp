#ifndef PARCEL_BRIDGE_VEEQO_HPP
#define PARCEL_BRIDGE_VEEQO_HPP

#include <string>
#include <vector>

#include "../api/inventory_api.hpp"
#include "../model/model.hpp"

namespace http::provider {
    class VeeqoProvider : public http::inventory_api::IInventoryProvider {
       public:
        static constexpr const char* SERVICE_NAME = "Veeqo";
        static constexpr const char* DEFAULT_BASE_URL = "https://api.veeqo.com";

        explicit VeeqoProvider(std::string api_key, std::string base_url = DEFAULT_BASE_URL);

        [[nodiscard]] std::string service_name() const override { return SERVICE_NAME; }

        [[nodiscard]] http::model::Request build_ping() const override;

        [[nodiscard]] http::model::Request build_get_inventory_levels(const std::string& product_id) const override;
        [[nodiscard]] std::vector<http::inventory_api::InventoryLevel> parse_inventory_levels(const http::model::Response& resp) const override;

        [[nodiscard]] http::model::Request build_update_inventory_level(const http::inventory_api::InventoryUpdate& u) const override;
        [[nodiscard]] http::inventory_api::InventoryLevel parse_inventory_level(const http::model::Response& resp,
                                                                               const http::inventory_api::InventoryUpdate& u) const override;

        [[nodiscard]] http::model::Request build_get_orders(const http::inventory_api::OrdersQuery& q) const override;
        [[nodiscard]] std::vector<http::inventory_api::Order> parse_orders(const http::model::Response& resp) const override;

        [[nodiscard]] http::model::Request build_get_order(const std::string& order_id) const override;
        [[nodiscard]] http::inventory_api::Order parse_order(const http::model::Response& resp) const override;

        [[nodiscard]] const std::string& base_url() const { return base_url_; }

       private:
        [[nodiscard]] http::model::Request make(const std::string& method, const std::string& endpoint) const;

        std::string base_url_;
        std::string api_key_;
    };
}  // namespace http::provider

#endif
