#include "inventory_api.hpp"

#include <stdexcept>
#include <string>

#include "../../utils/logger.hpp"
#include "../model/model.hpp"

namespace http::inventory_api {
    InventoryAPI::InventoryAPI(std::shared_ptr<IInventoryProvider> p, std::shared_ptr<http::client::ResilientClient> c)
        : provider_(std::move(p)), http_(std::move(c)) {
        if (provider_ == nullptr || http_ == nullptr) {
            throw std::invalid_argument("InventoryAPI requires a provider and a client");
        }
    }

    void InventoryAPI::ping(const http::model::CallOptions& opts) {
        const http::model::Request req = provider_->build_ping();
        http_->send(req, opts);
    }

    std::vector<InventoryLevel> InventoryAPI::get_inventory_levels(const std::string& product_id, const http::model::CallOptions& opts) {
        const http::model::Request req = provider_->build_get_inventory_levels(product_id);
        const http::model::Response resp = http_->send(req, opts);

        auto levels = provider_->parse_inventory_levels(resp);
        logger::debug("inventory levels retrieved", {{"product_id", product_id}, {"count", std::to_string(levels.size())}});
        return levels;
    }

    InventoryLevel InventoryAPI::update_inventory_level(const InventoryUpdate& update, const http::model::CallOptions& opts) {
        if (update.quantity_ < 0) {
            http::http_error::ErrorDetails details;
            details.service_ = provider_->service_name();
            throw http::http_error::HttpError(http::http_error::ErrorKind::INVALID_INPUT, std::move(details), std::string{}, std::string{},
                                              provider_->service_name() + " API: quantity must not be negative");
        }

        const http::model::Request req = provider_->build_update_inventory_level(update);
        const http::model::Response resp = http_->send(req, opts);

        InventoryLevel level = provider_->parse_inventory_level(resp, update);
        logger::info("inventory level updated", {{"variant_id", update.variant_id_}, {"location_id", update.location_id_}, {"quantity", std::to_string(update.quantity_)}});
        return level;
    }

    std::vector<Order> InventoryAPI::get_orders(const OrdersQuery& query, const http::model::CallOptions& opts) {
        const http::model::Request req = provider_->build_get_orders(query);
        const http::model::Response resp = http_->send(req, opts);
        return provider_->parse_orders(resp);
    }

    Order InventoryAPI::get_order(const std::string& order_id, const http::model::CallOptions& opts) {
        const http::model::Request req = provider_->build_get_order(order_id);
        const http::model::Response resp = http_->send(req, opts);
        return provider_->parse_order(resp);
    }
}  // namespace http::inventory_api
