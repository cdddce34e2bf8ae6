#include "veeqo.hpp"

#include <nlohmann/json.hpp>
#include <simdjson.h>

#include <string>
#include <utility>

#include "../../utils/constants.hpp"
#include "../../utils/json_utils.hpp"
#include "decode.hpp"

using namespace simdjson;

namespace http::provider {
    namespace {
        // Veeqo list endpoints answer either a bare array or an object wrapping it under `key`.
        template <typename F>
        void for_each_listed(ondemand::document& doc, std::string_view key, F&& fn) {
            ondemand::json_type type = doc.type();
            ondemand::array list;
            if (type == ondemand::json_type::array) {
                list = doc.get_array();
            } else {
                ondemand::object root = doc.get_object();
                if (root.find_field_unordered(key).get_array().get(list) != SUCCESS) {
                    return;
                }
            }
            for (auto element : list) {
                ondemand::object obj = element.get_object();
                fn(obj);
            }
        }

        http::inventory_api::Order parse_order_object(ondemand::object& o) {
            http::inventory_api::Order order;
            order.id_ = decode::text_or(o, "id");
            order.number_ = decode::text_or(o, "number");
            order.status_ = decode::string_or(o, "status");
            order.total_price_ = decode::text_or(o, "total_price");
            order.created_at_ = decode::string_or(o, "created_at");

            ondemand::object customer;
            if (o.find_field_unordered("customer").get_object().get(customer) == SUCCESS) {
                order.customer_email_ = decode::string_or(customer, "email");
            }

            ondemand::array items;
            if (o.find_field_unordered("line_items").get_array().get(items) == SUCCESS) {
                for (auto element : items) {
                    ondemand::object item = element.get_object();
                    http::inventory_api::OrderLineItem line;
                    line.quantity_ = decode::long_field(item, "quantity").value_or(0);
                    line.price_ = decode::text_or(item, "price_per_unit");

                    ondemand::object sellable;
                    if (item.find_field_unordered("sellable").get_object().get(sellable) == SUCCESS) {
                        line.sellable_id_ = decode::text_or(sellable, "id");
                        line.sku_ = decode::string_or(sellable, "sku_code");
                    }
                    order.line_items_.push_back(std::move(line));
                }
            }
            return order;
        }
    }  // namespace

    VeeqoProvider::VeeqoProvider(std::string api_key, std::string base_url) : base_url_(std::move(base_url)), api_key_(std::move(api_key)) {
        while (!base_url_.empty() && base_url_.back() == '/') {
            base_url_.pop_back();
        }
    }

    http::model::Request VeeqoProvider::make(const std::string& method, const std::string& endpoint) const {
        http::model::Request r;
        r.url_ = base_url_ + endpoint;
        r.endpoint_ = endpoint.substr(0, endpoint.find('?'));
        r.method_ = method;
        r.headers_ = {
            {"x-api-key", api_key_},
            {"Accept", "application/json"},
            {"Content-Type", "application/json"},
            {"User-Agent", constants::USER_AGENT},
        };
        return r;
    }

    http::model::Request VeeqoProvider::build_ping() const { return make("GET", "/current_company"); }

    http::model::Request VeeqoProvider::build_get_inventory_levels(const std::string& product_id) const {
        return make("GET", "/products?include=inventory&product_ids=" + product_id);
    }

    std::vector<http::inventory_api::InventoryLevel> VeeqoProvider::parse_inventory_levels(const http::model::Response& resp) const {
        std::vector<http::inventory_api::InventoryLevel> out;

        try {
            ondemand::parser parser;
            padded_string json(resp.body_);
            ondemand::document doc = parser.iterate(json);

            for_each_listed(doc, "products", [&out](ondemand::object& product) {
                const std::string product_id = decode::text_or(product, "id");
                const std::string title = decode::string_or(product, "title");
                const std::string sku = decode::string_or(product, "sku");

                ondemand::array inventory;
                if (product.find_field_unordered("inventory").get_array().get(inventory) != SUCCESS) {
                    return;
                }
                for (auto element : inventory) {
                    ondemand::object entry = element.get_object();
                    http::inventory_api::InventoryLevel level;
                    level.product_id_ = product_id;
                    level.product_name_ = title;
                    level.sku_ = sku;
                    level.location_id_ = decode::text_or(entry, "location_id");
                    level.id_ = decode::text_or(entry, "id", product_id + "_" + level.location_id_);
                    level.variant_id_ = decode::text_or(entry, "variant_id", product_id);

                    const long quantity = decode::long_field(entry, "quantity").value_or(0);
                    level.total_quantity_ = quantity;
                    level.available_quantity_ = decode::long_field(entry, "available_quantity").value_or(quantity);
                    level.reserved_quantity_ = decode::long_field(entry, "reserved_quantity").value_or(0);
                    level.updated_at_ = decode::string_or(entry, "updated_at");
                    out.push_back(std::move(level));
                }
            });
        } catch (const simdjson::simdjson_error& e) {
            throw decode::decode_error(SERVICE_NAME, resp, e.what());
        }

        return out;
    }

    http::model::Request VeeqoProvider::build_update_inventory_level(const http::inventory_api::InventoryUpdate& u) const {
        http::model::Request r = make("PUT", "/sellables/" + u.variant_id_ + "/warehouses/" + u.location_id_ + "/stock_entry");
        r.body_ = json_utils::to_body({{"stock_entry", {{"physical_stock_level", u.quantity_}, {"infinite", false}}}});
        r.mutating_ = true;
        return r;
    }

    http::inventory_api::InventoryLevel VeeqoProvider::parse_inventory_level(const http::model::Response& resp,
                                                                             const http::inventory_api::InventoryUpdate& u) const {
        http::inventory_api::InventoryLevel level;
        level.product_id_ = u.product_id_;
        level.variant_id_ = u.variant_id_;
        level.location_id_ = u.location_id_;

        try {
            ondemand::parser parser;
            padded_string json(resp.body_);
            ondemand::document doc = parser.iterate(json);
            ondemand::object root = doc.get_object();

            level.id_ = decode::text_or(root, "id", u.variant_id_ + "_" + u.location_id_);
            level.total_quantity_ = decode::long_field(root, "physical_stock_level").value_or(u.quantity_);
            level.reserved_quantity_ = decode::long_field(root, "allocated_stock_level").value_or(0);
            level.available_quantity_ = decode::long_field(root, "available_stock_level").value_or(level.total_quantity_ - level.reserved_quantity_);
            level.updated_at_ = decode::string_or(root, "updated_at");
        } catch (const simdjson::simdjson_error& e) {
            throw decode::decode_error(SERVICE_NAME, resp, e.what());
        }

        return level;
    }

    http::model::Request VeeqoProvider::build_get_orders(const http::inventory_api::OrdersQuery& q) const {
        std::string endpoint = "/orders?limit=" + std::to_string(q.limit_) + "&page=" + std::to_string(q.page_);
        if (q.status_) {
            endpoint += "&status=" + *q.status_;
        }
        return make("GET", endpoint);
    }

    std::vector<http::inventory_api::Order> VeeqoProvider::parse_orders(const http::model::Response& resp) const {
        std::vector<http::inventory_api::Order> out;

        try {
            ondemand::parser parser;
            padded_string json(resp.body_);
            ondemand::document doc = parser.iterate(json);

            for_each_listed(doc, "orders", [&out](ondemand::object& o) { out.push_back(parse_order_object(o)); });
        } catch (const simdjson::simdjson_error& e) {
            throw decode::decode_error(SERVICE_NAME, resp, e.what());
        }

        return out;
    }

    http::model::Request VeeqoProvider::build_get_order(const std::string& order_id) const { return make("GET", "/orders/" + order_id); }

    http::inventory_api::Order VeeqoProvider::parse_order(const http::model::Response& resp) const {
        http::inventory_api::Order out;

        try {
            ondemand::parser parser;
            padded_string json(resp.body_);
            ondemand::document doc = parser.iterate(json);
            ondemand::object root = doc.get_object();
            out = parse_order_object(root);
        } catch (const simdjson::simdjson_error& e) {
            throw decode::decode_error(SERVICE_NAME, resp, e.what());
        }

        if (out.id_.empty()) {
            throw decode::decode_error(SERVICE_NAME, resp, "order id missing");
        }
        return out;
    }
}  // namespace http::provider
