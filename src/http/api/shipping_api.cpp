#include "shipping_api.hpp"

#include <stdexcept>
#include <string>

#include "../../utils/logger.hpp"
#include "../model/model.hpp"

namespace http::shipping_api {
    ShippingAPI::ShippingAPI(std::shared_ptr<IShippingProvider> p, std::shared_ptr<http::client::ResilientClient> c)
        : provider_(std::move(p)), http_(std::move(c)) {
        if (provider_ == nullptr || http_ == nullptr) {
            throw std::invalid_argument("ShippingAPI requires a provider and a client");
        }
    }

    void ShippingAPI::ping(const http::model::CallOptions& opts) {
        const http::model::Request req = provider_->build_ping();
        http_->send(req, opts);
    }

    Shipment ShippingAPI::create_shipment(const CreateShipmentArgs& args, const http::model::CallOptions& opts) {
        const http::model::Request req = provider_->build_create_shipment(args);
        const http::model::Response resp = http_->send(req, opts);

        Shipment shipment = provider_->parse_shipment(resp);
        logger::info("shipment created", {{"shipment_id", shipment.id_}, {"rates", std::to_string(shipment.rates_.size())}});
        return shipment;
    }

    Label ShippingAPI::buy_label(const std::string& shipment_id, const std::string& rate_id, const http::model::CallOptions& opts) {
        const http::model::Request req = provider_->build_buy_label(shipment_id, rate_id);
        const http::model::Response resp = http_->send(req, opts);

        Label label = provider_->parse_label(resp);
        logger::info("label purchased", {{"shipment_id", shipment_id}, {"tracking_code", label.tracking_code_}});
        return label;
    }

    CustomsInfo ShippingAPI::create_customs_info(const CustomsInfoArgs& args, const http::model::CallOptions& opts) {
        const http::model::Request req = provider_->build_create_customs_info(args);
        const http::model::Response resp = http_->send(req, opts);
        return provider_->parse_customs_info(resp);
    }

    Tracker ShippingAPI::create_tracker(const std::string& tracking_code, const std::string& carrier, const http::model::CallOptions& opts) {
        const http::model::Request req = provider_->build_create_tracker(tracking_code, carrier);
        const http::model::Response resp = http_->send(req, opts);
        return provider_->parse_tracker(resp);
    }

    RefundResult ShippingAPI::refund_shipment(const std::string& shipment_id, const http::model::CallOptions& opts) {
        const http::model::Request req = provider_->build_refund_shipment(shipment_id);
        const http::model::Response resp = http_->send(req, opts);

        RefundResult refund = provider_->parse_refund(resp);
        logger::info("refund requested", {{"shipment_id", shipment_id}, {"refund_status", refund.refund_status_}});
        return refund;
    }
}  // namespace http::shipping_api
