#ifndef PARCEL_BRIDGE_EASYPOST_HPP
#define PARCEL_BRIDGE_EASYPOST_HPP

#include <nlohmann/json_fwd.hpp>

#include <string>

#include "../api/shipping_api.hpp"
#include "../model/model.hpp"

namespace http::provider {
    class EasyPostProvider : public http::shipping_api::IShippingProvider {
       public:
        static constexpr const char* SERVICE_NAME = "EasyPost";
        static constexpr const char* DEFAULT_BASE_URL = "https://api.easypost.com/v2";

        explicit EasyPostProvider(std::string api_key, std::string base_url = DEFAULT_BASE_URL);

        [[nodiscard]] std::string service_name() const override { return SERVICE_NAME; }

        [[nodiscard]] http::model::Request build_ping() const override;

        [[nodiscard]] http::model::Request build_create_shipment(const http::shipping_api::CreateShipmentArgs& a) const override;
        [[nodiscard]] http::shipping_api::Shipment parse_shipment(const http::model::Response& resp) const override;

        [[nodiscard]] http::model::Request build_buy_label(const std::string& shipment_id, const std::string& rate_id) const override;
        [[nodiscard]] http::shipping_api::Label parse_label(const http::model::Response& resp) const override;

        [[nodiscard]] http::model::Request build_create_customs_info(const http::shipping_api::CustomsInfoArgs& a) const override;
        [[nodiscard]] http::shipping_api::CustomsInfo parse_customs_info(const http::model::Response& resp) const override;

        [[nodiscard]] http::model::Request build_create_tracker(const std::string& tracking_code, const std::string& carrier) const override;
        [[nodiscard]] http::shipping_api::Tracker parse_tracker(const http::model::Response& resp) const override;

        [[nodiscard]] http::model::Request build_refund_shipment(const std::string& shipment_id) const override;
        [[nodiscard]] http::shipping_api::RefundResult parse_refund(const http::model::Response& resp) const override;

        [[nodiscard]] const std::string& base_url() const { return base_url_; }

       private:
        [[nodiscard]] http::model::Request make(const std::string& method, const std::string& endpoint) const;
        [[nodiscard]] http::model::Request post(const std::string& endpoint, const nlohmann::json& body) const;

        std::string base_url_;
        std::string api_key_;
    };
}  // namespace http::provider

#endif
