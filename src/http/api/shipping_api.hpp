#ifndef PARCEL_BRIDGE_SHIPPING_API_HPP
#define PARCEL_BRIDGE_SHIPPING_API_HPP

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../client/resilient_client.hpp"
#include "../model/model.hpp"

namespace http::shipping_api {

    struct Address {
        std::string name_;
        std::string company_;
        std::string street1_;
        std::string street2_;
        std::string city_;
        std::string state_;
        std::string zip_;
        std::string country_ = "US";
        std::string phone_;
        std::string email_;
    };

    // Dimensions in inches, weight in ounces.
    struct Parcel {
        double length_{};
        double width_{};
        double height_{};
        double weight_{};
    };

    struct CreateShipmentArgs {
        Address from_;
        Address to_;
        Parcel parcel_;
        std::optional<std::string> customs_info_id_;
        std::optional<std::string> reference_;
    };

    struct Rate {
        std::string id_;
        std::string carrier_;
        std::string service_;
        std::string rate_;
        std::string currency_;
        std::optional<long> delivery_days_;
    };

    struct Shipment {
        std::string id_;
        std::string status_;
        std::string tracking_code_;
        std::vector<Rate> rates_;
    };

    struct Label {
        std::string shipment_id_;
        std::string tracking_code_;
        std::string label_url_;
        std::string label_file_type_;
        Rate selected_rate_;
    };

    struct CustomsItem {
        std::string description_;
        long quantity_{};
        double value_{};
        double weight_{};
        std::string hs_tariff_number_;
        std::string origin_country_ = "US";
    };

    struct CustomsInfoArgs {
        std::string contents_type_ = "merchandise";
        std::string customs_signer_;
        std::string eel_pfc_;
        bool customs_certify_ = true;
        std::vector<CustomsItem> items_;
    };

    struct CustomsInfo {
        std::string id_;
        std::string contents_type_;
        std::vector<std::string> item_ids_;
    };

    struct Tracker {
        std::string id_;
        std::string tracking_code_;
        std::string carrier_;
        std::string status_;
        std::string public_url_;
    };

    struct RefundResult {
        std::string shipment_id_;
        std::string refund_status_;
    };

    class IShippingProvider {
       public:
        IShippingProvider() = default;
        virtual ~IShippingProvider() = default;
        IShippingProvider(const IShippingProvider&) = delete;
        IShippingProvider& operator=(const IShippingProvider&) = delete;
        IShippingProvider(IShippingProvider&&) = delete;
        IShippingProvider& operator=(IShippingProvider&&) = delete;

        [[nodiscard]] virtual std::string service_name() const = 0;

        // Cheap authenticated read used by health probes.
        [[nodiscard]] virtual http::model::Request build_ping() const = 0;

        [[nodiscard]] virtual http::model::Request build_create_shipment(const CreateShipmentArgs& a) const = 0;
        [[nodiscard]] virtual Shipment parse_shipment(const http::model::Response& resp) const = 0;

        [[nodiscard]] virtual http::model::Request build_buy_label(const std::string& shipment_id, const std::string& rate_id) const = 0;
        [[nodiscard]] virtual Label parse_label(const http::model::Response& resp) const = 0;

        [[nodiscard]] virtual http::model::Request build_create_customs_info(const CustomsInfoArgs& a) const = 0;
        [[nodiscard]] virtual CustomsInfo parse_customs_info(const http::model::Response& resp) const = 0;

        [[nodiscard]] virtual http::model::Request build_create_tracker(const std::string& tracking_code, const std::string& carrier) const = 0;
        [[nodiscard]] virtual Tracker parse_tracker(const http::model::Response& resp) const = 0;

        [[nodiscard]] virtual http::model::Request build_refund_shipment(const std::string& shipment_id) const = 0;
        [[nodiscard]] virtual RefundResult parse_refund(const http::model::Response& resp) const = 0;
    };

    class ShippingAPI {
       public:
        explicit ShippingAPI(std::shared_ptr<IShippingProvider> p, std::shared_ptr<http::client::ResilientClient> c);

        void ping(const http::model::CallOptions& opts = {});

        Shipment create_shipment(const CreateShipmentArgs& args, const http::model::CallOptions& opts = {});
        Label buy_label(const std::string& shipment_id, const std::string& rate_id, const http::model::CallOptions& opts = {});
        CustomsInfo create_customs_info(const CustomsInfoArgs& args, const http::model::CallOptions& opts = {});
        Tracker create_tracker(const std::string& tracking_code, const std::string& carrier, const http::model::CallOptions& opts = {});
        RefundResult refund_shipment(const std::string& shipment_id, const http::model::CallOptions& opts = {});

        [[nodiscard]] const std::shared_ptr<http::client::ResilientClient>& client() const { return http_; }

       private:
        std::shared_ptr<IShippingProvider> provider_;
        std::shared_ptr<http::client::ResilientClient> http_;
    };

}  // namespace http::shipping_api

#endif
