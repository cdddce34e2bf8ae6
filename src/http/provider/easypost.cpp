#include "easypost.hpp"

#include <nlohmann/json.hpp>
#include <simdjson.h>

#include <cmath>
#include <string>
#include <utility>

#include "../../utils/constants.hpp"
#include "../../utils/json_utils.hpp"
#include "../../utils/string_utils.hpp"
#include "decode.hpp"

using namespace simdjson;

namespace http::provider {
    namespace {
        using nlohmann::json;

        void put_if_set(json& obj, const char* key, const std::string& value) {
            if (!value.empty()) {
                obj[key] = value;
            }
        }

        json address_json(const http::shipping_api::Address& a) {
            json out = json::object();
            put_if_set(out, "name", a.name_);
            put_if_set(out, "company", a.company_);
            put_if_set(out, "street1", a.street1_);
            put_if_set(out, "street2", a.street2_);
            put_if_set(out, "city", a.city_);
            put_if_set(out, "state", a.state_);
            put_if_set(out, "zip", a.zip_);
            put_if_set(out, "country", a.country_);
            put_if_set(out, "phone", a.phone_);
            put_if_set(out, "email", a.email_);
            return out;
        }

        [[noreturn]] void reject(const std::string& what) {
            http::http_error::ErrorDetails details;
            details.service_ = EasyPostProvider::SERVICE_NAME;
            throw http::http_error::HttpError(http::http_error::ErrorKind::INVALID_INPUT, std::move(details), std::string{}, std::string{},
                                              std::string(EasyPostProvider::SERVICE_NAME) + " API: " + what);
        }

        // Non-finite measurements would serialize as null and be rejected by the vendor.
        double measure(double v, const char* field) {
            if (!std::isfinite(v)) {
                reject(std::string(field) + " must be a finite number");
            }
            return v;
        }

        json parcel_json(const http::shipping_api::Parcel& p) {
            return {
                {"length", measure(p.length_, "parcel length")},
                {"width", measure(p.width_, "parcel width")},
                {"height", measure(p.height_, "parcel height")},
                {"weight", measure(p.weight_, "parcel weight")},
            };
        }

        http::shipping_api::Rate parse_rate(ondemand::object& r) {
            http::shipping_api::Rate rate;
            rate.id_ = decode::string_or(r, "id");
            rate.carrier_ = decode::string_or(r, "carrier");
            rate.service_ = decode::string_or(r, "service");
            rate.rate_ = decode::text_or(r, "rate");
            rate.currency_ = decode::string_or(r, "currency", "USD");
            rate.delivery_days_ = decode::long_field(r, "delivery_days");
            return rate;
        }
    }  // namespace

    EasyPostProvider::EasyPostProvider(std::string api_key, std::string base_url) : base_url_(std::move(base_url)), api_key_(std::move(api_key)) {
        while (!base_url_.empty() && base_url_.back() == '/') {
            base_url_.pop_back();
        }
    }

    http::model::Request EasyPostProvider::make(const std::string& method, const std::string& endpoint) const {
        http::model::Request r;
        r.url_ = base_url_ + endpoint;
        r.endpoint_ = endpoint.substr(0, endpoint.find('?'));
        r.method_ = method;
        r.headers_ = {
            {"Authorization", "Basic " + string_utils::base64_encode(api_key_ + ":")},
            {"Content-Type", "application/json"},
            {"Accept", "application/json"},
            {"User-Agent", constants::USER_AGENT},
        };
        return r;
    }

    http::model::Request EasyPostProvider::post(const std::string& endpoint, const nlohmann::json& body) const {
        http::model::Request r = make("POST", endpoint);
        r.body_ = json_utils::to_body(body);
        r.mutating_ = true;
        return r;
    }

    http::model::Request EasyPostProvider::build_ping() const { return make("GET", "/trackers?page_size=1"); }

    http::model::Request EasyPostProvider::build_create_shipment(const http::shipping_api::CreateShipmentArgs& a) const {
        json shipment = {
            {"from_address", address_json(a.from_)},
            {"to_address", address_json(a.to_)},
            {"parcel", parcel_json(a.parcel_)},
        };
        if (a.customs_info_id_) {
            shipment["customs_info"] = {{"id", *a.customs_info_id_}};
        }
        if (a.reference_) {
            shipment["reference"] = *a.reference_;
        }

        return post("/shipments", {{"shipment", shipment}});
    }

    http::shipping_api::Shipment EasyPostProvider::parse_shipment(const http::model::Response& resp) const {
        http::shipping_api::Shipment out{};

        try {
            ondemand::parser parser;
            padded_string json(resp.body_);
            ondemand::document doc = parser.iterate(json);
            ondemand::object root = doc.get_object();

            out.id_ = decode::string_or(root, "id");
            out.status_ = decode::string_or(root, "status");
            out.tracking_code_ = decode::string_or(root, "tracking_code");

            ondemand::array rates;
            if (root.find_field_unordered("rates").get_array().get(rates) == SUCCESS) {
                for (auto element : rates) {
                    ondemand::object r = element.get_object();
                    out.rates_.push_back(parse_rate(r));
                }
            }
        } catch (const simdjson::simdjson_error& e) {
            throw decode::decode_error(SERVICE_NAME, resp, e.what());
        }

        if (out.id_.empty()) {
            throw decode::decode_error(SERVICE_NAME, resp, "shipment id missing");
        }
        return out;
    }

    http::model::Request EasyPostProvider::build_buy_label(const std::string& shipment_id, const std::string& rate_id) const {
        http::model::Request r = post("/shipments/" + shipment_id + "/buy", {{"rate", {{"id", rate_id}}}});
        r.deduplicate_ = true;
        return r;
    }

    http::shipping_api::Label EasyPostProvider::parse_label(const http::model::Response& resp) const {
        http::shipping_api::Label out{};

        try {
            ondemand::parser parser;
            padded_string json(resp.body_);
            ondemand::document doc = parser.iterate(json);
            ondemand::object root = doc.get_object();

            out.shipment_id_ = decode::string_or(root, "id");
            out.tracking_code_ = decode::string_or(root, "tracking_code");

            ondemand::object postage;
            if (root.find_field_unordered("postage_label").get_object().get(postage) == SUCCESS) {
                out.label_url_ = decode::string_or(postage, "label_url");
                out.label_file_type_ = decode::string_or(postage, "label_file_type");
            }

            ondemand::object selected;
            if (root.find_field_unordered("selected_rate").get_object().get(selected) == SUCCESS) {
                out.selected_rate_ = parse_rate(selected);
            }
        } catch (const simdjson::simdjson_error& e) {
            throw decode::decode_error(SERVICE_NAME, resp, e.what());
        }

        if (out.label_url_.empty()) {
            throw decode::decode_error(SERVICE_NAME, resp, "postage label missing");
        }
        return out;
    }

    http::model::Request EasyPostProvider::build_create_customs_info(const http::shipping_api::CustomsInfoArgs& a) const {
        json items = json::array();
        for (const auto& item : a.items_) {
            json entry = {
                {"description", item.description_},
                {"quantity", item.quantity_},
                {"value", measure(item.value_, "customs item value")},
                {"weight", measure(item.weight_, "customs item weight")},
                {"origin_country", item.origin_country_},
            };
            put_if_set(entry, "hs_tariff_number", item.hs_tariff_number_);
            items.push_back(std::move(entry));
        }

        json customs = {
            {"contents_type", a.contents_type_},
            {"customs_certify", a.customs_certify_},
            {"customs_items", std::move(items)},
        };
        put_if_set(customs, "customs_signer", a.customs_signer_);
        put_if_set(customs, "eel_pfc", a.eel_pfc_);

        http::model::Request r = post("/customs_infos", {{"customs_info", customs}});
        r.deduplicate_ = true;
        return r;
    }

    http::shipping_api::CustomsInfo EasyPostProvider::parse_customs_info(const http::model::Response& resp) const {
        http::shipping_api::CustomsInfo out{};

        try {
            ondemand::parser parser;
            padded_string json(resp.body_);
            ondemand::document doc = parser.iterate(json);
            ondemand::object root = doc.get_object();

            out.id_ = decode::string_or(root, "id");
            out.contents_type_ = decode::string_or(root, "contents_type");

            ondemand::array items;
            if (root.find_field_unordered("customs_items").get_array().get(items) == SUCCESS) {
                for (auto element : items) {
                    ondemand::object item = element.get_object();
                    out.item_ids_.push_back(decode::string_or(item, "id"));
                }
            }
        } catch (const simdjson::simdjson_error& e) {
            throw decode::decode_error(SERVICE_NAME, resp, e.what());
        }

        if (out.id_.empty()) {
            throw decode::decode_error(SERVICE_NAME, resp, "customs info id missing");
        }
        return out;
    }

    http::model::Request EasyPostProvider::build_create_tracker(const std::string& tracking_code, const std::string& carrier) const {
        json tracker = {{"tracking_code", tracking_code}};
        put_if_set(tracker, "carrier", carrier);

        http::model::Request r = post("/trackers", {{"tracker", tracker}});
        r.deduplicate_ = true;
        return r;
    }

    http::shipping_api::Tracker EasyPostProvider::parse_tracker(const http::model::Response& resp) const {
        http::shipping_api::Tracker out{};

        try {
            ondemand::parser parser;
            padded_string json(resp.body_);
            ondemand::document doc = parser.iterate(json);
            ondemand::object root = doc.get_object();

            out.id_ = decode::string_or(root, "id");
            out.tracking_code_ = decode::string_or(root, "tracking_code");
            out.carrier_ = decode::string_or(root, "carrier");
            out.status_ = decode::string_or(root, "status", "unknown");
            out.public_url_ = decode::string_or(root, "public_url");
        } catch (const simdjson::simdjson_error& e) {
            throw decode::decode_error(SERVICE_NAME, resp, e.what());
        }

        if (out.id_.empty()) {
            throw decode::decode_error(SERVICE_NAME, resp, "tracker id missing");
        }
        return out;
    }

    http::model::Request EasyPostProvider::build_refund_shipment(const std::string& shipment_id) const {
        return post("/shipments/" + shipment_id + "/refund", json::object());
    }

    http::shipping_api::RefundResult EasyPostProvider::parse_refund(const http::model::Response& resp) const {
        http::shipping_api::RefundResult out{};

        try {
            ondemand::parser parser;
            padded_string json(resp.body_);
            ondemand::document doc = parser.iterate(json);
            ondemand::object root = doc.get_object();

            out.shipment_id_ = decode::string_or(root, "id");
            out.refund_status_ = decode::string_or(root, "refund_status", "submitted");
        } catch (const simdjson::simdjson_error& e) {
            throw decode::decode_error(SERVICE_NAME, resp, e.what());
        }

        return out;
    }
}  // namespace http::provider
