#include "decode.hpp"

#include <cstdlib>
#include <string>

#include "../../utils/string_utils.hpp"

using namespace simdjson;

namespace http::provider::decode {
    namespace {
        bool find(ondemand::object& obj, std::string_view key, ondemand::value& out) {
            if (obj.find_field_unordered(key).get(out) != SUCCESS) {
                return false;
            }
            ondemand::json_type type;
            return out.type().get(type) == SUCCESS && type != ondemand::json_type::null;
        }
    }  // namespace

    std::string string_or(ondemand::object& obj, std::string_view key, std::string fallback) {
        ondemand::value v;
        std::string_view s;
        if (!find(obj, key, v) || v.get_string().get(s) != SUCCESS) {
            return fallback;
        }
        return std::string(s);
    }

    std::string text_or(ondemand::object& obj, std::string_view key, std::string fallback) {
        ondemand::value v;
        if (!find(obj, key, v)) {
            return fallback;
        }

        ondemand::json_type type;
        if (v.type().get(type) != SUCCESS) {
            return fallback;
        }

        if (type == ondemand::json_type::string) {
            std::string_view s;
            return v.get_string().get(s) == SUCCESS ? std::string(s) : fallback;
        }
        if (type == ondemand::json_type::number) {
            std::string_view token = v.raw_json_token();
            return string_utils::trim(std::string(token));
        }
        return fallback;
    }

    std::optional<long> long_field(ondemand::object& obj, std::string_view key) {
        ondemand::value v;
        if (!find(obj, key, v)) {
            return std::nullopt;
        }

        ondemand::json_type type;
        if (v.type().get(type) != SUCCESS) {
            return std::nullopt;
        }

        if (type == ondemand::json_type::number) {
            int64_t n = 0;
            if (v.get_int64().get(n) == SUCCESS) {
                return static_cast<long>(n);
            }
            double d = 0.0;
            if (v.get_double().get(d) == SUCCESS) {
                return static_cast<long>(d);
            }
            return std::nullopt;
        }
        if (type == ondemand::json_type::string) {
            std::string_view s;
            if (v.get_string().get(s) == SUCCESS) {
                return string_utils::parse_long(std::string(s));
            }
        }
        return std::nullopt;
    }

    double double_or(ondemand::object& obj, std::string_view key, double fallback) {
        ondemand::value v;
        if (!find(obj, key, v)) {
            return fallback;
        }

        ondemand::json_type type;
        if (v.type().get(type) != SUCCESS) {
            return fallback;
        }

        if (type == ondemand::json_type::number) {
            double d = 0.0;
            return v.get_double().get(d) == SUCCESS ? d : fallback;
        }
        if (type == ondemand::json_type::string) {
            std::string_view s;
            if (v.get_string().get(s) != SUCCESS) {
                return fallback;
            }
            const std::string text(s);
            char* end = nullptr;
            const double d = std::strtod(text.c_str(), &end);
            return (end != text.c_str() && *end == '\0') ? d : fallback;
        }
        return fallback;
    }

    bool bool_or(ondemand::object& obj, std::string_view key, bool fallback) {
        ondemand::value v;
        bool b = false;
        if (!find(obj, key, v) || v.get_bool().get(b) != SUCCESS) {
            return fallback;
        }
        return b;
    }

    http::http_error::HttpError decode_error(const std::string& service, const http::model::Response& resp, const std::string& what) {
        http::http_error::ErrorDetails details;
        details.service_ = service;
        details.status_ = resp.status_;
        details.vendor_.raw_ = resp.body_;
        return {http::http_error::ErrorKind::EXTERNAL_ERROR, std::move(details), resp.effective_url_,
                string_utils::preview(resp.body_, http::http_error::ERROR_MESSAGE_LENGTH), service + " API: failed to parse response: " + what};
    }
}  // namespace http::provider::decode
