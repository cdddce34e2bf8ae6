#ifndef PARCEL_BRIDGE_DECODE_HPP
#define PARCEL_BRIDGE_DECODE_HPP

#include <simdjson.h>

#include <optional>
#include <string>
#include <string_view>

#include "../error/http_error.hpp"
#include "../model/model.hpp"

// Lenient field readers over simdjson's on-demand API. A missing field, a null or a value of the wrong
// type yields the fallback; structural errors surface as simdjson_error from the caller's iteration.
namespace http::provider::decode {
    std::string string_or(simdjson::ondemand::object& obj, std::string_view key, std::string fallback = {});

    // Strings verbatim, numbers as their JSON token. Vendor ids arrive as either.
    std::string text_or(simdjson::ondemand::object& obj, std::string_view key, std::string fallback = {});

    std::optional<long> long_field(simdjson::ondemand::object& obj, std::string_view key);

    double double_or(simdjson::ondemand::object& obj, std::string_view key, double fallback = 0.0);

    bool bool_or(simdjson::ondemand::object& obj, std::string_view key, bool fallback = false);

    http::http_error::HttpError decode_error(const std::string& service, const http::model::Response& resp, const std::string& what);
}  // namespace http::provider::decode

#endif
