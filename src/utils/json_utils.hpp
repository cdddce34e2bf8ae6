#ifndef PARCEL_BRIDGE_JSON_UTILS_HPP
#define PARCEL_BRIDGE_JSON_UTILS_HPP

#include <nlohmann/json.hpp>

#include <string>

namespace json_utils {
    // Deterministic form of a JSON payload: object keys sorted, insignificant whitespace removed.
    // Input that is not valid JSON is returned unchanged.
    std::string canonicalize(const std::string& body);

    // Request bodies are serialized through here so they are already canonical on the wire.
    std::string to_body(const nlohmann::json& doc);
}  // namespace json_utils

#endif
