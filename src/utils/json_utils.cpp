#include "json_utils.hpp"

#include <string>

namespace json_utils {
    std::string canonicalize(const std::string& body) {
        if (body.empty()) {
            return body;
        }

        const nlohmann::json doc = nlohmann::json::parse(body, nullptr, false);
        if (doc.is_discarded()) {
            return body;
        }
        return to_body(doc);
    }

    std::string to_body(const nlohmann::json& doc) { return doc.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace); }
}  // namespace json_utils
