#ifndef PARCEL_BRIDGE_STRING_UTILS_HPP
#define PARCEL_BRIDGE_STRING_UTILS_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace string_utils {
    size_t write_to_string(const char* ptr, size_t size, size_t nmemb, void* userdata);

    bool ieq_prefix(const char* buf, size_t n, const char* key);

    std::string trim(std::string s);

    std::string to_lower(std::string s);

    // Splits a raw "Name: value\r\n" header line. Returns nullopt for status lines and blank lines.
    std::optional<std::pair<std::string, std::string>> parse_header_line(std::string_view line);

    std::optional<long> parse_long(const std::string& s);

    std::string base64_encode(std::string_view in);

    std::string preview(const std::string& body, size_t max_length);
}  // namespace string_utils

#endif
