#include "string_utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <string>

#include "constants.hpp"

namespace string_utils {
    size_t write_to_string(const char *ptr, size_t size, size_t nmemb, void *userdata) {
        auto *body = static_cast<std::string *>(userdata);
        const size_t total = size * nmemb;
        body->append(ptr, total);
        return total;
    }

    bool ieq_prefix(const char *buf, size_t n, const char *key) {
        for (size_t i = 0; key[i] != '\0' && i < n; ++i) {
            if (std::tolower(static_cast<unsigned char>(buf[i])) != std::tolower(static_cast<unsigned char>(key[i]))) {
                return false;
            }
            if (key[i + 1] == '\0') {
                return true;
            }
        }
        return false;
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::optional<std::pair<std::string, std::string>> parse_header_line(std::string_view line) {
        const auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return std::nullopt;
        }

        std::string name = trim(std::string(line.substr(0, colon)));
        if (name.empty() || name.find(' ') != std::string::npos) {
            return std::nullopt;
        }

        return std::make_pair(to_lower(std::move(name)), trim(std::string(line.substr(colon + 1))));
    }

    std::optional<long> parse_long(const std::string &s) {
        const std::string trimmed = trim(s);
        if (trimmed.empty()) {
            return std::nullopt;
        }
        char *end = nullptr;
        const long v = std::strtol(trimmed.c_str(), &end, constants::BASE_10);
        if (end == nullptr || *end != '\0') {
            return std::nullopt;
        }
        return v;
    }

    std::string base64_encode(std::string_view in) {
        static constexpr std::array<char, 64> ALPHABET = {'A', 'B', 'C', 'D', 'E', 'F', 'G', 'H', 'I', 'J', 'K', 'L', 'M', 'N', 'O', 'P',
                                                          'Q', 'R', 'S', 'T', 'U', 'V', 'W', 'X', 'Y', 'Z', 'a', 'b', 'c', 'd', 'e', 'f',
                                                          'g', 'h', 'i', 'j', 'k', 'l', 'm', 'n', 'o', 'p', 'q', 'r', 's', 't', 'u', 'v',
                                                          'w', 'x', 'y', 'z', '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', '+', '/'};

        std::string out;
        out.reserve(((in.size() + 2) / 3) * 4);

        size_t i = 0;
        for (; i + 2 < in.size(); i += 3) {
            const auto n = (static_cast<unsigned char>(in[i]) << 16U) | (static_cast<unsigned char>(in[i + 1]) << 8U) |
                           static_cast<unsigned char>(in[i + 2]);
            out.push_back(ALPHABET[(n >> 18U) & 0x3FU]);
            out.push_back(ALPHABET[(n >> 12U) & 0x3FU]);
            out.push_back(ALPHABET[(n >> 6U) & 0x3FU]);
            out.push_back(ALPHABET[n & 0x3FU]);
        }

        const size_t rest = in.size() - i;
        if (rest == 1) {
            const auto n = static_cast<unsigned char>(in[i]) << 16U;
            out.push_back(ALPHABET[(n >> 18U) & 0x3FU]);
            out.push_back(ALPHABET[(n >> 12U) & 0x3FU]);
            out.append("==");
        } else if (rest == 2) {
            const auto n = (static_cast<unsigned char>(in[i]) << 16U) | (static_cast<unsigned char>(in[i + 1]) << 8U);
            out.push_back(ALPHABET[(n >> 18U) & 0x3FU]);
            out.push_back(ALPHABET[(n >> 12U) & 0x3FU]);
            out.push_back(ALPHABET[(n >> 6U) & 0x3FU]);
            out.push_back('=');
        }

        return out;
    }

    std::string preview(const std::string &body, size_t max_length) { return body.substr(0, max_length); }
}  // namespace string_utils
