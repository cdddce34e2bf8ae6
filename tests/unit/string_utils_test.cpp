#include <gtest/gtest.h>

#include <string>

#include "../../src/utils/string_utils.hpp"

namespace {

    TEST(ParseHeaderLine, LowerCasesNameAndTrimsValue) {
        auto h = string_utils::parse_header_line("Retry-After:  2 \r\n");
        ASSERT_TRUE(h.has_value());
        EXPECT_EQ(h->first, "retry-after");
        EXPECT_EQ(h->second, "2");
    }

    TEST(ParseHeaderLine, RejectsStatusAndBlankLines) {
        EXPECT_FALSE(string_utils::parse_header_line("HTTP/1.1 200 OK\r\n").has_value());
        EXPECT_FALSE(string_utils::parse_header_line("\r\n").has_value());
        EXPECT_FALSE(string_utils::parse_header_line(": value").has_value());
    }

    TEST(ParseLong, StrictIntegers) {
        EXPECT_EQ(string_utils::parse_long("42"), 42);
        EXPECT_EQ(string_utils::parse_long(" -7 "), -7);
        EXPECT_FALSE(string_utils::parse_long("4x").has_value());
        EXPECT_FALSE(string_utils::parse_long("").has_value());
    }

    TEST(Base64, EncodesBasicAuthCredentials) {
        EXPECT_EQ(string_utils::base64_encode("EZAK123:"), "RVpBSzEyMzo=");
        EXPECT_EQ(string_utils::base64_encode(""), "");
        EXPECT_EQ(string_utils::base64_encode("ab"), "YWI=");
        EXPECT_EQ(string_utils::base64_encode("abc"), "YWJj");
    }

    TEST(IeqPrefix, CaseInsensitive) {
        const std::string line = "http/1.1 503";
        EXPECT_TRUE(string_utils::ieq_prefix(line.c_str(), line.size(), "HTTP/"));
        EXPECT_FALSE(string_utils::ieq_prefix("HT", 2, "HTTP/"));
    }

    TEST(IeqPrefix, HighBytesNeverMatchAscii) {
        const std::string latin1 = "\xC8\xD4\xD4\xD0/1.1 200";
        EXPECT_FALSE(string_utils::ieq_prefix(latin1.c_str(), latin1.size(), "HTTP/"));

        const std::string utf8 = "\xC3\xA9tag: x";
        EXPECT_TRUE(string_utils::ieq_prefix(utf8.c_str(), utf8.size(), "\xC3\xA9TAG:"));
        EXPECT_FALSE(string_utils::ieq_prefix(utf8.c_str(), utf8.size(), "\xFF"));
    }

    TEST(Preview, Truncates) {
        EXPECT_EQ(string_utils::preview("abcdef", 3), "abc");
        EXPECT_EQ(string_utils::preview("ab", 3), "ab");
    }

}  // namespace
