#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include "../../src/http/error/http_error.hpp"
#include "../support/mock_transport.hpp"

using namespace std::chrono_literals;
using http::http_error::ErrorKind;
using http::model::TransportErrorCode;

namespace {

    TEST(ClassifyStatus, MapsKnownStatuses) {
        const std::vector<std::pair<long, ErrorKind>> table = {
            {400, ErrorKind::INVALID_INPUT},       {401, ErrorKind::UNAUTHORIZED},        {403, ErrorKind::FORBIDDEN},
            {404, ErrorKind::NOT_FOUND},           {429, ErrorKind::RATE_LIMITED},        {500, ErrorKind::SERVICE_UNAVAILABLE},
            {502, ErrorKind::SERVICE_UNAVAILABLE}, {503, ErrorKind::SERVICE_UNAVAILABLE}, {504, ErrorKind::TIMEOUT},
        };
        for (const auto& [status, kind] : table) {
            EXPECT_EQ(http::http_error::classify_status(status), kind) << status;
        }
    }

    TEST(ClassifyStatus, EverythingElseIsExternal) {
        for (long status : {0L, 100L, 302L, 405L, 409L, 418L, 422L, 501L, 505L, 599L, 999L, -1L}) {
            EXPECT_EQ(http::http_error::classify_status(status), ErrorKind::EXTERNAL_ERROR) << status;
        }
    }

    TEST(ClassifyTransport, MapsTransportCodes) {
        EXPECT_EQ(http::http_error::classify_transport(TransportErrorCode::TIMEOUT), ErrorKind::TIMEOUT);
        EXPECT_EQ(http::http_error::classify_transport(TransportErrorCode::DNS_FAILURE), ErrorKind::NETWORK_ERROR);
        EXPECT_EQ(http::http_error::classify_transport(TransportErrorCode::CONNECTION_REFUSED), ErrorKind::NETWORK_ERROR);
        EXPECT_EQ(http::http_error::classify_transport(TransportErrorCode::ABORTED), ErrorKind::EXTERNAL_ERROR);
        EXPECT_EQ(http::http_error::classify_transport(TransportErrorCode::OTHER), ErrorKind::EXTERNAL_ERROR);
    }

    TEST(Classify, IsPureOverAttemptResults) {
        const auto a = testing_support::respond(503);
        EXPECT_EQ(http::http_error::classify(a), http::http_error::classify(a));
        EXPECT_EQ(http::http_error::classify(testing_support::transport_failure(TransportErrorCode::TIMEOUT)), ErrorKind::TIMEOUT);
    }

    TEST(Retryable, OnlyTransientKinds) {
        EXPECT_TRUE(http::http_error::is_retryable(ErrorKind::TIMEOUT));
        EXPECT_TRUE(http::http_error::is_retryable(ErrorKind::SERVICE_UNAVAILABLE));
        EXPECT_TRUE(http::http_error::is_retryable(ErrorKind::RATE_LIMITED));
        EXPECT_TRUE(http::http_error::is_retryable(ErrorKind::NETWORK_ERROR));

        EXPECT_FALSE(http::http_error::is_retryable(ErrorKind::INVALID_INPUT));
        EXPECT_FALSE(http::http_error::is_retryable(ErrorKind::UNAUTHORIZED));
        EXPECT_FALSE(http::http_error::is_retryable(ErrorKind::FORBIDDEN));
        EXPECT_FALSE(http::http_error::is_retryable(ErrorKind::NOT_FOUND));
        EXPECT_FALSE(http::http_error::is_retryable(ErrorKind::EXTERNAL_ERROR));
        EXPECT_FALSE(http::http_error::is_retryable(ErrorKind::INTERNAL_ERROR));
    }

    TEST(RetryAfter, ParsesSecondsWithFallback) {
        EXPECT_EQ(http::http_error::parse_retry_after("2"), 2s);
        EXPECT_EQ(http::http_error::parse_retry_after(" 15 "), 15s);
        EXPECT_EQ(http::http_error::parse_retry_after(""), 60s);
        EXPECT_EQ(http::http_error::parse_retry_after("soon"), 60s);
        EXPECT_EQ(http::http_error::parse_retry_after("-4"), 60s);
    }

    TEST(SuggestedDelay, FollowsKind) {
        http::http_error::ErrorDetails details;
        details.retry_after_ = 7s;
        EXPECT_EQ(http::http_error::suggested_delay(ErrorKind::RATE_LIMITED, details), std::chrono::milliseconds{7000});
        EXPECT_EQ(http::http_error::suggested_delay(ErrorKind::RATE_LIMITED, {}), std::chrono::milliseconds{60000});
        EXPECT_EQ(http::http_error::suggested_delay(ErrorKind::SERVICE_UNAVAILABLE, {}), std::chrono::milliseconds{30000});
        EXPECT_FALSE(http::http_error::suggested_delay(ErrorKind::NOT_FOUND, {}).has_value());
    }

    TEST(VendorPayload, ReadsNestedEasyPostError) {
        const auto p = http::http_error::parse_vendor_payload(
            R"({"error":{"code":"ADDRESS.VERIFY.FAILURE","message":"Unable to verify address.","errors":[{"field":"street1","message":"is required"}]}})");

        EXPECT_TRUE(p.parsed_);
        EXPECT_EQ(p.code_, "ADDRESS.VERIFY.FAILURE");
        EXPECT_EQ(p.message_, "Unable to verify address.");
        ASSERT_EQ(p.field_errors_.size(), 1u);
        EXPECT_EQ(p.field_errors_[0], "street1: is required");
    }

    TEST(VendorPayload, ReadsFlatVeeqoError) {
        const auto p = http::http_error::parse_vendor_payload(R"({"message":"Sellable not found","errors":["bad id"]})");

        EXPECT_TRUE(p.parsed_);
        EXPECT_EQ(p.message_, "Sellable not found");
        ASSERT_EQ(p.field_errors_.size(), 1u);
        EXPECT_EQ(p.field_errors_[0], "bad id");
    }

    TEST(VendorPayload, StringErrorField) {
        const auto p = http::http_error::parse_vendor_payload(R"({"error":"Unauthorized"})");
        EXPECT_EQ(p.message_, "Unauthorized");
    }

    TEST(VendorPayload, KeepsRawWhenUnparseable) {
        const auto p = http::http_error::parse_vendor_payload("<html>Bad Gateway</html>");
        EXPECT_FALSE(p.parsed_);
        EXPECT_EQ(p.raw_, "<html>Bad Gateway</html>");
        EXPECT_TRUE(p.message_.empty());

        EXPECT_FALSE(http::http_error::parse_vendor_payload("").parsed_);
        EXPECT_FALSE(http::http_error::parse_vendor_payload("[1,2]").parsed_);
    }

    TEST(ToHttpError, BuildsStatusErrors) {
        const auto err = http::http_error::to_http_error("Veeqo", "https://api.veeqo.com/orders", testing_support::respond(401, R"({"error":"nope"})"));

        EXPECT_EQ(err.kind_, ErrorKind::UNAUTHORIZED);
        EXPECT_EQ(err.status_, 401);
        EXPECT_EQ(err.url_, "https://api.veeqo.com/orders");
        EXPECT_EQ(err.body_preview_, R"({"error":"nope"})");
        EXPECT_EQ(err.details_.service_, "Veeqo");
        EXPECT_EQ(std::string(err.what()), "Veeqo API: Unauthorized - check API key");
    }

    TEST(ToHttpError, CarriesRetryAfterForRateLimits) {
        const auto err = http::http_error::to_http_error("EasyPost", "u", testing_support::respond(429, "{}", {{"retry-after", "3"}}));

        EXPECT_EQ(err.kind_, ErrorKind::RATE_LIMITED);
        ASSERT_TRUE(err.details_.retry_after_.has_value());
        EXPECT_EQ(*err.details_.retry_after_, 3s);
        EXPECT_EQ(std::string(err.what()), "EasyPost API: Rate limit exceeded");
    }

    TEST(ToHttpError, UnknownStatusUsesVendorMessage) {
        const auto err = http::http_error::to_http_error("EasyPost", "u", testing_support::respond(422, R"({"error":{"message":"Rate expired"}})"));

        EXPECT_EQ(err.kind_, ErrorKind::EXTERNAL_ERROR);
        EXPECT_EQ(std::string(err.what()), "EasyPost API error: Rate expired");
    }

    TEST(ToHttpError, TruncatesBodyPreview) {
        const std::string body(4096, 'x');
        const auto err = http::http_error::to_http_error("EasyPost", "u", testing_support::respond(500, body));
        EXPECT_EQ(err.body_preview_.size(), static_cast<size_t>(http::http_error::ERROR_MESSAGE_LENGTH));
        EXPECT_EQ(err.details_.vendor_.raw_.size(), body.size());
    }

    TEST(ToHttpError, BuildsTransportErrors) {
        const auto err = http::http_error::to_http_error("Veeqo", "u", testing_support::transport_failure(TransportErrorCode::DNS_FAILURE, "Could not resolve host"));

        EXPECT_EQ(err.kind_, ErrorKind::NETWORK_ERROR);
        EXPECT_EQ(err.status_, 0);
        EXPECT_EQ(std::string(err.what()), "Network error connecting to Veeqo: Could not resolve host");
        ASSERT_TRUE(err.details_.transport_code_.has_value());
        EXPECT_EQ(*err.details_.transport_code_, TransportErrorCode::DNS_FAILURE);
    }

    TEST(ToHttpError, StatusAgreesWithDetails) {
        const auto err = http::http_error::to_http_error("Veeqo", "u", testing_support::respond(418, "teapot"));
        EXPECT_EQ(err.kind_, ErrorKind::EXTERNAL_ERROR);
        EXPECT_EQ(err.status_, 418);
        ASSERT_TRUE(err.details_.status_.has_value());
        EXPECT_EQ(*err.details_.status_, 418);
        EXPECT_EQ(err.body_preview_, "teapot");
        EXPECT_FALSE(err.breaker_rejected());
    }

    TEST(ErrorKindNames, AreStable) {
        EXPECT_STREQ(http::http_error::to_string(ErrorKind::RATE_LIMITED), "RATE_LIMITED");
        EXPECT_STREQ(http::http_error::to_string(ErrorKind::NETWORK_ERROR), "NETWORK_ERROR");
        EXPECT_STREQ(http::http_error::to_string(ErrorKind::INTERNAL_ERROR), "INTERNAL_ERROR");
    }

}  // namespace
