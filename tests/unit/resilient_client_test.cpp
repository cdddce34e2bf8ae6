#include <gtest/gtest.h>
#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "../../src/http/client/resilient_client.hpp"
#include "../../src/utils/constants.hpp"
#include "../../src/utils/logger.hpp"
#include "../support/manual_clock.hpp"
#include "../support/mock_transport.hpp"

using namespace std::chrono_literals;
using http::http_error::ErrorKind;
using http::http_error::HttpError;
using http::model::TransportErrorCode;
using testing_support::respond;
using testing_support::transport_failure;

namespace {

    class ResilientClientTest : public ::testing::Test {
       protected:
        void SetUp() override {
            sink_ = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(256);
            auto l = std::make_shared<spdlog::logger>(logger::LOGGER_NAME, sink_);
            l->set_pattern("%l %v");
            l->set_level(spdlog::level::debug);
            logger::install(l);

            clock_ = std::make_shared<testing_support::ManualClock>();
            transport_ = std::make_shared<testing_support::MockTransport>();
            breaker_ = std::make_shared<http::resilience::CircuitBreaker>("EasyPost", http::resilience::BreakerConfig{}, clock_);
            idempotency_ = std::make_shared<http::idempotency::IdempotencyKeyManager>(clock_);
            errors_ = std::make_shared<http::http_error::ErrorCollector>(clock_);
        }

        void TearDown() override { spdlog::drop(logger::LOGGER_NAME); }

        std::unique_ptr<http::client::ResilientClient> make_client(http::client::RetryPolicy policy = {}) {
            policy.jitter_ = false;
            return std::make_unique<http::client::ResilientClient>("EasyPost",
                                                                   http::client::ResilientClientDeps{
                                                                       .transport_ = transport_,
                                                                       .breaker_ = breaker_,
                                                                       .idempotency_ = idempotency_,
                                                                       .clock_ = clock_,
                                                                       .errors_ = errors_,
                                                                   },
                                                                   policy);
        }

        static http::model::Request get(const std::string& endpoint = "/shipments/shp_1") {
            http::model::Request r;
            r.url_ = "https://api.test" + endpoint;
            r.endpoint_ = endpoint;
            return r;
        }

        static http::model::Request buy(const std::string& body = R"({"rate":{"id":"rate_1"}})") {
            http::model::Request r;
            r.url_ = "https://api.test/shipments/shp_1/buy";
            r.endpoint_ = "/shipments/shp_1/buy";
            r.method_ = "POST";
            r.body_ = body;
            r.mutating_ = true;
            r.deduplicate_ = true;
            return r;
        }

        size_t count_logs(const std::string& needle) const {
            size_t n = 0;
            for (const auto& line : sink_->last_formatted()) {
                if (line.find(needle) != std::string::npos) {
                    ++n;
                }
            }
            return n;
        }

        std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
        std::shared_ptr<testing_support::ManualClock> clock_;
        std::shared_ptr<testing_support::MockTransport> transport_;
        std::shared_ptr<http::resilience::CircuitBreaker> breaker_;
        std::shared_ptr<http::idempotency::IdempotencyKeyManager> idempotency_;
        std::shared_ptr<http::http_error::ErrorCollector> errors_;
    };

    TEST_F(ResilientClientTest, ReturnsFirstSuccessWithoutSleeping) {
        transport_->script({respond(200, R"({"id":"shp_1"})")});
        auto client = make_client();

        auto resp = client->send(get());

        EXPECT_EQ(resp.status_, 200);
        EXPECT_EQ(resp.body_, R"({"id":"shp_1"})");
        EXPECT_EQ(transport_->calls(), 1u);
        EXPECT_TRUE(clock_->sleeps().empty());
    }

    TEST_F(ResilientClientTest, RateLimitWaitsForRetryAfter) {
        transport_->script({respond(429, "{}", {{"retry-after", "2"}}), respond(200)});
        auto client = make_client();

        auto resp = client->send(get());

        EXPECT_EQ(resp.status_, 200);
        ASSERT_EQ(clock_->sleeps().size(), 1u);
        EXPECT_GE(clock_->sleeps()[0], 2000ms);
    }

    TEST_F(ResilientClientTest, RateLimitDoesNotAdvanceBackoffMultiplier) {
        transport_->script({respond(429, "{}", {{"retry-after", "2"}}), respond(503), respond(200)});
        auto client = make_client();

        client->send(get());

        const auto sleeps = clock_->sleeps();
        ASSERT_EQ(sleeps.size(), 2u);
        EXPECT_EQ(sleeps[0], 2000ms);
        // First exponential retry still uses base * 2^0.
        EXPECT_EQ(sleeps[1], 1000ms);
    }

    TEST_F(ResilientClientTest, RateLimitWithoutRetryAfterWaitsDefault) {
        transport_->script({respond(429), respond(200)});
        auto client = make_client();

        client->send(get());

        ASSERT_EQ(clock_->sleeps().size(), 1u);
        EXPECT_EQ(clock_->sleeps()[0], std::chrono::seconds{constants::DEFAULT_RETRY_AFTER_S});
    }

    TEST_F(ResilientClientTest, AlwaysUnavailableStopsAtMaxAttempts) {
        transport_ = std::make_shared<testing_support::MockTransport>(respond(503));
        auto client = make_client();

        try {
            client->send(get());
            FAIL() << "expected HttpError";
        } catch (const HttpError& e) {
            EXPECT_EQ(e.kind_, ErrorKind::SERVICE_UNAVAILABLE);
            EXPECT_EQ(e.status_, 503);
            EXPECT_EQ(e.attempts_, 3u);
            EXPECT_FALSE(e.breaker_rejected());
        }

        EXPECT_EQ(transport_->calls(), 3u);
        const auto sleeps = clock_->sleeps();
        ASSERT_EQ(sleeps.size(), 2u);
        EXPECT_EQ(sleeps[0], 1000ms);
        EXPECT_EQ(sleeps[1], 2000ms);
    }

    TEST_F(ResilientClientTest, BackoffIsCappedAtMaxDelay) {
        transport_ = std::make_shared<testing_support::MockTransport>(respond(502));
        auto client = make_client(http::client::RetryPolicy{.max_tries_ = 4, .base_delay_ = 1000ms, .max_delay_ = 1500ms});

        EXPECT_THROW(client->send(get()), HttpError);

        const auto sleeps = clock_->sleeps();
        ASSERT_EQ(sleeps.size(), 3u);
        EXPECT_EQ(sleeps[0], 1000ms);
        EXPECT_EQ(sleeps[1], 1500ms);
        EXPECT_EQ(sleeps[2], 1500ms);
    }

    TEST_F(ResilientClientTest, ClientErrorsAreNotRetried) {
        transport_->script({respond(400, R"({"error":{"code":"PARAMETER.INVALID","message":"Wrong address"}})")});
        auto client = make_client();

        try {
            client->send(get());
            FAIL() << "expected HttpError";
        } catch (const HttpError& e) {
            EXPECT_EQ(e.kind_, ErrorKind::INVALID_INPUT);
            EXPECT_EQ(e.attempts_, 1u);
            EXPECT_EQ(std::string(e.what()), "EasyPost API: Wrong address");
            EXPECT_EQ(e.details_.vendor_.code_, "PARAMETER.INVALID");
        }

        EXPECT_EQ(transport_->calls(), 1u);
        EXPECT_TRUE(clock_->sleeps().empty());
    }

    TEST_F(ResilientClientTest, TwoServerErrorsThenSuccess) {
        std::vector<size_t> failures_seen;
        size_t call = 0;
        transport_->on([&](const http::model::Request&) {
            failures_seen.push_back(breaker_->status().failures_);
            return ++call < 3 ? respond(500) : respond(200);
        });
        auto client = make_client();

        auto resp = client->send(get());

        EXPECT_EQ(resp.status_, 200);
        EXPECT_EQ(count_logs("retrying request"), 2u);
        ASSERT_EQ(failures_seen.size(), 3u);
        EXPECT_EQ(failures_seen[2], 2u);

        const auto status = breaker_->status();
        EXPECT_EQ(status.state_, http::resilience::BreakerState::CLOSED);
        EXPECT_EQ(status.failures_, 0u);
    }

    TEST_F(ResilientClientTest, RetryLogCarriesStructuredFields) {
        transport_->script({respond(503), respond(200)});
        auto client = make_client();

        client->send(get("/trackers"));

        ASSERT_EQ(count_logs("retrying request"), 1u);
        EXPECT_EQ(count_logs("service=EasyPost method=GET endpoint=/trackers attempt=1 delay_ms=1000 kind=SERVICE_UNAVAILABLE status=503"), 1u);
    }

    TEST_F(ResilientClientTest, NetworkErrorsAreRetried) {
        transport_->script({transport_failure(TransportErrorCode::DNS_FAILURE), transport_failure(TransportErrorCode::CONNECTION_REFUSED), respond(200)});
        auto client = make_client();

        EXPECT_EQ(client->send(get()).status_, 200);
        EXPECT_EQ(transport_->calls(), 3u);
    }

    TEST_F(ResilientClientTest, TransportTimeoutSurfacesAsTimeout) {
        transport_ = std::make_shared<testing_support::MockTransport>(transport_failure(TransportErrorCode::TIMEOUT, "Operation timed out"));
        auto client = make_client();

        try {
            client->send(get());
            FAIL() << "expected HttpError";
        } catch (const HttpError& e) {
            EXPECT_EQ(e.kind_, ErrorKind::TIMEOUT);
            EXPECT_EQ(e.attempts_, 3u);
            ASSERT_TRUE(e.details_.transport_code_.has_value());
            EXPECT_EQ(*e.details_.transport_code_, TransportErrorCode::TIMEOUT);
        }
    }

    TEST_F(ResilientClientTest, ThrowingTransportIsTerminal) {
        transport_->throw_next("socket exploded");
        auto client = make_client();

        try {
            client->send(get());
            FAIL() << "expected HttpError";
        } catch (const HttpError& e) {
            EXPECT_EQ(e.kind_, ErrorKind::EXTERNAL_ERROR);
            EXPECT_NE(std::string(e.what()).find("socket exploded"), std::string::npos);
        }
        EXPECT_EQ(transport_->calls(), 1u);
    }

    TEST_F(ResilientClientTest, PerCallTimeoutOverridesPolicy) {
        auto client = make_client();
        auto req = get();
        req.timeout_ = 5000ms;

        client->send(req);
        client->send(get());

        const auto timeouts = transport_->timeouts();
        ASSERT_EQ(timeouts.size(), 2u);
        EXPECT_EQ(timeouts[0], 5000ms);
        EXPECT_EQ(timeouts[1], std::chrono::milliseconds{constants::DEFAULT_TIMEOUT_MS});
    }

    TEST_F(ResilientClientTest, DeduplicatedCallsCarryStableIdempotencyKey) {
        transport_->script({respond(503), respond(200), respond(200)});
        auto client = make_client();

        client->send(buy());
        client->send(buy(R"({ "rate" : { "id" : "rate_1" } })"));

        const auto requests = transport_->requests();
        ASSERT_EQ(requests.size(), 3u);
        const auto& key = requests[0].headers_.at(constants::IDEMPOTENCY_HEADER);
        EXPECT_EQ(key.size(), 36u);
        EXPECT_EQ(requests[1].headers_.at(constants::IDEMPOTENCY_HEADER), key);
        EXPECT_EQ(requests[2].headers_.at(constants::IDEMPOTENCY_HEADER), key);
    }

    TEST_F(ResilientClientTest, DifferentBodiesGetDifferentKeys) {
        auto client = make_client();

        client->send(buy(R"({"rate":{"id":"rate_1"}})"));
        client->send(buy(R"({"rate":{"id":"rate_2"}})"));

        const auto requests = transport_->requests();
        ASSERT_EQ(requests.size(), 2u);
        EXPECT_NE(requests[0].headers_.at(constants::IDEMPOTENCY_HEADER), requests[1].headers_.at(constants::IDEMPOTENCY_HEADER));
    }

    TEST_F(ResilientClientTest, NonDeduplicatedCallsHaveNoKey) {
        auto client = make_client();
        auto req = buy();
        req.deduplicate_ = false;

        client->send(req);
        client->send(get());

        for (const auto& r : transport_->requests()) {
            EXPECT_EQ(r.headers_.count(constants::IDEMPOTENCY_HEADER), 0u);
        }
    }

    TEST_F(ResilientClientTest, OpenBreakerRejectsWithoutTransport) {
        transport_ = std::make_shared<testing_support::MockTransport>(respond(503));
        auto client = make_client(http::client::RetryPolicy{.max_tries_ = 1});

        for (int i = 0; i < 5; ++i) {
            EXPECT_THROW(client->send(get()), HttpError);
        }
        EXPECT_EQ(breaker_->state(), http::resilience::BreakerState::OPEN);

        try {
            client->send(get());
            FAIL() << "expected rejection";
        } catch (const HttpError& e) {
            EXPECT_EQ(e.kind_, ErrorKind::SERVICE_UNAVAILABLE);
            EXPECT_TRUE(e.breaker_rejected());
            EXPECT_EQ(e.attempts_, 0u);
            EXPECT_EQ(e.url_, "https://api.test/shipments/shp_1");
        }
        EXPECT_EQ(transport_->calls(), 5u);
    }

    TEST_F(ResilientClientTest, BreakerTripsWithinOneCallStopsRetrying) {
        transport_ = std::make_shared<testing_support::MockTransport>(respond(503));
        breaker_ = std::make_shared<http::resilience::CircuitBreaker>("EasyPost", http::resilience::BreakerConfig{.failure_threshold_ = 2}, clock_);
        auto client = make_client(http::client::RetryPolicy{.max_tries_ = 5});

        try {
            client->send(get());
            FAIL() << "expected HttpError";
        } catch (const HttpError& e) {
            EXPECT_TRUE(e.breaker_rejected());
            EXPECT_EQ(e.attempts_, 2u);
        }
        EXPECT_EQ(transport_->calls(), 2u);
    }

    TEST_F(ResilientClientTest, ProbeAfterResetTimeoutClosesBreaker) {
        transport_ = std::make_shared<testing_support::MockTransport>(respond(503));
        auto client = make_client(http::client::RetryPolicy{.max_tries_ = 1});
        for (int i = 0; i < 5; ++i) {
            EXPECT_THROW(client->send(get()), HttpError);
        }

        transport_->script({respond(200)});
        clock_->advance(std::chrono::milliseconds{constants::BREAKER_RESET_TIMEOUT_MS});

        EXPECT_EQ(client->send(get()).status_, 200);
        EXPECT_EQ(breaker_->state(), http::resilience::BreakerState::CLOSED);
        EXPECT_EQ(breaker_->status().failures_, 0u);
    }

    TEST_F(ResilientClientTest, NonStandardThrowDuringHalfOpenTrialReopensBreaker) {
        transport_ = std::make_shared<testing_support::MockTransport>(respond(503));
        auto client = make_client(http::client::RetryPolicy{.max_tries_ = 1});
        for (int i = 0; i < 5; ++i) {
            EXPECT_THROW(client->send(get()), HttpError);
        }

        clock_->advance(std::chrono::milliseconds{constants::BREAKER_RESET_TIMEOUT_MS});
        transport_->on([](const http::model::Request&) -> http::model::AttemptResult { throw 42; });

        try {
            client->send(get());
            FAIL() << "expected HttpError";
        } catch (const HttpError& e) {
            EXPECT_EQ(e.kind_, ErrorKind::EXTERNAL_ERROR);
            EXPECT_FALSE(e.breaker_rejected());
            EXPECT_EQ(e.attempts_, 1u);
        }
        EXPECT_EQ(breaker_->state(), http::resilience::BreakerState::OPEN);

        transport_->on({});
        transport_->script({respond(200)});
        clock_->advance(std::chrono::milliseconds{constants::BREAKER_RESET_TIMEOUT_MS});

        EXPECT_EQ(client->send(get()).status_, 200);
        EXPECT_EQ(breaker_->state(), http::resilience::BreakerState::CLOSED);
        EXPECT_EQ(transport_->calls(), 7u);
    }

    TEST_F(ResilientClientTest, DeadlineBoundsRetryLoop) {
        transport_ = std::make_shared<testing_support::MockTransport>(respond(503));
        auto client = make_client(http::client::RetryPolicy{.max_tries_ = 5});

        try {
            client->send(get(), http::model::CallOptions{.deadline_ = 1500ms});
            FAIL() << "expected HttpError";
        } catch (const HttpError& e) {
            EXPECT_EQ(e.kind_, ErrorKind::TIMEOUT);
            EXPECT_EQ(e.attempts_, 2u);
        }
        EXPECT_EQ(transport_->calls(), 2u);
        ASSERT_EQ(clock_->sleeps().size(), 1u);
    }

    TEST_F(ResilientClientTest, DeadlineCapsAttemptTimeout) {
        auto client = make_client();

        client->send(get(), http::model::CallOptions{.deadline_ = 2500ms});

        ASSERT_EQ(transport_->timeouts().size(), 1u);
        EXPECT_EQ(transport_->timeouts()[0], 2500ms);
    }

    TEST_F(ResilientClientTest, TerminalErrorsAreCollected) {
        transport_->script({respond(404)});
        auto client = make_client();

        EXPECT_THROW(client->send(get()), HttpError);

        ASSERT_EQ(errors_->size(), 1u);
        const auto collected = errors_->by_kind(ErrorKind::NOT_FOUND);
        ASSERT_EQ(collected.size(), 1u);
        EXPECT_EQ(collected[0].service_, "EasyPost");
        EXPECT_EQ(collected[0].message_, "EasyPost API: Resource not found");
        EXPECT_EQ(count_logs("request failed"), 1u);
    }

    TEST_F(ResilientClientTest, MissingIdempotencyManagerIsInternalError) {
        idempotency_.reset();
        auto client = make_client();

        try {
            client->send(buy());
            FAIL() << "expected HttpError";
        } catch (const HttpError& e) {
            EXPECT_EQ(e.kind_, ErrorKind::INTERNAL_ERROR);
        }
        EXPECT_EQ(transport_->calls(), 0u);
        EXPECT_EQ(count_logs("request failed"), 1u);
        ASSERT_EQ(errors_->by_kind(ErrorKind::INTERNAL_ERROR).size(), 1u);
        EXPECT_EQ(errors_->size(), 1u);
    }

    TEST_F(ResilientClientTest, RejectsMissingDependencies) {
        EXPECT_THROW(http::client::ResilientClient("x", http::client::ResilientClientDeps{.breaker_ = breaker_, .clock_ = clock_}), std::invalid_argument);
        EXPECT_THROW(http::client::ResilientClient("x", http::client::ResilientClientDeps{.transport_ = transport_, .clock_ = clock_}), std::invalid_argument);
        EXPECT_THROW(http::client::ResilientClient("x", http::client::ResilientClientDeps{.transport_ = transport_, .breaker_ = breaker_}), std::invalid_argument);
    }

}  // namespace
