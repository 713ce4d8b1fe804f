#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <vector>

#include "fetch_engine.hpp"
#include "test_helpers.hpp"

using namespace std::chrono_literals;
using ::testing::_;
using ::testing::AllOf;
using ::testing::InSequence;
using ::testing::Return;
using testing_support::FakeKlineServer;
using testing_support::HasParam;
using testing_support::MockHttpTransport;
using testing_support::RecordingSleeper;
using testing_support::klinesBody;
using testing_support::ok;
using testing_support::status;
using testing_support::transportFailure;

namespace {

const std::string kUrl = "https://api.binance.com/api/v3/klines";
constexpr core::Millis kHalfHour = 30 * 60 * 1000;

data::FetchRequest makeRequest(core::Millis start, core::Millis end, int limit = 1000) {
    data::FetchRequest request;
    request.symbol = "BTCUSDT";
    request.interval = "30m";
    request.start_ms = start;
    request.end_ms = end;
    request.limit = limit;
    request.max_attempts = 3;
    request.inter_page_delay = 200ms;
    return request;
}

std::vector<core::Millis> openTimes(const core::TimeSeries<core::Candle>& candles) {
    std::vector<core::Millis> times;
    for (const auto& candle : candles) {
        times.push_back(candle.open_time_ms);
    }
    return times;
}

class FetchEngineTest : public ::testing::Test {
protected:
    MockHttpTransport transport;
    RecordingSleeper sleeper;
    data::FetchEngine engine{transport, sleeper};
};

} // namespace

TEST_F(FetchEngineTest, OneHourWithLimitTwoStopsOnEmptyThirdPage) {
    {
        InSequence in_order;
        EXPECT_CALL(transport, get(kUrl, AllOf(HasParam("startTime", "0"), HasParam("endTime", "3599999"),
                                               HasParam("limit", "2")), _))
            .WillOnce(Return(ok(klinesBody({0, 1800000}))));
        EXPECT_CALL(transport, get(kUrl, HasParam("startTime", "1800001"), _))
            .WillOnce(Return(ok(klinesBody({3000000}))));
        EXPECT_CALL(transport, get(kUrl, HasParam("startTime", "3000001"), _))
            .WillOnce(Return(ok("[]")));
    }

    data::FetchResult result = engine.fetch(makeRequest(0, 3600000, 2));

    ASSERT_TRUE(result.ok()) << result.error().describe();
    EXPECT_EQ(openTimes(result.candles()), (std::vector<core::Millis>{0, 1800000, 3000000}));
    // Paced after pages 1 and 2; the empty page ends the loop without a wait
    EXPECT_EQ(sleeper.sleeps, (std::vector<std::chrono::milliseconds>{200ms, 200ms}));
}

TEST_F(FetchEngineTest, DefaultsToBinanceSpotKlines) {
    EXPECT_EQ(engine.url(), kUrl);
}

TEST_F(FetchEngineTest, SendsSymbolIntervalAndPerRequestTimeout) {
    data::FetchRequest request = makeRequest(0, 1);
    request.timeout = 4500ms;
    EXPECT_CALL(transport, get(kUrl, AllOf(HasParam("symbol", "BTCUSDT"), HasParam("interval", "30m"),
                                           HasParam("limit", "1000")), std::chrono::milliseconds(4500)))
        .WillOnce(Return(ok(klinesBody({0}))));

    EXPECT_TRUE(engine.fetch(request).ok());
}

TEST(FetchEngineUrlTest, JoinsBaseUrlAndKlinesPath) {
    MockHttpTransport transport;
    RecordingSleeper sleeper;
    data::FetchEngine engine(transport, sleeper, "http://127.0.0.1:8080", "/fapi/v1/klines");
    EXPECT_EQ(engine.url(), "http://127.0.0.1:8080/fapi/v1/klines");

    EXPECT_CALL(transport, get("http://127.0.0.1:8080/fapi/v1/klines", _, _)).WillOnce(Return(ok(klinesBody({0}))));
    EXPECT_TRUE(engine.fetch(makeRequest(0, 1)).ok());
}

TEST_F(FetchEngineTest, RetriesRateLimitedPageWithBackoff) {
    EXPECT_CALL(transport, get(_, _, _))
        .WillOnce(Return(status(429)))
        .WillOnce(Return(status(429)))
        .WillOnce(Return(ok(klinesBody({0}))));

    data::FetchResult result = engine.fetch(makeRequest(0, 1));

    ASSERT_TRUE(result.ok()) << result.error().describe();
    ASSERT_EQ(result.candles().size(), 1u);
    EXPECT_EQ(result.candles()[0].open_time_ms, 0);
    EXPECT_EQ(sleeper.sleeps, (std::vector<std::chrono::milliseconds>{2s, 4s}));
}

TEST_F(FetchEngineTest, TransportFailureIsRetriedLikeUpstreamError) {
    EXPECT_CALL(transport, get(_, _, _))
        .WillOnce(Return(transportFailure("Connection refused")))
        .WillOnce(Return(ok(klinesBody({0}))));

    data::FetchResult result = engine.fetch(makeRequest(0, 1));

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(sleeper.sleeps, (std::vector<std::chrono::milliseconds>{2s}));
}

TEST_F(FetchEngineTest, ExhaustedRetryBudgetFailsWithLastCause) {
    data::FetchRequest request = makeRequest(0, 3600000);
    request.max_attempts = 4;
    EXPECT_CALL(transport, get(_, _, _)).Times(4).WillRepeatedly(Return(status(503)));

    data::FetchResult result = engine.fetch(request);

    ASSERT_FALSE(result.ok());
    const data::FetchError& error = result.error();
    EXPECT_EQ(error.kind, data::FetchErrorKind::FetchFailed);
    EXPECT_EQ(error.attempts, 4);
    ASSERT_TRUE(error.last_cause.has_value());
    EXPECT_EQ(error.last_cause->kind, data::FetchErrorKind::UpstreamError);
    EXPECT_EQ(error.last_cause->http_status, 503);
    // No wait after the final attempt
    EXPECT_EQ(sleeper.sleeps, (std::vector<std::chrono::milliseconds>{2s, 4s, 8s}));
}

TEST_F(FetchEngineTest, BackoffIsCappedAtThirtySeconds) {
    data::FetchRequest request = makeRequest(0, 1);
    request.max_attempts = 7;
    EXPECT_CALL(transport, get(_, _, _)).Times(7).WillRepeatedly(Return(status(500)));

    EXPECT_FALSE(engine.fetch(request).ok());
    EXPECT_EQ(sleeper.sleeps, (std::vector<std::chrono::milliseconds>{2s, 4s, 8s, 16s, 30s, 30s}));
}

TEST(FetchEngineBackoffTest, DelayDoublesPerAttemptUpToCap) {
    EXPECT_EQ(data::FetchEngine::backoffDelay(1, 30s), 2s);
    EXPECT_EQ(data::FetchEngine::backoffDelay(3, 30s), 8s);
    EXPECT_EQ(data::FetchEngine::backoffDelay(4, 30s), 16s);
    EXPECT_EQ(data::FetchEngine::backoffDelay(5, 30s), 30s);
    EXPECT_EQ(data::FetchEngine::backoffDelay(64, 30s), 30s);
    EXPECT_EQ(data::FetchEngine::backoffDelay(3, 5s), 5s);
}

TEST_F(FetchEngineTest, FailureOnLaterPageDiscardsEarlierCandles) {
    {
        InSequence in_order;
        EXPECT_CALL(transport, get(_, HasParam("startTime", "0"), _))
            .WillOnce(Return(ok(klinesBody({0, kHalfHour}))));
        EXPECT_CALL(transport, get(_, HasParam("startTime", std::to_string(kHalfHour + 1)), _))
            .Times(3)
            .WillRepeatedly(Return(status(502)));
    }

    data::FetchResult result = engine.fetch(makeRequest(0, 4 * kHalfHour));

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, data::FetchErrorKind::FetchFailed);
}

TEST_F(FetchEngineTest, EmptyOrInvertedRangeMakesNoRequest) {
    EXPECT_CALL(transport, get(_, _, _)).Times(0);

    data::FetchResult same = engine.fetch(makeRequest(5000, 5000));
    data::FetchResult inverted = engine.fetch(makeRequest(9000, 1000));

    ASSERT_TRUE(same.ok());
    EXPECT_TRUE(same.candles().empty());
    ASSERT_TRUE(inverted.ok());
    EXPECT_TRUE(inverted.candles().empty());
    EXPECT_TRUE(sleeper.sleeps.empty());
}

TEST_F(FetchEngineTest, LimitOutsideApiCapIsRejectedBeforeAnyRequest) {
    EXPECT_CALL(transport, get(_, _, _)).Times(0);

    data::FetchResult zero = engine.fetch(makeRequest(0, kHalfHour, 0));
    data::FetchResult too_big = engine.fetch(makeRequest(0, kHalfHour, 1001));

    ASSERT_FALSE(zero.ok());
    EXPECT_EQ(zero.error().kind, data::FetchErrorKind::InvalidLimit);
    ASSERT_FALSE(too_big.ok());
    EXPECT_EQ(too_big.error().kind, data::FetchErrorKind::InvalidLimit);
}

TEST_F(FetchEngineTest, EmptyPageEndsFetchBeforeWindowEnd) {
    EXPECT_CALL(transport, get(_, HasParam("startTime", "0"), _))
        .WillOnce(Return(ok(klinesBody({0, kHalfHour, 2 * kHalfHour}))));
    EXPECT_CALL(transport, get(_, HasParam("startTime", std::to_string(2 * kHalfHour + 1)), _))
        .WillOnce(Return(ok("[]")));

    data::FetchResult result = engine.fetch(makeRequest(0, 100 * kHalfHour, 3));

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.candles().size(), 3u);
}

TEST_F(FetchEngineTest, CursorAdvancesToOnePastLastOpenTime) {
    const core::Millis last = 7 * kHalfHour + 123;
    InSequence in_order;
    EXPECT_CALL(transport, get(_, HasParam("startTime", "1000"), _))
        .WillOnce(Return(ok(klinesBody({1000, last}))));
    EXPECT_CALL(transport, get(_, HasParam("startTime", std::to_string(last + 1)), _))
        .WillOnce(Return(ok("[]")));

    EXPECT_TRUE(engine.fetch(makeRequest(1000, 50 * kHalfHour, 2)).ok());
}

TEST_F(FetchEngineTest, BarOpeningAtWindowEndIsDroppedNotRetried) {
    EXPECT_CALL(transport, get(_, HasParam("endTime", std::to_string(2 * kHalfHour - 1)), _))
        .Times(1)
        .WillOnce(Return(ok(klinesBody({0, kHalfHour, 2 * kHalfHour}))));

    data::FetchResult result = engine.fetch(makeRequest(0, 2 * kHalfHour));

    ASSERT_TRUE(result.ok()) << result.error().describe();
    EXPECT_EQ(openTimes(result.candles()), (std::vector<core::Millis>{0, kHalfHour}));
    EXPECT_TRUE(sleeper.sleeps.empty());
}

TEST_F(FetchEngineTest, PageHoldingOnlyTheEndBarEndsTheFetch) {
    InSequence in_order;
    EXPECT_CALL(transport, get(_, HasParam("startTime", "0"), _))
        .WillOnce(Return(ok(klinesBody({0}))));
    EXPECT_CALL(transport, get(_, HasParam("startTime", "1"), _))
        .WillOnce(Return(ok(klinesBody({kHalfHour}))));

    data::FetchResult result = engine.fetch(makeRequest(0, kHalfHour));

    ASSERT_TRUE(result.ok()) << result.error().describe();
    EXPECT_EQ(openTimes(result.candles()), (std::vector<core::Millis>{0}));
}

TEST_F(FetchEngineTest, MalformedBodyConsumesAnAttempt) {
    EXPECT_CALL(transport, get(_, _, _))
        .WillOnce(Return(ok("<html>maintenance</html>")))
        .WillOnce(Return(ok(klinesBody({0}))));

    data::FetchResult result = engine.fetch(makeRequest(0, 1));

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(sleeper.sleeps, (std::vector<std::chrono::milliseconds>{2s}));
}

TEST_F(FetchEngineTest, RowsOutsideRequestedWindowAreRejected) {
    data::FetchRequest request = makeRequest(kHalfHour, 4 * kHalfHour);
    request.max_attempts = 2;
    EXPECT_CALL(transport, get(_, _, _)).Times(2).WillRepeatedly(Return(ok(klinesBody({0}))));

    data::FetchResult result = engine.fetch(request);

    ASSERT_FALSE(result.ok());
    ASSERT_TRUE(result.error().last_cause.has_value());
    EXPECT_EQ(result.error().last_cause->kind, data::FetchErrorKind::MalformedResponse);
}

TEST_F(FetchEngineTest, CancelledTokenStopsBeforeFirstRequest) {
    core::CancellationToken token;
    token.cancel();
    EXPECT_CALL(transport, get(_, _, _)).Times(0);

    data::FetchResult result = engine.fetch(makeRequest(0, kHalfHour), token);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, data::FetchErrorKind::Cancelled);
}

TEST_F(FetchEngineTest, CancelDuringBackoffAbortsWithoutFurtherAttempts) {
    core::CancellationToken token;
    sleeper.on_sleep = [&token](std::size_t) { token.cancel(); };
    EXPECT_CALL(transport, get(_, _, _)).Times(1).WillOnce(Return(status(500)));

    data::FetchResult result = engine.fetch(makeRequest(0, kHalfHour), token);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, data::FetchErrorKind::Cancelled);
}

TEST_F(FetchEngineTest, CancelDuringPagePacingDiscardsCandles) {
    core::CancellationToken token;
    sleeper.on_sleep = [&token](std::size_t) { token.cancel(); };
    EXPECT_CALL(transport, get(_, _, _)).WillOnce(Return(ok(klinesBody({0}))));

    data::FetchResult result = engine.fetch(makeRequest(0, 10 * kHalfHour), token);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, data::FetchErrorKind::Cancelled);
}

TEST_F(FetchEngineTest, ReportsProgressAfterEachPage) {
    EXPECT_CALL(transport, get(_, HasParam("startTime", "0"), _))
        .WillOnce(Return(ok(klinesBody({0, kHalfHour}))));
    EXPECT_CALL(transport, get(_, HasParam("startTime", std::to_string(kHalfHour + 1)), _))
        .WillOnce(Return(ok(klinesBody({2 * kHalfHour, 3 * kHalfHour}))));
    EXPECT_CALL(transport, get(_, HasParam("startTime", std::to_string(3 * kHalfHour + 1)), _))
        .WillOnce(Return(ok("[]")));

    std::vector<std::pair<std::size_t, std::size_t>> reports;
    data::FetchRequest request = makeRequest(0, 4 * kHalfHour, 2);
    request.on_progress = [&reports](std::size_t fetched, std::size_t total, const std::string&) {
        reports.emplace_back(fetched, total);
    };

    ASSERT_TRUE(engine.fetch(request).ok());
    EXPECT_EQ(reports, (std::vector<std::pair<std::size_t, std::size_t>>{{2, 4}, {4, 4}}));
}

TEST_F(FetchEngineTest, FetchPageRejectsEmptyWindow) {
    EXPECT_CALL(transport, get(_, _, _)).Times(0);
    core::CancellationToken token;
    const core::PageRequest page{"BTCUSDT", "30m", 5000, 5000, 100};

    data::FetchResult result = engine.fetchPage(page, data::RetryPolicy{}, token);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, data::FetchErrorKind::InvalidRange);
}

TEST_F(FetchEngineTest, FetchPageReturnsSinglePage) {
    EXPECT_CALL(transport, get(_, HasParam("limit", "2"), _)).WillOnce(Return(ok(klinesBody({0, kHalfHour}))));
    core::CancellationToken token;
    const core::PageRequest page{"BTCUSDT", "30m", 0, 10 * kHalfHour, 2};

    data::FetchResult result = engine.fetchPage(page, data::RetryPolicy{}, token);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.candles().size(), 2u);
}

// --- Properties against a fake exchange that honours the query window ---

namespace {

std::vector<core::Millis> halfHourlyWithGap() {
    std::vector<core::Millis> times;
    for (core::Millis i = 0; i < 60; ++i) {
        if (i >= 20 && i < 26) {
            continue; // upstream outage, passed through as a gap
        }
        times.push_back(i * kHalfHour);
    }
    return times;
}

} // namespace

TEST(FetchEnginePropertyTest, OutputIsStrictlyIncreasingAndInsideWindow) {
    FakeKlineServer server(halfHourlyWithGap());
    RecordingSleeper sleeper;
    data::FetchEngine engine(server, sleeper);

    for (int limit : {1, 4, 7, 1000}) {
        const core::Millis start = 3 * kHalfHour + 17;
        const core::Millis end = 51 * kHalfHour;
        data::FetchResult result = engine.fetch(makeRequest(start, end, limit));

        ASSERT_TRUE(result.ok());
        const auto& candles = result.candles();
        ASSERT_FALSE(candles.empty());
        EXPECT_GE(candles.front().open_time_ms, start);
        EXPECT_LT(candles.back().open_time_ms, end);
        for (std::size_t i = 1; i < candles.size(); ++i) {
            EXPECT_LT(candles[i - 1].open_time_ms, candles[i].open_time_ms);
        }
        EXPECT_EQ(candles.size(), 41u) << "limit " << limit;
    }
}

TEST(FetchEnginePropertyTest, SplitFetchConcatenatesToSingleFetch) {
    FakeKlineServer server(halfHourlyWithGap());
    RecordingSleeper sleeper;
    data::FetchEngine engine(server, sleeper);
    const core::Millis start = 0;
    const core::Millis end = 60 * kHalfHour;

    data::FetchResult whole = engine.fetch(makeRequest(start, end, 7));
    ASSERT_TRUE(whole.ok());

    for (core::Millis mid : {kHalfHour, 10 * kHalfHour, 10 * kHalfHour + 1, 22 * kHalfHour, 59 * kHalfHour}) {
        data::FetchResult left = engine.fetch(makeRequest(start, mid, 7));
        data::FetchResult right = engine.fetch(makeRequest(mid, end, 7));
        ASSERT_TRUE(left.ok());
        ASSERT_TRUE(right.ok());

        core::TimeSeries<core::Candle> joined = left.candles();
        joined.insert(joined.end(), right.candles().begin(), right.candles().end());
        EXPECT_EQ(joined, whole.candles()) << "split at " << mid;
    }
}
