// test_source_adapter.cpp
#include <gtest/gtest.h>
#include "../test_utils.hpp"
#include "finpipe/core/state_manager.hpp"
#include "finpipe/data/in_memory_store.hpp"
#include "finpipe/ingest/yahoo_eod_adapter.hpp"
#include "finpipe/ingest/yahoo_intraday_adapter.hpp"

using namespace finpipe;
using namespace finpipe::testing;

class SourceAdapterTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        clock = std::make_shared<ManualClock>(day("2024-01-05") + std::chrono::hours(21));
        transport = std::make_shared<FakeTransport>();
        store = std::make_shared<InMemoryStore>();
        ASSERT_TRUE(store->migrate().is_ok());
        limiter = std::make_shared<RateLimiter>(clock, store);
    }

    std::unique_ptr<YahooEodAdapter> eod(int quota, int batch_size) {
        SourceConfig config = PipelineConfig::defaults().sources.at("yahoo_eod");
        config.quota = quota;
        config.window_seconds = 3600;
        config.batch_size = batch_size;
        limiter->configure(config);
        return std::make_unique<YahooEodAdapter>(config, transport, limiter, clock);
    }

    void respond_ok(const std::string& ticker, double close) {
        transport->respond("/chart/" + ticker + "?", 200,
                           yahoo_chart_body({1704205800, 1704292200}, {close, close + 1.0}));
    }

    std::shared_ptr<ManualClock> clock;
    std::shared_ptr<FakeTransport> transport;
    std::shared_ptr<InMemoryStore> store;
    std::shared_ptr<RateLimiter> limiter;
};

TEST_F(SourceAdapterTest, BuildsChartUrlsPerRange) {
    respond_ok("AAPL", 185.0);
    auto adapter = eod(0, 5);

    adapter->fetch({"AAPL"}, FetchRange::COMPACT);
    adapter->fetch({"AAPL"}, FetchRange::FULL);
    auto requests = transport->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0],
              "https://query1.finance.yahoo.com/v8/finance/chart/AAPL?interval=1d&range=3mo");
    EXPECT_NE(requests[1].find("range=max"), std::string::npos);
}

TEST_F(SourceAdapterTest, FailuresAreIsolatedPerSymbol) {
    respond_ok("AAPL", 185.0);
    transport->respond("/chart/ZZZZ?", 200, yahoo_not_found_body());
    transport->respond("/chart/MSFT?", 503, "");
    transport->fail("/chart/NVDA?", ErrorCode::TIMEOUT_ERROR);
    auto adapter = eod(0, 10);

    auto result = adapter->fetch({"aapl", "ZZZZ", "MSFT", "NVDA", "BAD$", "AAPL"},
                                 FetchRange::COMPACT);
    EXPECT_EQ(result.outcomes.size(), 5u);
    EXPECT_EQ(result.succeeded(), 1u);
    EXPECT_EQ(result.failed(), 4u);
    EXPECT_EQ(result.succeeded_symbols(), std::vector<std::string>({"AAPL"}));
    EXPECT_EQ(result.outcome("ZZZZ")->error, NOT_FOUND);
    EXPECT_EQ(result.outcome("MSFT")->error, ErrorCode::SOURCE_UNAVAILABLE);
    EXPECT_EQ(result.outcome("NVDA")->error, ErrorCode::SOURCE_UNAVAILABLE);
    EXPECT_EQ(result.outcome("NVDA")->message.rfind("timeout", 0), 0u);
    EXPECT_EQ(result.outcome("BAD$")->error, ErrorCode::INVALID_ARGUMENT);
    ASSERT_EQ(result.batches.size(), 1u);
    EXPECT_EQ(result.batches[0].status, BatchStatus::PARTIAL);

    // Only the de-duplicated valid tickers went out, and all of them were audited
    EXPECT_EQ(transport->requests().size(), 4u);
    EXPECT_EQ(store->count_api_calls("yahoo_eod", day("2024-01-01"), false).value(), 4u);
    EXPECT_EQ(store->count_api_calls("yahoo_eod", day("2024-01-01"), true).value(), 1u);

    ASSERT_EQ(result.records.bars.size(), 2u);
    EXPECT_EQ(result.records.bars[0].date, day("2024-01-02"));

    EXPECT_NE(result.summary().find("Fetched 1/5 symbols"), std::string::npos);
}

TEST_F(SourceAdapterTest, ShortGrantShrinksBatchAndStopsFetch) {
    for (const char* ticker : {"AAPL", "MSFT", "NVDA", "GOOG", "AMZN"}) {
        respond_ok(ticker, 100.0);
    }
    auto adapter = eod(3, 2);

    auto result = adapter->fetch({"AAPL", "MSFT", "NVDA", "GOOG", "AMZN"}, FetchRange::COMPACT);
    EXPECT_TRUE(result.quota_exhausted);
    EXPECT_EQ(result.retry_after, std::chrono::milliseconds(3600000));
    ASSERT_EQ(result.batches.size(), 4u);
    EXPECT_EQ(result.batches[0].status, BatchStatus::COMPLETED);
    EXPECT_EQ(result.batches[1].status, BatchStatus::COMPLETED);
    EXPECT_EQ(result.batches[1].symbols, std::vector<std::string>({"NVDA"}));
    EXPECT_EQ(result.batches[2].status, BatchStatus::DENIED);
    EXPECT_EQ(result.batches[2].symbols, std::vector<std::string>({"GOOG"}));
    EXPECT_EQ(result.batches[3].status, BatchStatus::SKIPPED);

    EXPECT_EQ(result.succeeded(), 3u);
    EXPECT_EQ(result.outcome("GOOG")->error, ErrorCode::QUOTA_EXCEEDED);
    EXPECT_EQ(result.outcome("AMZN")->error, ErrorCode::QUOTA_EXCEEDED);
    EXPECT_EQ(transport->requests().size(), 3u);
    EXPECT_NE(result.summary().find("quota exhausted"), std::string::npos);
}

TEST_F(SourceAdapterTest, BatchLargerThanQuotaStillFetches) {
    respond_ok("AAPL", 185.0);
    respond_ok("MSFT", 400.0);
    respond_ok("NVDA", 500.0);
    auto adapter = eod(2, 5);

    auto first = adapter->fetch({"AAPL", "MSFT", "NVDA"}, FetchRange::COMPACT);
    EXPECT_EQ(first.succeeded(), 2u);
    EXPECT_TRUE(first.quota_exhausted);
    EXPECT_EQ(first.outcome("NVDA")->error, ErrorCode::QUOTA_EXCEEDED);
    EXPECT_EQ(transport->requests().size(), 2u);

    clock->advance(std::chrono::seconds(3601));
    auto second = adapter->fetch({"AAPL", "MSFT", "NVDA"}, FetchRange::COMPACT);
    EXPECT_EQ(second.succeeded(), 2u);
    EXPECT_EQ(transport->requests().size(), 4u);
}

TEST_F(SourceAdapterTest, EmptyWindowDeniesWholeBatch) {
    respond_ok("AAPL", 185.0);
    auto adapter = eod(1, 1);
    ASSERT_EQ(adapter->fetch({"AAPL"}, FetchRange::COMPACT).succeeded(), 1u);

    auto denied = adapter->fetch({"MSFT", "NVDA"}, FetchRange::COMPACT);
    ASSERT_EQ(denied.batches.size(), 2u);
    EXPECT_EQ(denied.batches[0].status, BatchStatus::DENIED);
    EXPECT_EQ(denied.batches[1].status, BatchStatus::SKIPPED);
    EXPECT_EQ(transport->requests().size(), 1u);
}

TEST_F(SourceAdapterTest, QuotaSpansSuccessiveFetches) {
    respond_ok("AAPL", 185.0);
    respond_ok("MSFT", 400.0);
    auto adapter = eod(2, 1);

    auto first = adapter->fetch({"AAPL", "MSFT"}, FetchRange::COMPACT);
    EXPECT_EQ(first.succeeded(), 2u);
    auto second = adapter->fetch({"AAPL"}, FetchRange::COMPACT);
    EXPECT_TRUE(second.quota_exhausted);
    EXPECT_EQ(transport->requests().size(), 2u);
}

TEST_F(SourceAdapterTest, SinkFailureMarksBatchFailed) {
    respond_ok("AAPL", 185.0);
    auto adapter = eod(0, 5);

    auto result = adapter->fetch({"AAPL"}, FetchRange::COMPACT, [](const FetchedRecords&) {
        return make_error<void>(ErrorCode::DATABASE_ERROR, "disk full", "test");
    });
    EXPECT_EQ(result.succeeded(), 0u);
    EXPECT_EQ(result.outcome("AAPL")->error, ErrorCode::DATABASE_ERROR);
    EXPECT_EQ(result.batches[0].status, BatchStatus::FAILED);
    EXPECT_TRUE(result.records.empty());
}

TEST_F(SourceAdapterTest, SinkReceivesEachBatch) {
    respond_ok("AAPL", 185.0);
    respond_ok("MSFT", 400.0);
    auto adapter = eod(0, 1);

    size_t calls = 0;
    size_t bars = 0;
    auto result = adapter->fetch({"AAPL", "MSFT"}, FetchRange::COMPACT,
                                 [&](const FetchedRecords& records) {
                                     ++calls;
                                     bars += records.bars.size();
                                     return Result<void>();
                                 });
    EXPECT_EQ(calls, 2u);
    EXPECT_EQ(bars, 4u);
    EXPECT_EQ(result.succeeded(), 2u);
    EXPECT_TRUE(result.records.empty());
}

TEST_F(SourceAdapterTest, FetchPeriodValidatesBeforeRequesting) {
    respond_ok("AAPL", 185.0);
    auto adapter = eod(0, 5);

    auto rejected = adapter->fetch_period({"AAPL"}, "7y");
    EXPECT_EQ(rejected.outcome("AAPL")->error, ErrorCode::INVALID_ARGUMENT);
    EXPECT_TRUE(transport->requests().empty());

    auto accepted = adapter->fetch_period({"AAPL"}, "1y");
    EXPECT_EQ(accepted.succeeded(), 1u);
    EXPECT_NE(transport->requests()[0].find("range=1y"), std::string::npos);
}

TEST_F(SourceAdapterTest, IntradayBuildsTodaysBar) {
    SourceConfig config = PipelineConfig::defaults().sources.at("yahoo_intraday");
    config.quota = 0;
    limiter->configure(config);
    YahooIntradayAdapter adapter(config, transport, limiter, clock);

    // Last point of the previous session, then two five-minute points on 2024-01-02
    transport->respond("/chart/AAPL?", 200,
                       yahoo_chart_body({1704139200, 1704205800, 1704206100}, {180.0, 185.0, 187.0}));

    auto result = adapter.fetch({"AAPL"}, FetchRange::COMPACT);
    ASSERT_EQ(result.succeeded(), 1u);
    EXPECT_NE(transport->requests()[0].find("interval=5m"), std::string::npos);
    ASSERT_EQ(result.records.bars.size(), 1u);

    const PriceBar& bar = result.records.bars[0];
    EXPECT_EQ(bar.date, day("2024-01-02"));
    EXPECT_DOUBLE_EQ(bar.open, 185.0);
    EXPECT_DOUBLE_EQ(bar.high, 188.0);
    EXPECT_DOUBLE_EQ(bar.low, 184.0);
    EXPECT_DOUBLE_EQ(bar.close, 187.0);
    EXPECT_DOUBLE_EQ(bar.volume, 2000.0);
    EXPECT_EQ(bar.source, "yahoo_intraday");
}

TEST_F(SourceAdapterTest, ReportsActivityToStateManager) {
    respond_ok("AAPL", 185.0);
    std::string id;
    {
        auto adapter = eod(0, 5);
        auto ids = StateManager::instance().get_components_by_type(ComponentType::SOURCE_ADAPTER);
        ASSERT_EQ(ids.size(), 1u);
        id = ids[0];

        adapter->fetch({"AAPL", "MSFT"}, FetchRange::COMPACT);
        auto info = StateManager::instance().get_state(id);
        ASSERT_TRUE(info.is_ok());
        EXPECT_EQ(info.value().state, ComponentState::RUNNING);
        EXPECT_DOUBLE_EQ(info.value().metrics.at("requests"), 2.0);
        EXPECT_DOUBLE_EQ(info.value().metrics.at("succeeded"), 1.0);
    }
    EXPECT_TRUE(StateManager::instance().get_state(id).is_error());
}
