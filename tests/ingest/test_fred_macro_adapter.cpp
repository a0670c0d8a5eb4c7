// test_fred_macro_adapter.cpp
#include <gtest/gtest.h>
#include "../test_utils.hpp"
#include "finpipe/ingest/fred_macro_adapter.hpp"

using namespace finpipe;
using namespace finpipe::testing;

class FredMacroAdapterTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        clock = std::make_shared<ManualClock>(day("2024-01-05"));
        transport = std::make_shared<FakeTransport>();
        limiter = std::make_shared<RateLimiter>(clock, nullptr);

        config = PipelineConfig::defaults().sources.at("fred");
        limiter->configure(config);
        adapter = std::make_unique<FredMacroAdapter>(config, transport, limiter, clock);
    }

    std::shared_ptr<ManualClock> clock;
    std::shared_ptr<FakeTransport> transport;
    std::shared_ptr<RateLimiter> limiter;
    SourceConfig config;
    std::unique_ptr<FredMacroAdapter> adapter;
};

TEST_F(FredMacroAdapterTest, ParseCsvSkipsMissingValues) {
    auto rows = FredMacroAdapter::parse_csv(
        "UNRATE", "DATE,UNRATE\n2023-11-01,3.7\n2023-12-01,.\n2024-01-01,3.7\nbad,1\n");
    ASSERT_TRUE(rows.is_ok()) << rows.error()->what();
    ASSERT_EQ(rows.value().size(), 2u);
    EXPECT_EQ(rows.value()[0].indicator, "UNRATE");
    EXPECT_EQ(rows.value()[0].date, day("2023-11-01"));
    EXPECT_DOUBLE_EQ(rows.value()[0].value, 3.7);
    EXPECT_EQ(rows.value()[0].frequency, MacroFrequency::MONTHLY);
    EXPECT_EQ(rows.value()[0].source, "FRED");
}

TEST_F(FredMacroAdapterTest, ParseCsvWithoutObservations) {
    auto rows = FredMacroAdapter::parse_csv("DFF", "DATE,DFF\n2024-01-01,.\n");
    ASSERT_TRUE(rows.is_error());
    EXPECT_EQ(rows.error()->code(), NOT_FOUND);
}

TEST_F(FredMacroAdapterTest, FetchesCatalogCodes) {
    transport->respond("id=DFF", 200, "observation_date,DFF\n2024-01-02,5.33\n2024-01-03,5.31\n");
    transport->respond("id=GDP", 500, "");

    auto result = adapter->fetch({"dff", "GDP", "NOPE"}, FetchRange::COMPACT);
    ASSERT_EQ(result.outcomes.size(), 3u);

    const SymbolOutcome* unknown = result.outcome("NOPE");
    ASSERT_NE(unknown, nullptr);
    EXPECT_EQ(unknown->error, ErrorCode::INVALID_ARGUMENT);

    const SymbolOutcome* dff = result.outcome("DFF");
    ASSERT_NE(dff, nullptr);
    EXPECT_TRUE(dff->success);
    EXPECT_EQ(dff->records, 2u);

    const SymbolOutcome* gdp = result.outcome("GDP");
    ASSERT_NE(gdp, nullptr);
    EXPECT_EQ(gdp->error, ErrorCode::SOURCE_UNAVAILABLE);

    EXPECT_EQ(result.records.observations.size(), 2u);
    EXPECT_EQ(transport->request_count("fredgraph.csv"), 2u);
    EXPECT_EQ(transport->request_count("id=NOPE"), 0u);
}
