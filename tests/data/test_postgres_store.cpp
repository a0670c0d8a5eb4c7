// test_postgres_store.cpp
#include <gtest/gtest.h>
#include <cstdlib>
#include "../test_utils.hpp"
#include "finpipe/data/postgres_store.hpp"

using namespace finpipe;
using namespace finpipe::testing;

class PostgresStoreTest : public TestBase {};

TEST_F(PostgresStoreTest, OperationsBeforeConnectFail) {
    PostgresStore store("postgresql://localhost/finpipe_unused");
    EXPECT_FALSE(store.is_connected());
    EXPECT_EQ(store.backend_name(), "postgres");

    auto symbols = store.list_symbols();
    ASSERT_TRUE(symbols.is_error());
    EXPECT_EQ(symbols.error()->code(), ErrorCode::NOT_INITIALIZED);
}

// Runs against a live database only when FINPIPE_TEST_PG holds a connection string
class LivePostgresStoreTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        const char* url = std::getenv("FINPIPE_TEST_PG");
        if (url == nullptr || *url == '\0') {
            GTEST_SKIP() << "FINPIPE_TEST_PG not set";
        }
        store = std::make_unique<PostgresStore>(url, 2);
        auto migrated = store->migrate();
        ASSERT_TRUE(migrated.is_ok()) << migrated.error()->what();

        SymbolInfo info;
        info.symbol = kTicker;
        ASSERT_TRUE(store->upsert_symbols({info}).is_ok());
    }

    static constexpr const char* kTicker = "ZZFPTEST";
    std::unique_ptr<PostgresStore> store;
};

TEST_F(LivePostgresStoreTest, MigrateIsIdempotent) {
    auto first = store->migrate();
    auto second = store->migrate();
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value(), second.value());
}

TEST_F(LivePostgresStoreTest, LastWriterWinsPerDay) {
    Timestamp date = day("2024-01-02");
    ASSERT_TRUE(
        store->upsert_price_bars({PriceBar(kTicker, date, 185.0, 186.0, 184.0, 185.0, 1e6)})
            .is_ok());
    ASSERT_TRUE(
        store->upsert_price_bars({PriceBar(kTicker, date, 185.0, 187.0, 184.0, 186.5, 2e6)})
            .is_ok());

    DateRange range;
    range.start = date;
    range.end = date;
    auto history = store->price_history(kTicker, range);
    ASSERT_TRUE(history.is_ok());
    ASSERT_EQ(history.value().size(), 1u);
    EXPECT_DOUBLE_EQ(history.value()[0].close, 186.5);
}

TEST_F(LivePostgresStoreTest, UnknownSymbolIsConstraintViolation) {
    auto result = store->upsert_price_bars(
        {PriceBar("ZZNOSUCH", day("2024-01-02"), 1.0, 1.0, 1.0, 1.0, 1.0)});
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::CONSTRAINT_VIOLATION);
}

TEST_F(LivePostgresStoreTest, AlertLifecycle) {
    Alert alert;
    alert.symbol = kTicker;
    alert.target_price = 190.0;
    alert.created_at = day("2024-01-02");
    auto created = store->create_alert(alert);
    ASSERT_TRUE(created.is_ok()) << created.error()->what();

    ASSERT_TRUE(store->mark_alert_triggered(created.value().id).is_ok());
    auto active_alerts = store->list_alerts(true);
    for (const auto& active : active_alerts.value()) {
        EXPECT_NE(active.id, created.value().id);
    }
    ASSERT_TRUE(store->delete_alert(created.value().id).is_ok());
    EXPECT_EQ(store->delete_alert(created.value().id).error()->code(),
              ErrorCode::DATA_NOT_FOUND);
}

TEST_F(LivePostgresStoreTest, IndicatorAlertLifecycle) {
    IndicatorAlert alert;
    alert.symbol = kTicker;
    alert.indicator = "RSI_14";
    alert.condition = IndicatorAlertCondition::CROSSES_ABOVE;
    alert.threshold = 70.0;
    alert.created_at = day("2024-01-02");
    auto created = store->create_indicator_alert(alert);
    ASSERT_TRUE(created.is_ok()) << created.error()->what();
    const int64_t id = created.value().id;
    EXPECT_FALSE(created.value().secondary_indicator.has_value());
    EXPECT_FALSE(created.value().last_value.has_value());

    ASSERT_TRUE(store->update_indicator_alert_value(id, 65.0).is_ok());
    ASSERT_TRUE(store->mark_indicator_alert_triggered(id).is_ok());
    auto active_indicator_alerts = store->list_indicator_alerts(true);
    for (const auto& active : active_indicator_alerts.value()) {
        EXPECT_NE(active.id, id);
    }
    ASSERT_TRUE(store->delete_indicator_alert(id).is_ok());
    EXPECT_EQ(store->delete_indicator_alert(id).error()->code(), ErrorCode::DATA_NOT_FOUND);
}
