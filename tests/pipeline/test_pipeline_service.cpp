// test_pipeline_service.cpp
#include <gtest/gtest.h>
#include <cmath>
#include "pipeline_test_fixture.hpp"

using namespace finpipe;
using namespace finpipe::testing;

class PipelineServiceTest : public PipelineTestBase {};

TEST_F(PipelineServiceTest, FetchPricesStoresBarsAndIndicators) {
    respond_chart("AAPL", 185.0, 186.5);
    capture({PipelineEventType::PRICES_UPSERTED, PipelineEventType::INDICATORS_RECOMPUTED});

    CommandResult result = service().fetch_prices({"aapl"});
    EXPECT_TRUE(result.success) << result.message;
    EXPECT_NE(result.message.find("Fetched 1/1 symbols"), std::string::npos);

    // Tickers absent from the catalog get a minimal row
    EXPECT_TRUE(store->get_symbol("AAPL").is_ok());

    auto history = service().get_price_history("AAPL");
    ASSERT_TRUE(history.success);
    ASSERT_EQ(history.data.size(), 2u);
    EXPECT_DOUBLE_EQ(history.data[1].close, 186.5);

    auto sma = service().get_indicator_history("AAPL", "SMA_2");
    ASSERT_TRUE(sma.success) << sma.message;
    ASSERT_EQ(sma.data.size(), 1u);
    EXPECT_DOUBLE_EQ(sma.data[0].value, 185.75);

    // Two bars are not enough for RSI(14)
    EXPECT_FALSE(service().get_indicator_history("AAPL", "RSI_14").success);

    ASSERT_EQ(events().size(), 2u);
    EXPECT_EQ(events()[0].type, PipelineEventType::PRICES_UPSERTED);
    EXPECT_EQ(events()[1].type, PipelineEventType::INDICATORS_RECOMPUTED);
}

TEST_F(PipelineServiceTest, RefetchOverwritesSameDay) {
    respond_chart("AAPL", 185.0, 185.0);
    ASSERT_TRUE(service().fetch_prices({"AAPL"}).success);
    respond_chart("AAPL", 185.0, 186.5);
    ASSERT_TRUE(service().fetch_prices({"AAPL"}).success);

    auto history = service().get_price_history("AAPL");
    ASSERT_EQ(history.data.size(), 2u);
    EXPECT_DOUBLE_EQ(history.data[1].close, 186.5);
}

TEST_F(PipelineServiceTest, FetchPricesReportsFailures) {
    respond_chart("AAPL", 185.0, 186.5);
    transport->respond("/chart/ZZZZ?", 200, yahoo_not_found_body());

    CommandResult result = service().fetch_prices({"AAPL", "ZZZZ", "BAD$"});
    EXPECT_TRUE(result.success);
    EXPECT_NE(result.message.find("Fetched 1/2 symbols"), std::string::npos);
    EXPECT_NE(result.message.find("ZZZZ"), std::string::npos);
    EXPECT_NE(result.message.find("Rejected: BAD$"), std::string::npos);

    CommandResult none = service().fetch_prices({"ZZZZ"});
    EXPECT_FALSE(none.success);

    // Tickers that returned nothing never enter the catalog
    auto zzzz = store->get_symbol("ZZZZ");
    ASSERT_TRUE(zzzz.is_error());
    EXPECT_EQ(zzzz.error()->code(), ErrorCode::DATA_NOT_FOUND);
    EXPECT_TRUE(store->get_symbol("AAPL").is_ok());

    CommandResult empty = service().fetch_prices({});
    EXPECT_FALSE(empty.success);
}

TEST_F(PipelineServiceTest, FetchPricesAcceptsProviderPeriods) {
    respond_chart("AAPL", 185.0, 186.5);
    EXPECT_TRUE(service().fetch_prices({"AAPL"}, "1y").success);
    EXPECT_NE(transport->requests().back().find("range=1y"), std::string::npos);

    CommandResult bad = service().fetch_prices({"AAPL"}, "7y");
    EXPECT_FALSE(bad.success);
    EXPECT_NE(bad.message.find("Unsupported period"), std::string::npos);
}

TEST_F(PipelineServiceTest, QuotaExhaustionIsReportedNotThrown) {
    config.sources["yahoo_eod"].quota = 1;
    respond_chart("AAPL", 185.0, 186.5);
    respond_chart("MSFT", 400.0, 410.0);
    capture({PipelineEventType::QUOTA_EXCEEDED});

    CommandResult result = service().fetch_prices({"AAPL", "MSFT"});
    EXPECT_TRUE(result.success);
    EXPECT_NE(result.message.find("quota exhausted"), std::string::npos);
    EXPECT_EQ(transport->requests().size(), 1u);
    ASSERT_EQ(events().size(), 1u);

    EXPECT_TRUE(store->get_symbol("MSFT").is_error());

    auto usage = service().get_api_usage("yahoo_eod");
    ASSERT_TRUE(usage.success);
    EXPECT_EQ(usage.data.used, 1);
    EXPECT_EQ(usage.data.quota, 1);
    EXPECT_FALSE(service().get_api_usage("alpha_vantage").success);
}

TEST_F(PipelineServiceTest, AlertsFireAfterIngest) {
    add_symbol("AAPL");
    CommandResult created = service().create_alert("aapl", 186.0, "above");
    ASSERT_TRUE(created.success) << created.message;

    respond_chart("AAPL", 185.0, 186.5);
    CommandResult fetched = service().fetch_prices({"AAPL"});
    EXPECT_NE(fetched.message.find("1 alert(s) triggered"), std::string::npos);

    auto alerts = service().list_alerts();
    ASSERT_EQ(alerts.data.size(), 1u);
    EXPECT_TRUE(alerts.data[0].triggered);
    EXPECT_TRUE(service().list_alerts(true).data.empty());
}

TEST_F(PipelineServiceTest, CheckAlertsUsesCachedPrices) {
    respond_chart("MSFT", 400.0, 410.0);
    ASSERT_TRUE(service().fetch_prices({"MSFT"}).success);
    ASSERT_TRUE(service().create_alert("MSFT", 420.0, "below").success);
    ASSERT_TRUE(service().create_alert("MSFT", 500.0, "above").success);
    transport->clear_requests();

    auto checked = service().check_alerts();
    ASSERT_TRUE(checked.success);
    ASSERT_EQ(checked.data.size(), 1u);
    EXPECT_DOUBLE_EQ(checked.data[0].target_price, 420.0);
    EXPECT_TRUE(transport->requests().empty());
}

TEST_F(PipelineServiceTest, CreateAlertValidation) {
    add_symbol("AAPL");
    EXPECT_FALSE(service().create_alert("AAPL", 190.0, "sideways").success);
    EXPECT_FALSE(service().create_alert("AAPL", 0.0, "above").success);
    EXPECT_FALSE(service().create_alert("AA$L", 190.0, "above").success);

    CommandResult unknown = service().create_alert("IBM", 190.0, "above");
    EXPECT_FALSE(unknown.success);
    EXPECT_NE(unknown.message.find("unknown symbol"), std::string::npos);

    EXPECT_FALSE(service().delete_alert(42).success);
}

TEST_F(PipelineServiceTest, IndicatorAlertsFireAfterIngest) {
    add_symbol("AAPL");
    capture({PipelineEventType::INDICATOR_ALERT_TRIGGERED});
    CommandResult close = service().add_indicator_alert("aapl", "threshold", "close",
                                                        "crosses_above", 186.0);
    ASSERT_TRUE(close.success) << close.message;
    CommandResult sma = service().add_indicator_alert("AAPL", "threshold", " sma_2 ",
                                                      "crosses_above", 100.0);
    ASSERT_TRUE(sma.success) << sma.message;

    respond_chart("AAPL", 185.0, 186.5);
    CommandResult fetched = service().fetch_prices({"AAPL"});
    EXPECT_NE(fetched.message.find("1 indicator alert(s) triggered"), std::string::npos)
        << fetched.message;

    auto alerts = service().list_indicator_alerts();
    ASSERT_EQ(alerts.data.size(), 2u);
    EXPECT_EQ(alerts.data[0].indicator, "CLOSE");
    EXPECT_TRUE(alerts.data[0].triggered);
    // A single SMA point has nothing to cross from, so only the value is remembered
    EXPECT_EQ(alerts.data[1].indicator, "SMA_2");
    EXPECT_FALSE(alerts.data[1].triggered);
    ASSERT_TRUE(alerts.data[1].last_value.has_value());
    EXPECT_DOUBLE_EQ(*alerts.data[1].last_value, 185.75);

    ASSERT_EQ(events().size(), 1u);
    EXPECT_EQ(events()[0].symbol, "AAPL");
    EXPECT_EQ(events()[0].string_fields.at("indicator"), "CLOSE");
}

TEST_F(PipelineServiceTest, CheckIndicatorAlertsUsesStoredSeries) {
    respond_chart("MSFT", 400.0, 410.0);
    ASSERT_TRUE(service().fetch_prices({"MSFT"}).success);
    ASSERT_TRUE(
        service().add_indicator_alert("MSFT", "threshold", "CLOSE", "crosses_above", 405.0).success);
    transport->clear_requests();

    auto checked = service().check_indicator_alerts();
    ASSERT_TRUE(checked.success) << checked.message;
    ASSERT_EQ(checked.data.size(), 1u);
    EXPECT_DOUBLE_EQ(*checked.data[0].threshold, 405.0);
    EXPECT_NE(checked.message.find("1 triggered"), std::string::npos);
    EXPECT_TRUE(transport->requests().empty());
    EXPECT_TRUE(service().list_indicator_alerts(true).data.empty());
}

TEST_F(PipelineServiceTest, IndicatorAlertValidation) {
    add_symbol("AAPL");
    EXPECT_FALSE(service().add_indicator_alert("AAPL", "sideways", "RSI_14", "crosses_above",
                                               30.0).success);
    EXPECT_FALSE(
        service().add_indicator_alert("AAPL", "threshold", "RSI_14", "crosses_up", 30.0).success);
    EXPECT_FALSE(service().add_indicator_alert("AAPL", "threshold", "  ", "crosses_above", 30.0)
                     .success);
    EXPECT_FALSE(
        service().add_indicator_alert("AAPL", "threshold", "RSI_14", "crosses_above").success);
    EXPECT_FALSE(service().add_indicator_alert("AAPL", "crossover", "MACD_12_26",
                                               "bullish_crossover").success);
    EXPECT_FALSE(
        service().add_indicator_alert("IBM", "threshold", "RSI_14", "crosses_above", 30.0).success);

    CommandResult created = service().add_indicator_alert(
        "AAPL", "CROSSOVER", "macd_12_26", "Bullish_Crossover", std::nullopt,
        std::string("macd_signal_9"), std::string("MACD turned up"));
    ASSERT_TRUE(created.success) << created.message;
    auto alerts = service().list_indicator_alerts();
    ASSERT_EQ(alerts.data.size(), 1u);
    EXPECT_EQ(alerts.data[0].alert_type, IndicatorAlertType::CROSSOVER);
    EXPECT_EQ(*alerts.data[0].secondary_indicator, "MACD_SIGNAL_9");
    EXPECT_FALSE(alerts.data[0].threshold.has_value());
    EXPECT_EQ(*alerts.data[0].message, "MACD turned up");

    ASSERT_TRUE(service().delete_indicator_alert(alerts.data[0].id).success);
    EXPECT_FALSE(service().delete_indicator_alert(alerts.data[0].id).success);
}

TEST_F(PipelineServiceTest, PortfolioValuation) {
    respond_chart("AAPL", 185.0, 186.0);
    respond_chart("MSFT", 400.0, 410.0);
    ASSERT_TRUE(service().fetch_prices({"AAPL", "MSFT"}).success);
    add_symbol("NVDA");

    ASSERT_TRUE(service().add_position("AAPL", 10, 150.0, "long").success);
    ASSERT_TRUE(service().add_position("MSFT", 5, 400.0, "short", day("2024-01-02"),
                                       std::string("hedge"))
                    .success);
    ASSERT_TRUE(service().add_position("NVDA", 2, 500.0, "buy").success);
    EXPECT_FALSE(service().add_position("AAPL", 0, 150.0, "long").success);
    EXPECT_FALSE(service().add_position("AAPL", 1, 150.0, "flat").success);

    auto portfolio = service().get_portfolio();
    ASSERT_TRUE(portfolio.success);
    ASSERT_EQ(portfolio.data.positions.size(), 3u);

    const auto& aapl = portfolio.data.positions[0];
    EXPECT_DOUBLE_EQ(aapl.current_value, 1860.0);
    EXPECT_DOUBLE_EQ(aapl.pnl, 360.0);
    EXPECT_DOUBLE_EQ(aapl.pnl_percent, 24.0);

    const auto& msft = portfolio.data.positions[1];
    EXPECT_DOUBLE_EQ(msft.pnl, -50.0);
    EXPECT_EQ(msft.position.notes.value_or(""), "hedge");

    // No cached price: valued at entry
    const auto& nvda = portfolio.data.positions[2];
    EXPECT_DOUBLE_EQ(nvda.current_price, 500.0);
    EXPECT_DOUBLE_EQ(nvda.pnl, 0.0);

    EXPECT_DOUBLE_EQ(portfolio.data.total_cost, 1500.0 + 2000.0 + 1000.0);
    EXPECT_DOUBLE_EQ(portfolio.data.total_pnl, 310.0);

    int64_t id = service().list_positions().data[0].id;
    EXPECT_TRUE(service().delete_position(id).success);
    EXPECT_FALSE(service().delete_position(id).success);
}

TEST_F(PipelineServiceTest, WatchlistLifecycle) {
    add_symbol("AAPL");
    add_symbol("MSFT");
    ASSERT_TRUE(service().create_watchlist("Tech", std::string("large caps")).success);
    EXPECT_FALSE(service().create_watchlist("Tech").success);
    EXPECT_FALSE(service().create_watchlist("").success);

    auto lists = service().list_watchlists();
    ASSERT_EQ(lists.data.size(), 1u);
    int64_t id = lists.data[0].id;

    EXPECT_TRUE(service().add_to_watchlist(id, "msft").success);
    EXPECT_TRUE(service().add_to_watchlist(id, "AAPL").success);
    EXPECT_FALSE(service().add_to_watchlist(id, "IBM").success);
    EXPECT_EQ(service().get_watchlist_symbols(id).data,
              std::vector<std::string>({"AAPL", "MSFT"}));

    EXPECT_TRUE(service().remove_from_watchlist(id, "AAPL").success);
    EXPECT_TRUE(service().delete_watchlist(id).success);
    EXPECT_FALSE(service().get_watchlist_symbols(id).success);
    EXPECT_EQ(service().get_symbols().data.size(), 2u);
}

TEST_F(PipelineServiceTest, SymbolsCarryLatestQuote) {
    respond_chart("AAPL", 185.0, 186.5);
    add_symbol("MSFT");
    ASSERT_TRUE(service().fetch_prices({"AAPL"}).success);

    auto symbols = service().get_symbols();
    ASSERT_TRUE(symbols.success);
    ASSERT_EQ(symbols.data.size(), 2u);
    const SymbolQuote& aapl = symbols.data[0];
    EXPECT_EQ(aapl.info.symbol, "AAPL");
    ASSERT_TRUE(aapl.price.has_value());
    EXPECT_DOUBLE_EQ(*aapl.price, 186.5);
    ASSERT_TRUE(aapl.change_percent.has_value());
    EXPECT_NEAR(*aapl.change_percent, 1.5 / 185.0 * 100.0, 1e-9);
    EXPECT_EQ(*aapl.date, day("2024-01-03"));

    EXPECT_FALSE(symbols.data[1].price.has_value());
}

TEST_F(PipelineServiceTest, FavoritesToggle) {
    add_symbol("AAPL");
    auto on = service().toggle_favorite("aapl");
    ASSERT_TRUE(on.success);
    EXPECT_TRUE(on.data);
    auto off = service().toggle_favorite("AAPL");
    EXPECT_FALSE(off.data);
    EXPECT_FALSE(service().toggle_favorite("IBM").success);
}

TEST_F(PipelineServiceTest, CalculateIndicatorsOnDemand) {
    EXPECT_FALSE(service().calculate_indicators("AAPL").success);

    add_symbol("AAPL");
    ASSERT_TRUE(
        store->upsert_price_bars(make_bars("AAPL", "2024-01-01", linear_closes(20, 100.0, 1.0)))
            .is_ok());
    CommandResult result = service().calculate_indicators("AAPL");
    EXPECT_TRUE(result.success) << result.message;
    EXPECT_NE(result.message.find("Computed 2 series"), std::string::npos);

    auto rsi = service().get_indicator_history("AAPL", "RSI_14");
    ASSERT_TRUE(rsi.success);
    EXPECT_EQ(rsi.data.size(), 6u);
}

TEST_F(PipelineServiceTest, ExportPriceHistory) {
    respond_chart("AAPL", 185.0, 186.5);
    ASSERT_TRUE(service().fetch_prices({"AAPL"}).success);
    auto table = service().export_price_history("AAPL");
    ASSERT_TRUE(table.is_ok());
    EXPECT_EQ(table.value()->num_rows(), 2);
    EXPECT_TRUE(service().export_price_history("B@D").is_error());
}

TEST_F(PipelineServiceTest, MacroFetchAndQuery) {
    transport->respond("id=DFF", 200, "DATE,DFF\n2024-01-02,5.33\n2024-01-03,5.31\n");
    CommandResult fetched = service().fetch_macro({"DFF"});
    EXPECT_TRUE(fetched.success) << fetched.message;

    auto latest = service().get_macro_data();
    ASSERT_TRUE(latest.success);
    ASSERT_EQ(latest.data.size(), 1u);
    EXPECT_DOUBLE_EQ(latest.data[0].value, 5.31);
    EXPECT_EQ(service().get_macro_series("DFF").data.size(), 2u);
    EXPECT_FALSE(service().fetch_macro({"NOPE"}).success);
}

TEST_F(PipelineServiceTest, MissingSourceFailsCleanly) {
    config.sources.erase("yahoo_eod");
    CommandResult result = service().fetch_prices({"AAPL"});
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.message.find("not configured"), std::string::npos);
}

TEST_F(PipelineServiceTest, RefreshTouchesOnlyFavorites) {
    add_symbol("AAPL", true);
    add_symbol("MSFT");
    respond_chart("AAPL", 185.0, 186.5);
    respond_chart("MSFT", 400.0, 410.0);
    capture({PipelineEventType::REFRESH_COMPLETED});

    RefreshReport report = service().refresh_favorites(config.scheduler);
    EXPECT_TRUE(report.success) << report.message;
    EXPECT_EQ(report.symbols, std::vector<std::string>({"AAPL"}));
    EXPECT_EQ(report.succeeded, 1u);
    EXPECT_EQ(transport->request_count("/chart/AAPL?"), 1u);
    EXPECT_EQ(transport->request_count("/chart/MSFT?"), 0u);
    EXPECT_EQ(events().size(), 1u);
}

TEST_F(PipelineServiceTest, RefreshWithoutFavoritesIssuesNoRequests) {
    add_symbol("AAPL");
    RefreshReport report = service().refresh_favorites(config.scheduler);
    EXPECT_TRUE(report.success);
    EXPECT_EQ(report.message, "No favorited symbols");
    EXPECT_TRUE(transport->requests().empty());
}

TEST_F(PipelineServiceTest, RefreshRunsIntradayAndMacroWhenAsked) {
    add_symbol("AAPL", true);
    respond_chart("AAPL", 185.0, 186.5);
    transport->respond("id=UNRATE", 200, "DATE,UNRATE\n2023-12-01,3.7\n");

    SchedulerConfig scheduler = config.scheduler;
    scheduler.intraday = true;
    scheduler.run_macro = true;
    scheduler.macro_codes = {"UNRATE"};
    RefreshReport report = service().refresh_favorites(scheduler);

    EXPECT_EQ(transport->request_count("interval=1d"), 1u);
    EXPECT_EQ(transport->request_count("interval=5m"), 1u);
    EXPECT_EQ(transport->request_count("id=UNRATE"), 1u);
    EXPECT_NE(report.message.find("Intraday: "), std::string::npos);
    EXPECT_NE(report.message.find("Macro: "), std::string::npos);
    EXPECT_EQ(service().get_macro_series("UNRATE").data.size(), 1u);
}
