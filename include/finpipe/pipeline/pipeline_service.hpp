// include/finpipe/pipeline/pipeline_service.hpp
#pragma once

#include <arrow/api.h>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "finpipe/alerts/alert_evaluator.hpp"
#include "finpipe/alerts/indicator_alert_evaluator.hpp"
#include "finpipe/config/pipeline_config.hpp"
#include "finpipe/core/clock.hpp"
#include "finpipe/core/error.hpp"
#include "finpipe/core/types.hpp"
#include "finpipe/data/event_bus.hpp"
#include "finpipe/data/time_series_store.hpp"
#include "finpipe/indicators/indicator_engine.hpp"
#include "finpipe/ingest/http_transport.hpp"
#include "finpipe/ingest/rate_limiter.hpp"
#include "finpipe/ingest/source_adapter.hpp"
#include "finpipe/pipeline/ingestion_lock.hpp"

namespace finpipe {

/**
 * @brief Uniform outcome of every mutating operation
 */
struct CommandResult {
    bool success{false};
    std::string message;

    static CommandResult ok(std::string message) {
        return CommandResult{true, std::move(message)};
    }
    static CommandResult fail(std::string message) {
        return CommandResult{false, std::move(message)};
    }
};

/**
 * @brief Outcome of a read operation together with the data read
 */
template <typename T>
struct QueryResult {
    bool success{false};
    std::string message;
    T data{};
};

struct SymbolQuote {
    SymbolInfo info;
    std::optional<Timestamp> date;
    std::optional<Price> price;
    std::optional<double> change_percent;
};

struct PositionValuation {
    Position position;
    Price current_price{0.0};
    double cost_basis{0.0};
    double current_value{0.0};
    double pnl{0.0};
    double pnl_percent{0.0};
};

struct PortfolioSummary {
    std::vector<PositionValuation> positions;
    double total_cost{0.0};
    double total_value{0.0};
    double total_pnl{0.0};
    double total_pnl_percent{0.0};
};

/**
 * @brief What one favorites refresh did
 */
struct RefreshReport {
    Timestamp started;
    Timestamp finished;
    std::vector<std::string> symbols;  // favorites at the start of the refresh
    size_t succeeded{0};
    size_t failed{0};
    size_t alerts_triggered{0};
    bool quota_exhausted{false};
    bool success{true};
    std::string message;
};

/**
 * @brief Entry point for the presentation layer and the refresh scheduler
 *
 * Every ingestion path holds the IngestionLock for its symbols from the first request
 * until the alerts for those symbols have been evaluated, so a manual fetch and a
 * scheduler tick never interleave on the same ticker.
 */
class PipelineService {
public:
    PipelineService(PipelineConfig config, std::shared_ptr<TimeSeriesStore> store,
                    std::shared_ptr<HttpTransport> transport, std::shared_ptr<const Clock> clock);

    QueryResult<std::vector<SymbolQuote>> get_symbols() const;

    /**
     * @param period "compact", "full" or a provider period string such as "1y"
     */
    CommandResult fetch_prices(const std::vector<std::string>& symbols,
                               const std::string& period = "compact");

    /**
     * @brief Rebuild today's bar for each symbol from intraday quotes
     */
    CommandResult fetch_intraday(const std::vector<std::string>& symbols);

    CommandResult fetch_macro(const std::vector<std::string>& codes);

    QueryResult<std::vector<PriceBar>> get_price_history(const std::string& symbol,
                                                         const DateRange& range = {}) const;

    Result<std::shared_ptr<arrow::Table>> export_price_history(const std::string& symbol,
                                                               const DateRange& range = {}) const;

    QueryResult<std::vector<IndicatorPoint>> get_indicator_history(const std::string& symbol,
                                                                   const std::string& name) const;

    CommandResult calculate_indicators(const std::string& symbol);

    QueryResult<bool> toggle_favorite(const std::string& symbol);

    CommandResult load_catalog(const std::string& path);

    CommandResult create_alert(const std::string& symbol, Price target_price,
                               const std::string& condition);
    QueryResult<std::vector<Alert>> list_alerts(bool only_active = false) const;
    CommandResult delete_alert(int64_t alert_id);

    /**
     * @brief Evaluate every active alert against the cached prices
     */
    QueryResult<std::vector<Alert>> check_alerts();

    /**
     * @brief Create an alert on a stored indicator series
     *
     * Series names are case-insensitive ("rsi_14", "MACD_12_26"); "CLOSE" names the stored
     * closes. crosses_above/crosses_below need a threshold, bullish_crossover and
     * bearish_crossover need a secondary series.
     */
    CommandResult add_indicator_alert(const std::string& symbol, const std::string& alert_type,
                                      const std::string& indicator, const std::string& condition,
                                      std::optional<double> threshold = std::nullopt,
                                      std::optional<std::string> secondary_indicator = std::nullopt,
                                      std::optional<std::string> message = std::nullopt);
    QueryResult<std::vector<IndicatorAlert>> list_indicator_alerts(bool only_active = false) const;
    CommandResult delete_indicator_alert(int64_t alert_id);

    /**
     * @brief Evaluate every active indicator alert against the stored series
     */
    QueryResult<std::vector<IndicatorAlert>> check_indicator_alerts();

    CommandResult add_position(const std::string& symbol, Quantity quantity, Price entry_price,
                               const std::string& side,
                               std::optional<Timestamp> entry_date = std::nullopt,
                               std::optional<std::string> notes = std::nullopt);
    QueryResult<std::vector<Position>> list_positions() const;
    CommandResult delete_position(int64_t position_id);
    QueryResult<PortfolioSummary> get_portfolio() const;

    CommandResult create_watchlist(const std::string& name,
                                   std::optional<std::string> description = std::nullopt);
    QueryResult<std::vector<Watchlist>> list_watchlists() const;
    CommandResult delete_watchlist(int64_t watchlist_id);
    CommandResult add_to_watchlist(int64_t watchlist_id, const std::string& symbol);
    CommandResult remove_from_watchlist(int64_t watchlist_id, const std::string& symbol);
    QueryResult<std::vector<std::string>> get_watchlist_symbols(int64_t watchlist_id) const;

    /**
     * @brief Latest observation of every cached macro series
     */
    QueryResult<std::vector<MacroObservation>> get_macro_data() const;
    QueryResult<std::vector<MacroObservation>> get_macro_series(const std::string& code) const;

    QueryResult<QuotaUsage> get_api_usage(const std::string& source) const;

    /**
     * @brief Refresh exactly the favorited symbols (plus intraday and macro when asked)
     *
     * An empty favorites set issues no requests.
     */
    RefreshReport refresh_favorites(const SchedulerConfig& scheduler);

    const PipelineConfig& config() const {
        return config_;
    }
    std::shared_ptr<TimeSeriesStore> store() const {
        return store_;
    }
    std::shared_ptr<RateLimiter> rate_limiter() const {
        return limiter_;
    }
    IngestionLock& ingestion_lock() {
        return lock_;
    }

private:
    struct PriceIngest {
        BatchResult batch;
        std::vector<std::string> rejected;  // "TICKER: reason" for tickers that failed validation
        size_t alerts_triggered{0};
        size_t indicator_alerts_triggered{0};
    };

    /**
     * @brief Fetch, upsert, recompute indicators and evaluate alerts for a symbol set
     * @param period Empty to use range, otherwise a provider period string
     */
    PriceIngest ingest_prices(SourceAdapter& adapter, const std::vector<std::string>& symbols,
                              FetchRange range, const std::string& period);

    Result<void> ensure_symbols(const std::vector<std::string>& symbols);
    std::string price_ingest_message(const PriceIngest& ingest) const;

    // Flush the store after a mutation, folding a persistence failure into the result
    CommandResult persisted(CommandResult result);

    void publish(PipelineEventType type, const std::string& symbol,
                 std::unordered_map<std::string, double> numeric = {}) const;

    PipelineConfig config_;
    std::vector<IndicatorSpec> indicator_specs_;
    std::shared_ptr<TimeSeriesStore> store_;
    std::shared_ptr<const Clock> clock_;
    std::shared_ptr<RateLimiter> limiter_;
    std::unique_ptr<SourceAdapter> eod_;
    std::unique_ptr<SourceAdapter> intraday_;
    std::unique_ptr<SourceAdapter> macro_;
    IndicatorEngine indicators_;
    AlertEvaluator alerts_;
    IndicatorAlertEvaluator indicator_alerts_;
    IngestionLock lock_;
};

}  // namespace finpipe
