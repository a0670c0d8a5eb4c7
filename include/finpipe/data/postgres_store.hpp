// include/finpipe/data/postgres_store.hpp

#pragma once

#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include "finpipe/data/connection_pool.hpp"
#include "finpipe/data/time_series_store.hpp"

namespace finpipe {

/**
 * @brief PostgreSQL-backed store, all tables under the `finpipe` schema
 *
 * Every write is a single transaction, so a rejected batch leaves no partial rows.
 * Upserts use INSERT ... ON CONFLICT DO UPDATE, which gives row-level last-writer-wins on
 * the natural keys.
 */
class PostgresStore : public TimeSeriesStore {
public:
    PostgresStore(std::string connection_string, size_t pool_size = 4);
    ~PostgresStore() override;

    PostgresStore(const PostgresStore&) = delete;
    PostgresStore& operator=(const PostgresStore&) = delete;

    /**
     * @brief Open the connection pool and register with the StateManager
     */
    Result<void> connect();
    void disconnect();
    bool is_connected() const;

    /**
     * @brief Connects if needed, then applies pending migrations under an advisory lock
     */
    Result<int> migrate() override;
    std::string backend_name() const override {
        return "postgres";
    }

    Result<size_t> upsert_symbols(const std::vector<SymbolInfo>& symbols) override;
    Result<SymbolInfo> get_symbol(const std::string& symbol) const override;
    Result<std::vector<SymbolInfo>> list_symbols() const override;
    Result<void> set_favorite(const std::string& symbol, bool favorited) override;
    Result<bool> toggle_favorite(const std::string& symbol) override;
    Result<std::vector<std::string>> favorited_symbols() const override;
    Result<std::vector<std::string>> symbols_with_prices() const override;

    Result<size_t> upsert_price_bars(const std::vector<PriceBar>& bars) override;
    Result<LatestQuote> latest_price(const std::string& symbol) const override;
    Result<std::vector<PriceBar>> price_history(const std::string& symbol,
                                                const DateRange& range = {}) const override;

    Result<size_t> upsert_macro(const std::vector<MacroObservation>& observations) override;
    Result<std::vector<MacroObservation>> macro_series(const std::string& code) const override;
    Result<std::vector<std::string>> macro_codes() const override;
    Result<std::vector<MacroObservation>> latest_macro() const override;

    Result<void> replace_indicator_series(const IndicatorSeries& series) override;
    Result<IndicatorSeries> indicator_history(const std::string& symbol,
                                              const std::string& name) const override;
    Result<std::unordered_map<std::string, IndicatorPoint>> latest_indicators(
        const std::string& symbol) const override;

    Result<Alert> create_alert(const Alert& alert) override;
    Result<std::vector<Alert>> list_alerts(bool only_active = false) const override;
    Result<void> mark_alert_triggered(int64_t alert_id) override;
    Result<void> delete_alert(int64_t alert_id) override;

    Result<IndicatorAlert> create_indicator_alert(const IndicatorAlert& alert) override;
    Result<std::vector<IndicatorAlert>> list_indicator_alerts(
        bool only_active = false) const override;
    Result<void> mark_indicator_alert_triggered(int64_t alert_id) override;
    Result<void> update_indicator_alert_value(int64_t alert_id, double last_value) override;
    Result<void> delete_indicator_alert(int64_t alert_id) override;

    Result<Position> create_position(const Position& position) override;
    Result<std::vector<Position>> list_positions() const override;
    Result<void> delete_position(int64_t position_id) override;

    Result<Watchlist> create_watchlist(const Watchlist& watchlist) override;
    Result<std::vector<Watchlist>> list_watchlists() const override;
    Result<void> delete_watchlist(int64_t watchlist_id) override;
    Result<void> add_to_watchlist(int64_t watchlist_id, const std::string& symbol) override;
    Result<void> remove_from_watchlist(int64_t watchlist_id, const std::string& symbol) override;
    Result<std::vector<std::string>> watchlist_symbols(int64_t watchlist_id) const override;

    Result<void> record_api_call(const ApiCallRecord& record) override;
    Result<std::vector<ApiCallRecord>> api_calls_since(const std::string& source,
                                                       const Timestamp& since) const override;
    Result<size_t> count_api_calls(const std::string& source, const Timestamp& since,
                                   bool successful_only = false) const override;

private:
    /**
     * @brief Run `body` inside one transaction on a pooled connection
     * Commits only when the body succeeds; libpqxx exceptions become Result errors.
     */
    template <typename T, typename Func>
    Result<T> run_transaction(const std::string& operation, Func&& body) const;

    std::string connection_string_;
    size_t pool_size_;
    std::unique_ptr<ConnectionPool> pool_;
    std::string component_id_;
    mutable std::mutex mutex_;
};

}  // namespace finpipe
