// include/finpipe/data/time_series_store.hpp

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "finpipe/core/error.hpp"
#include "finpipe/core/types.hpp"

namespace finpipe {

/**
 * @brief Current additive schema version. Bumped whenever a column or table is added.
 */
constexpr int kSchemaVersion = 4;

/**
 * @brief Latest bar of a symbol together with the bar before it
 */
struct LatestQuote {
    PriceBar bar;
    std::optional<Price> previous_close;
};

/**
 * @brief Durable keyed storage for every persisted pipeline entity
 *
 * Implementations must give row-level last-writer-wins semantics on the natural keys
 * (symbol, date) and (indicator, date), must not block writers to different symbols on each
 * other, and must reject writes that would break referential constraints with
 * CONSTRAINT_VIOLATION.
 */
class TimeSeriesStore {
public:
    virtual ~TimeSeriesStore() = default;

    /**
     * @brief Apply additive schema migrations up to kSchemaVersion
     * @return The schema version in effect after migration
     */
    virtual Result<int> migrate() = 0;

    virtual std::string backend_name() const = 0;

    /**
     * @brief Make all accepted writes durable. Backends that commit per call do nothing.
     */
    virtual Result<void> flush() {
        return Result<void>();
    }

    // Symbols

    /**
     * @brief Insert new symbols or refresh metadata of existing ones
     * The favorited flag of existing rows is preserved.
     */
    virtual Result<size_t> upsert_symbols(const std::vector<SymbolInfo>& symbols) = 0;
    virtual Result<SymbolInfo> get_symbol(const std::string& symbol) const = 0;
    virtual Result<std::vector<SymbolInfo>> list_symbols() const = 0;
    virtual Result<void> set_favorite(const std::string& symbol, bool favorited) = 0;

    /**
     * @brief Flip the favorited flag
     * @return The new state
     */
    virtual Result<bool> toggle_favorite(const std::string& symbol) = 0;
    virtual Result<std::vector<std::string>> favorited_symbols() const = 0;
    virtual Result<std::vector<std::string>> symbols_with_prices() const = 0;

    // Prices

    /**
     * @brief Insert or replace bars keyed by (symbol, date)
     * Every bar must reference an existing symbol; otherwise nothing is written.
     * @return Number of rows written
     */
    virtual Result<size_t> upsert_price_bars(const std::vector<PriceBar>& bars) = 0;

    /**
     * @brief Most recent bar of a symbol, DATA_NOT_FOUND when none is cached
     */
    virtual Result<LatestQuote> latest_price(const std::string& symbol) const = 0;

    /**
     * @brief Bars ordered by ascending date
     */
    virtual Result<std::vector<PriceBar>> price_history(const std::string& symbol,
                                                        const DateRange& range = {}) const = 0;

    // Macro series

    virtual Result<size_t> upsert_macro(const std::vector<MacroObservation>& observations) = 0;
    virtual Result<std::vector<MacroObservation>> macro_series(const std::string& code) const = 0;
    virtual Result<std::vector<std::string>> macro_codes() const = 0;

    /**
     * @brief Latest observation per stored macro code
     */
    virtual Result<std::vector<MacroObservation>> latest_macro() const = 0;

    // Derived indicator series

    /**
     * @brief Replace the whole stored series for (symbol, name) in one step
     */
    virtual Result<void> replace_indicator_series(const IndicatorSeries& series) = 0;
    virtual Result<IndicatorSeries> indicator_history(const std::string& symbol,
                                                      const std::string& name) const = 0;

    /**
     * @brief Last value of every stored series of a symbol, keyed by series name
     */
    virtual Result<std::unordered_map<std::string, IndicatorPoint>> latest_indicators(
        const std::string& symbol) const = 0;

    // Alerts

    virtual Result<Alert> create_alert(const Alert& alert) = 0;
    virtual Result<std::vector<Alert>> list_alerts(bool only_active = false) const = 0;
    virtual Result<void> mark_alert_triggered(int64_t alert_id) = 0;
    virtual Result<void> delete_alert(int64_t alert_id) = 0;

    // Indicator alerts

    virtual Result<IndicatorAlert> create_indicator_alert(const IndicatorAlert& alert) = 0;
    virtual Result<std::vector<IndicatorAlert>> list_indicator_alerts(
        bool only_active = false) const = 0;
    virtual Result<void> mark_indicator_alert_triggered(int64_t alert_id) = 0;

    /**
     * @brief Remember the primary series value seen by the latest check
     */
    virtual Result<void> update_indicator_alert_value(int64_t alert_id, double last_value) = 0;
    virtual Result<void> delete_indicator_alert(int64_t alert_id) = 0;

    // Positions

    virtual Result<Position> create_position(const Position& position) = 0;
    virtual Result<std::vector<Position>> list_positions() const = 0;
    virtual Result<void> delete_position(int64_t position_id) = 0;

    // Watchlists

    /**
     * @brief CONSTRAINT_VIOLATION when the name is already taken
     */
    virtual Result<Watchlist> create_watchlist(const Watchlist& watchlist) = 0;
    virtual Result<std::vector<Watchlist>> list_watchlists() const = 0;

    /**
     * @brief Removes the watchlist and its membership rows; symbols are untouched
     */
    virtual Result<void> delete_watchlist(int64_t watchlist_id) = 0;
    virtual Result<void> add_to_watchlist(int64_t watchlist_id, const std::string& symbol) = 0;
    virtual Result<void> remove_from_watchlist(int64_t watchlist_id,
                                               const std::string& symbol) = 0;
    virtual Result<std::vector<std::string>> watchlist_symbols(int64_t watchlist_id) const = 0;

    // Provider call audit log

    virtual Result<void> record_api_call(const ApiCallRecord& record) = 0;

    /**
     * @brief Calls of a source at or after `since`, oldest first
     */
    virtual Result<std::vector<ApiCallRecord>> api_calls_since(const std::string& source,
                                                               const Timestamp& since) const = 0;

    virtual Result<size_t> count_api_calls(const std::string& source, const Timestamp& since,
                                           bool successful_only = false) const = 0;
};

/**
 * @brief Normalize a ticker to upper case and check its shape
 * @return INVALID_ARGUMENT when empty, longer than 20 characters or containing characters
 * outside [A-Za-z0-9._^=-]
 */
Result<std::string> normalize_symbol(const std::string& symbol);

}  // namespace finpipe
