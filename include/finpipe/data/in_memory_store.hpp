// include/finpipe/data/in_memory_store.hpp

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "finpipe/data/time_series_store.hpp"

namespace finpipe {

/**
 * @brief Process-local store, optionally persisted to a single JSON snapshot file
 *
 * Price rows are sharded per symbol: writers to different symbols only contend on the
 * shard table lookup, writers to the same symbol serialize on that symbol's shard.
 */
class InMemoryStore : public TimeSeriesStore {
public:
    /**
     * @param snapshot_path File loaded by migrate() and written by flush(); empty keeps
     * everything in memory only
     */
    explicit InMemoryStore(std::string snapshot_path = "");
    ~InMemoryStore() override = default;

    InMemoryStore(const InMemoryStore&) = delete;
    InMemoryStore& operator=(const InMemoryStore&) = delete;

    Result<int> migrate() override;
    std::string backend_name() const override {
        return "memory";
    }
    Result<void> flush() override;

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

    /**
     * @brief Serialize the whole store
     */
    nlohmann::json to_json() const;

    /**
     * @brief Replace the store contents with a snapshot, filling fields that older schema
     * versions lack with their defaults
     * @return The schema version the snapshot was written with
     */
    Result<int> load_json(const nlohmann::json& snapshot);

private:
    struct PriceShard {
        mutable std::mutex mutex;
        std::map<Timestamp, PriceBar> bars;
    };

    struct WatchlistRow {
        Watchlist info;
        std::set<std::string> members;
    };

    bool symbol_exists(const std::string& symbol) const;
    std::shared_ptr<PriceShard> find_shard(const std::string& symbol) const;
    std::shared_ptr<PriceShard> get_or_create_shard(const std::string& symbol);

    std::string snapshot_path_;
    int schema_version_{0};

    // Symbols, alerts, positions, watchlists
    mutable std::shared_mutex entities_mutex_;
    std::map<std::string, SymbolInfo> symbols_;
    std::map<int64_t, Alert> alerts_;
    std::map<int64_t, IndicatorAlert> indicator_alerts_;
    std::map<int64_t, Position> positions_;
    std::map<int64_t, WatchlistRow> watchlists_;
    int64_t next_alert_id_{1};
    int64_t next_indicator_alert_id_{1};
    int64_t next_position_id_{1};
    int64_t next_watchlist_id_{1};

    mutable std::shared_mutex shards_mutex_;
    std::unordered_map<std::string, std::shared_ptr<PriceShard>> price_shards_;

    mutable std::shared_mutex macro_mutex_;
    std::map<std::string, std::map<Timestamp, MacroObservation>> macro_;

    mutable std::shared_mutex indicator_mutex_;
    std::map<std::pair<std::string, std::string>, IndicatorSeries> indicators_;

    mutable std::mutex api_mutex_;
    std::vector<ApiCallRecord> api_calls_;

    // Serializes flush() and load against each other
    mutable std::mutex snapshot_mutex_;
};

}  // namespace finpipe
