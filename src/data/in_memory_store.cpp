// src/data/in_memory_store.cpp

#include "finpipe/data/in_memory_store.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include "finpipe/core/logger.hpp"
#include "finpipe/core/time_utils.hpp"

namespace finpipe {

namespace {

const char* kComponent = "InMemoryStore";

std::string ts_to_string(const Timestamp& ts) {
    return core::format_timestamp(ts);
}

Timestamp ts_from_json(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || !j.at(key).is_string()) {
        return Timestamp{};
    }
    auto parsed = core::parse_timestamp(j.at(key).get<std::string>());
    if (!parsed) {
        throw std::invalid_argument(std::string("Invalid timestamp in field ") + key);
    }
    return *parsed;
}

nlohmann::json symbol_to_json(const SymbolInfo& s) {
    return {{"symbol", s.symbol},     {"name", s.name},         {"sector", s.sector},
            {"industry", s.industry}, {"exchange", s.exchange}, {"currency", s.currency},
            {"country", s.country},   {"asset_class", s.asset_class},
            {"favorited", s.favorited}};
}

SymbolInfo symbol_from_json(const nlohmann::json& j) {
    SymbolInfo s;
    s.symbol = j.at("symbol").get<std::string>();
    s.name = j.value("name", "");
    s.sector = j.value("sector", "");
    s.industry = j.value("industry", "");
    s.exchange = j.value("exchange", "");
    s.currency = j.value("currency", "");
    s.country = j.value("country", "");
    s.asset_class = j.value("asset_class", "equity");
    s.favorited = j.value("favorited", false);
    return s;
}

nlohmann::json bar_to_json(const PriceBar& b) {
    return {{"symbol", b.symbol}, {"date", core::format_date(b.date)},
            {"open", b.open},     {"high", b.high},
            {"low", b.low},       {"close", b.close},
            {"volume", b.volume}, {"adjusted_close", b.adjusted_close},
            {"source", b.source}};
}

PriceBar bar_from_json(const nlohmann::json& j) {
    PriceBar b;
    b.symbol = j.at("symbol").get<std::string>();
    auto date = core::parse_date(j.at("date").get<std::string>());
    if (!date) {
        throw std::invalid_argument("Invalid bar date for " + b.symbol);
    }
    b.date = *date;
    b.open = j.at("open").get<double>();
    b.high = j.at("high").get<double>();
    b.low = j.at("low").get<double>();
    b.close = j.at("close").get<double>();
    b.volume = j.value("volume", 0.0);
    // Added in schema version 3
    b.adjusted_close = j.value("adjusted_close", b.close);
    b.source = j.value("source", "");
    return b;
}

nlohmann::json macro_to_json(const MacroObservation& m) {
    return {{"indicator", m.indicator},
            {"date", core::format_date(m.date)},
            {"value", m.value},
            {"frequency", macro_frequency_to_string(m.frequency)},
            {"source", m.source}};
}

MacroObservation macro_from_json(const nlohmann::json& j) {
    MacroObservation m;
    m.indicator = j.at("indicator").get<std::string>();
    auto date = core::parse_date(j.at("date").get<std::string>());
    if (!date) {
        throw std::invalid_argument("Invalid macro date for " + m.indicator);
    }
    m.date = *date;
    m.value = j.at("value").get<double>();
    m.frequency = macro_frequency_from_string(j.value("frequency", "daily"));
    m.source = j.value("source", "FRED");
    return m;
}

nlohmann::json alert_to_json(const Alert& a) {
    return {{"id", a.id},
            {"symbol", a.symbol},
            {"target_price", a.target_price},
            {"condition", alert_condition_to_string(a.condition)},
            {"triggered", a.triggered},
            {"created_at", ts_to_string(a.created_at)}};
}

Alert alert_from_json(const nlohmann::json& j) {
    Alert a;
    a.id = j.at("id").get<int64_t>();
    a.symbol = j.at("symbol").get<std::string>();
    a.target_price = j.at("target_price").get<double>();
    auto condition = alert_condition_from_string(j.value("condition", "above"));
    if (!condition) {
        throw std::invalid_argument("Invalid alert condition for alert " + std::to_string(a.id));
    }
    a.condition = *condition;
    a.triggered = j.value("triggered", false);
    a.created_at = ts_from_json(j, "created_at");
    return a;
}

template <typename V>
nlohmann::json optional_json(const std::optional<V>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

nlohmann::json indicator_alert_to_json(const IndicatorAlert& a) {
    return {{"id", a.id},
            {"symbol", a.symbol},
            {"alert_type", indicator_alert_type_to_string(a.alert_type)},
            {"indicator", a.indicator},
            {"secondary_indicator", optional_json(a.secondary_indicator)},
            {"condition", indicator_alert_condition_to_string(a.condition)},
            {"threshold", optional_json(a.threshold)},
            {"triggered", a.triggered},
            {"last_value", optional_json(a.last_value)},
            {"message", optional_json(a.message)},
            {"created_at", ts_to_string(a.created_at)}};
}

IndicatorAlert indicator_alert_from_json(const nlohmann::json& j) {
    IndicatorAlert a;
    a.id = j.at("id").get<int64_t>();
    a.symbol = j.at("symbol").get<std::string>();
    a.indicator = j.at("indicator").get<std::string>();
    auto type = indicator_alert_type_from_string(j.value("alert_type", "threshold"));
    auto condition = indicator_alert_condition_from_string(j.at("condition").get<std::string>());
    if (!type || !condition) {
        throw std::invalid_argument("Invalid indicator alert " + std::to_string(a.id));
    }
    a.alert_type = *type;
    a.condition = *condition;
    if (j.contains("secondary_indicator") && j.at("secondary_indicator").is_string()) {
        a.secondary_indicator = j.at("secondary_indicator").get<std::string>();
    }
    if (j.contains("threshold") && j.at("threshold").is_number()) {
        a.threshold = j.at("threshold").get<double>();
    }
    if (j.contains("last_value") && j.at("last_value").is_number()) {
        a.last_value = j.at("last_value").get<double>();
    }
    if (j.contains("message") && j.at("message").is_string()) {
        a.message = j.at("message").get<std::string>();
    }
    a.triggered = j.value("triggered", false);
    a.created_at = ts_from_json(j, "created_at");
    return a;
}

nlohmann::json position_to_json(const Position& p) {
    nlohmann::json j = {{"id", p.id},
                        {"symbol", p.symbol},
                        {"quantity", p.quantity},
                        {"entry_price", p.entry_price},
                        {"side", position_side_to_string(p.side)},
                        {"entry_date", core::format_date(p.entry_date)}};
    j["notes"] = p.notes ? nlohmann::json(*p.notes) : nlohmann::json(nullptr);
    return j;
}

Position position_from_json(const nlohmann::json& j) {
    Position p;
    p.id = j.at("id").get<int64_t>();
    p.symbol = j.at("symbol").get<std::string>();
    p.quantity = j.at("quantity").get<double>();
    p.entry_price = j.at("entry_price").get<double>();
    auto side = position_side_from_string(j.value("side", "long"));
    p.side = side ? *side : PositionSide::LONG;
    auto date = core::parse_date(j.value("entry_date", ""));
    p.entry_date = date ? *date : Timestamp{};
    // Added in schema version 3
    if (j.contains("notes") && j.at("notes").is_string()) {
        p.notes = j.at("notes").get<std::string>();
    }
    return p;
}

nlohmann::json api_call_to_json(const ApiCallRecord& r) {
    return {{"source", r.source},
            {"endpoint", r.endpoint},
            {"symbol", r.symbol},
            {"timestamp", ts_to_string(r.timestamp)},
            {"success", r.success},
            {"error_message", r.error_message}};
}

ApiCallRecord api_call_from_json(const nlohmann::json& j) {
    ApiCallRecord r;
    r.source = j.at("source").get<std::string>();
    r.endpoint = j.value("endpoint", "");
    r.symbol = j.value("symbol", "");
    r.timestamp = ts_from_json(j, "timestamp");
    r.success = j.value("success", false);
    r.error_message = j.value("error_message", "");
    return r;
}

template <typename T>
Result<T> not_found(const std::string& what) {
    return make_error<T>(ErrorCode::DATA_NOT_FOUND, what, kComponent);
}

template <typename T>
Result<T> constraint(const std::string& what) {
    return make_error<T>(ErrorCode::CONSTRAINT_VIOLATION, what, kComponent);
}

}  // namespace

InMemoryStore::InMemoryStore(std::string snapshot_path)
    : snapshot_path_(std::move(snapshot_path)) {
    Logger::register_component(kComponent);
}

Result<int> InMemoryStore::migrate() {
    if (snapshot_path_.empty() || !std::filesystem::exists(snapshot_path_)) {
        schema_version_ = kSchemaVersion;
        return schema_version_;
    }

    nlohmann::json snapshot;
    {
        std::ifstream file(snapshot_path_);
        if (!file.is_open()) {
            return make_error<int>(ErrorCode::FILE_IO_ERROR,
                                   "Cannot open snapshot: " + snapshot_path_, kComponent);
        }
        try {
            file >> snapshot;
        } catch (const nlohmann::json::exception& e) {
            return make_error<int>(ErrorCode::JSON_PARSE_ERROR,
                                   "Corrupt snapshot " + snapshot_path_ + ": " + e.what(),
                                   kComponent);
        }
    }

    int stored_version = snapshot.is_object() ? snapshot.value("schema_version", 1) : 0;
    if (stored_version > kSchemaVersion) {
        return make_error<int>(ErrorCode::INVALID_DATA,
                               "Snapshot schema version " + std::to_string(stored_version) +
                                   " is newer than supported version " +
                                   std::to_string(kSchemaVersion),
                               kComponent);
    }

    auto loaded = load_json(snapshot);
    if (loaded.is_error()) {
        return forward_error<int>(loaded);
    }

    if (loaded.value() < kSchemaVersion) {
        INFO("Upgrading snapshot " << snapshot_path_ << " from schema version " << loaded.value()
                                   << " to " << kSchemaVersion);
        schema_version_ = kSchemaVersion;
        auto written = flush();
        if (written.is_error()) {
            return forward_error<int>(written);
        }
    }
    schema_version_ = kSchemaVersion;
    return schema_version_;
}

Result<void> InMemoryStore::flush() {
    if (snapshot_path_.empty()) {
        return Result<void>();
    }
    std::lock_guard<std::mutex> lock(snapshot_mutex_);

    nlohmann::json snapshot = to_json();
    std::filesystem::path target(snapshot_path_);
    std::filesystem::path temp = target;
    temp += ".tmp";

    {
        std::ofstream file(temp, std::ios::trunc);
        if (!file.is_open()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Cannot write snapshot: " + temp.string(), kComponent);
        }
        file << snapshot.dump();
        if (!file.good()) {
            return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                    "Short write to snapshot: " + temp.string(), kComponent);
        }
    }

    // Rename so a crash mid-write never leaves a truncated snapshot behind
    std::error_code ec;
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        return make_error<void>(ErrorCode::FILE_IO_ERROR,
                                "Cannot replace snapshot " + target.string() + ": " + ec.message(),
                                kComponent);
    }
    DEBUG("Snapshot written to " << target.string());
    return Result<void>();
}

nlohmann::json InMemoryStore::to_json() const {
    nlohmann::json j;
    j["schema_version"] = kSchemaVersion;

    {
        std::shared_lock<std::shared_mutex> lock(entities_mutex_);
        nlohmann::json symbols = nlohmann::json::array();
        for (const auto& [_, s] : symbols_) {
            symbols.push_back(symbol_to_json(s));
        }
        j["symbols"] = symbols;

        nlohmann::json alerts = nlohmann::json::array();
        for (const auto& [_, a] : alerts_) {
            alerts.push_back(alert_to_json(a));
        }
        j["alerts"] = alerts;

        nlohmann::json indicator_alerts = nlohmann::json::array();
        for (const auto& [_, a] : indicator_alerts_) {
            indicator_alerts.push_back(indicator_alert_to_json(a));
        }
        j["indicator_alerts"] = indicator_alerts;

        nlohmann::json positions = nlohmann::json::array();
        for (const auto& [_, p] : positions_) {
            positions.push_back(position_to_json(p));
        }
        j["positions"] = positions;

        nlohmann::json watchlists = nlohmann::json::array();
        for (const auto& [_, w] : watchlists_) {
            nlohmann::json row = {{"id", w.info.id},
                                  {"name", w.info.name},
                                  {"created_at", ts_to_string(w.info.created_at)},
                                  {"symbols", w.members}};
            row["description"] =
                w.info.description ? nlohmann::json(*w.info.description) : nlohmann::json(nullptr);
            watchlists.push_back(row);
        }
        j["watchlists"] = watchlists;
        j["next_ids"] = {{"alert", next_alert_id_},
                         {"indicator_alert", next_indicator_alert_id_},
                         {"position", next_position_id_},
                         {"watchlist", next_watchlist_id_}};
    }

    {
        std::shared_lock<std::shared_mutex> lock(shards_mutex_);
        nlohmann::json prices = nlohmann::json::array();
        std::vector<std::string> keys;
        for (const auto& [symbol, _] : price_shards_) {
            keys.push_back(symbol);
        }
        std::sort(keys.begin(), keys.end());
        for (const auto& symbol : keys) {
            const auto& shard = price_shards_.at(symbol);
            std::lock_guard<std::mutex> shard_lock(shard->mutex);
            for (const auto& [_, bar] : shard->bars) {
                prices.push_back(bar_to_json(bar));
            }
        }
        j["prices"] = prices;
    }

    {
        std::shared_lock<std::shared_mutex> lock(macro_mutex_);
        nlohmann::json macro = nlohmann::json::array();
        for (const auto& [_, series] : macro_) {
            for (const auto& [__, obs] : series) {
                macro.push_back(macro_to_json(obs));
            }
        }
        j["macro"] = macro;
    }

    {
        std::shared_lock<std::shared_mutex> lock(indicator_mutex_);
        nlohmann::json indicators = nlohmann::json::array();
        for (const auto& [_, series] : indicators_) {
            nlohmann::json points = nlohmann::json::array();
            for (const auto& point : series.points) {
                points.push_back(nlohmann::json::array({core::format_date(point.date), point.value}));
            }
            indicators.push_back(
                {{"symbol", series.symbol}, {"name", series.name}, {"points", points}});
        }
        j["indicators"] = indicators;
    }

    {
        std::lock_guard<std::mutex> lock(api_mutex_);
        nlohmann::json calls = nlohmann::json::array();
        for (const auto& record : api_calls_) {
            calls.push_back(api_call_to_json(record));
        }
        j["api_calls"] = calls;
    }
    return j;
}

Result<int> InMemoryStore::load_json(const nlohmann::json& snapshot) {
    // Parse everything first so a bad snapshot leaves the store untouched
    int version = 1;
    std::map<std::string, SymbolInfo> symbols;
    std::map<int64_t, Alert> alerts;
    std::map<int64_t, IndicatorAlert> indicator_alerts;
    std::map<int64_t, Position> positions;
    std::map<int64_t, WatchlistRow> watchlists;
    std::unordered_map<std::string, std::shared_ptr<PriceShard>> shards;
    std::map<std::string, std::map<Timestamp, MacroObservation>> macro;
    std::map<std::pair<std::string, std::string>, IndicatorSeries> indicators;
    std::vector<ApiCallRecord> api_calls;

    try {
        version = snapshot.value("schema_version", 1);

        for (const auto& row : snapshot.value("symbols", nlohmann::json::array())) {
            SymbolInfo s = symbol_from_json(row);
            symbols[s.symbol] = s;
        }
        for (const auto& row : snapshot.value("prices", nlohmann::json::array())) {
            PriceBar bar = bar_from_json(row);
            auto& shard = shards[bar.symbol];
            if (!shard) {
                shard = std::make_shared<PriceShard>();
            }
            shard->bars[bar.date] = bar;
        }
        for (const auto& row : snapshot.value("macro", nlohmann::json::array())) {
            MacroObservation obs = macro_from_json(row);
            macro[obs.indicator][obs.date] = obs;
        }
        for (const auto& row : snapshot.value("indicators", nlohmann::json::array())) {
            IndicatorSeries series;
            series.symbol = row.at("symbol").get<std::string>();
            series.name = row.at("name").get<std::string>();
            for (const auto& point : row.at("points")) {
                auto date = core::parse_date(point.at(0).get<std::string>());
                if (!date) {
                    throw std::invalid_argument("Invalid indicator date in " + series.name);
                }
                series.points.push_back({*date, point.at(1).get<double>()});
            }
            indicators[{series.symbol, series.name}] = series;
        }
        for (const auto& row : snapshot.value("alerts", nlohmann::json::array())) {
            Alert a = alert_from_json(row);
            alerts[a.id] = a;
        }
        // Indicator alerts were added in schema version 4
        for (const auto& row : snapshot.value("indicator_alerts", nlohmann::json::array())) {
            IndicatorAlert a = indicator_alert_from_json(row);
            indicator_alerts[a.id] = a;
        }
        // Positions and the call log were added in schema version 2
        for (const auto& row : snapshot.value("positions", nlohmann::json::array())) {
            Position p = position_from_json(row);
            positions[p.id] = p;
        }
        for (const auto& row : snapshot.value("api_calls", nlohmann::json::array())) {
            api_calls.push_back(api_call_from_json(row));
        }
        for (const auto& row : snapshot.value("watchlists", nlohmann::json::array())) {
            WatchlistRow w;
            w.info.id = row.at("id").get<int64_t>();
            w.info.name = row.at("name").get<std::string>();
            if (row.contains("description") && row.at("description").is_string()) {
                w.info.description = row.at("description").get<std::string>();
            }
            w.info.created_at = ts_from_json(row, "created_at");
            for (const auto& member : row.value("symbols", nlohmann::json::array())) {
                w.members.insert(member.get<std::string>());
            }
            watchlists[w.info.id] = w;
        }
    } catch (const std::exception& e) {
        return make_error<int>(ErrorCode::INVALID_DATA,
                               std::string("Invalid snapshot contents: ") + e.what(), kComponent);
    }

    auto next_id = [&snapshot](const char* key, int64_t fallback) {
        if (snapshot.contains("next_ids") && snapshot.at("next_ids").contains(key)) {
            return std::max(fallback, snapshot.at("next_ids").at(key).get<int64_t>());
        }
        return fallback;
    };

    {
        std::unique_lock<std::shared_mutex> lock(entities_mutex_);
        symbols_ = std::move(symbols);
        alerts_ = std::move(alerts);
        indicator_alerts_ = std::move(indicator_alerts);
        positions_ = std::move(positions);
        watchlists_ = std::move(watchlists);
        next_alert_id_ = next_id("alert", alerts_.empty() ? 1 : alerts_.rbegin()->first + 1);
        next_indicator_alert_id_ = next_id(
            "indicator_alert",
            indicator_alerts_.empty() ? 1 : indicator_alerts_.rbegin()->first + 1);
        next_position_id_ =
            next_id("position", positions_.empty() ? 1 : positions_.rbegin()->first + 1);
        next_watchlist_id_ =
            next_id("watchlist", watchlists_.empty() ? 1 : watchlists_.rbegin()->first + 1);
    }
    {
        std::unique_lock<std::shared_mutex> lock(shards_mutex_);
        price_shards_ = std::move(shards);
    }
    {
        std::unique_lock<std::shared_mutex> lock(macro_mutex_);
        macro_ = std::move(macro);
    }
    {
        std::unique_lock<std::shared_mutex> lock(indicator_mutex_);
        indicators_ = std::move(indicators);
    }
    {
        std::lock_guard<std::mutex> lock(api_mutex_);
        api_calls_ = std::move(api_calls);
    }

    INFO("Loaded snapshot (schema version " << version << ")");
    return version;
}

// Symbols

bool InMemoryStore::symbol_exists(const std::string& symbol) const {
    std::shared_lock<std::shared_mutex> lock(entities_mutex_);
    return symbols_.count(symbol) > 0;
}

Result<size_t> InMemoryStore::upsert_symbols(const std::vector<SymbolInfo>& symbols) {
    std::vector<SymbolInfo> normalized;
    normalized.reserve(symbols.size());
    for (const auto& info : symbols) {
        auto ticker = normalize_symbol(info.symbol);
        if (ticker.is_error()) {
            return forward_error<size_t>(ticker, kComponent);
        }
        SymbolInfo copy = info;
        copy.symbol = ticker.value();
        normalized.push_back(std::move(copy));
    }

    std::unique_lock<std::shared_mutex> lock(entities_mutex_);
    for (const auto& info : normalized) {
        auto it = symbols_.find(info.symbol);
        if (it == symbols_.end()) {
            SymbolInfo row = info;
            if (row.asset_class.empty()) {
                row.asset_class = "equity";
            }
            symbols_.emplace(row.symbol, row);
            continue;
        }
        // Metadata refresh; blank fields keep what is already known
        SymbolInfo& row = it->second;
        auto refresh = [](std::string& target, const std::string& value) {
            if (!value.empty())
                target = value;
        };
        refresh(row.name, info.name);
        refresh(row.sector, info.sector);
        refresh(row.industry, info.industry);
        refresh(row.exchange, info.exchange);
        refresh(row.currency, info.currency);
        refresh(row.country, info.country);
        refresh(row.asset_class, info.asset_class);
    }
    return normalized.size();
}

Result<SymbolInfo> InMemoryStore::get_symbol(const std::string& symbol) const {
    std::shared_lock<std::shared_mutex> lock(entities_mutex_);
    auto it = symbols_.find(symbol);
    if (it == symbols_.end()) {
        return not_found<SymbolInfo>("Unknown symbol: " + symbol);
    }
    return SymbolInfo(it->second);
}

Result<std::vector<SymbolInfo>> InMemoryStore::list_symbols() const {
    std::shared_lock<std::shared_mutex> lock(entities_mutex_);
    std::vector<SymbolInfo> result;
    result.reserve(symbols_.size());
    for (const auto& [_, info] : symbols_) {
        result.push_back(info);
    }
    return result;
}

Result<void> InMemoryStore::set_favorite(const std::string& symbol, bool favorited) {
    std::unique_lock<std::shared_mutex> lock(entities_mutex_);
    auto it = symbols_.find(symbol);
    if (it == symbols_.end()) {
        return not_found<void>("Unknown symbol: " + symbol);
    }
    it->second.favorited = favorited;
    return Result<void>();
}

Result<bool> InMemoryStore::toggle_favorite(const std::string& symbol) {
    std::unique_lock<std::shared_mutex> lock(entities_mutex_);
    auto it = symbols_.find(symbol);
    if (it == symbols_.end()) {
        return not_found<bool>("Unknown symbol: " + symbol);
    }
    it->second.favorited = !it->second.favorited;
    return it->second.favorited;
}

Result<std::vector<std::string>> InMemoryStore::favorited_symbols() const {
    std::shared_lock<std::shared_mutex> lock(entities_mutex_);
    std::vector<std::string> result;
    for (const auto& [symbol, info] : symbols_) {
        if (info.favorited) {
            result.push_back(symbol);
        }
    }
    return result;
}

Result<std::vector<std::string>> InMemoryStore::symbols_with_prices() const {
    std::shared_lock<std::shared_mutex> lock(shards_mutex_);
    std::vector<std::string> result;
    for (const auto& [symbol, shard] : price_shards_) {
        std::lock_guard<std::mutex> shard_lock(shard->mutex);
        if (!shard->bars.empty()) {
            result.push_back(symbol);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

// Prices

std::shared_ptr<InMemoryStore::PriceShard> InMemoryStore::find_shard(
    const std::string& symbol) const {
    std::shared_lock<std::shared_mutex> lock(shards_mutex_);
    auto it = price_shards_.find(symbol);
    return it == price_shards_.end() ? nullptr : it->second;
}

std::shared_ptr<InMemoryStore::PriceShard> InMemoryStore::get_or_create_shard(
    const std::string& symbol) {
    if (auto shard = find_shard(symbol)) {
        return shard;
    }
    std::unique_lock<std::shared_mutex> lock(shards_mutex_);
    auto& shard = price_shards_[symbol];
    if (!shard) {
        shard = std::make_shared<PriceShard>();
    }
    return shard;
}

Result<size_t> InMemoryStore::upsert_price_bars(const std::vector<PriceBar>& bars) {
    std::map<std::string, std::vector<PriceBar>> by_symbol;
    for (const auto& bar : bars) {
        if (!std::isfinite(bar.close) || !std::isfinite(bar.open) || !std::isfinite(bar.high) ||
            !std::isfinite(bar.low)) {
            return make_error<size_t>(ErrorCode::INVALID_DATA,
                                      "Non-finite price in bar for " + bar.symbol + " on " +
                                          core::format_date(bar.date),
                                      kComponent);
        }
        PriceBar row = bar;
        row.date = core::floor_to_day(bar.date);
        by_symbol[row.symbol].push_back(std::move(row));
    }

    {
        std::shared_lock<std::shared_mutex> lock(entities_mutex_);
        for (const auto& [symbol, _] : by_symbol) {
            if (!symbols_.count(symbol)) {
                return constraint<size_t>("Price bar references unknown symbol: " + symbol);
            }
        }
    }

    size_t written = 0;
    for (auto& [symbol, rows] : by_symbol) {
        auto shard = get_or_create_shard(symbol);
        std::lock_guard<std::mutex> lock(shard->mutex);
        for (auto& row : rows) {
            shard->bars[row.date] = std::move(row);
            ++written;
        }
    }
    TRACE("Upserted " << written << " bars across " << by_symbol.size() << " symbols");
    return written;
}

Result<LatestQuote> InMemoryStore::latest_price(const std::string& symbol) const {
    auto shard = find_shard(symbol);
    if (!shard) {
        return not_found<LatestQuote>("No cached prices for " + symbol);
    }
    std::lock_guard<std::mutex> lock(shard->mutex);
    if (shard->bars.empty()) {
        return not_found<LatestQuote>("No cached prices for " + symbol);
    }
    LatestQuote quote;
    auto last = shard->bars.rbegin();
    quote.bar = last->second;
    ++last;
    if (last != shard->bars.rend()) {
        quote.previous_close = last->second.close;
    }
    return quote;
}

Result<std::vector<PriceBar>> InMemoryStore::price_history(const std::string& symbol,
                                                           const DateRange& range) const {
    std::vector<PriceBar> result;
    auto shard = find_shard(symbol);
    if (!shard) {
        return result;
    }
    std::lock_guard<std::mutex> lock(shard->mutex);
    for (const auto& [date, bar] : shard->bars) {
        if (range.contains(date)) {
            result.push_back(bar);
        }
    }
    return result;
}

// Macro

Result<size_t> InMemoryStore::upsert_macro(const std::vector<MacroObservation>& observations) {
    std::unique_lock<std::shared_mutex> lock(macro_mutex_);
    for (const auto& obs : observations) {
        if (obs.indicator.empty()) {
            return make_error<size_t>(ErrorCode::INVALID_ARGUMENT,
                                      "Macro observation without indicator code", kComponent);
        }
    }
    for (const auto& obs : observations) {
        MacroObservation row = obs;
        row.date = core::floor_to_day(obs.date);
        macro_[row.indicator][row.date] = row;
    }
    return observations.size();
}

Result<std::vector<MacroObservation>> InMemoryStore::macro_series(const std::string& code) const {
    std::shared_lock<std::shared_mutex> lock(macro_mutex_);
    std::vector<MacroObservation> result;
    auto it = macro_.find(code);
    if (it != macro_.end()) {
        for (const auto& [_, obs] : it->second) {
            result.push_back(obs);
        }
    }
    return result;
}

Result<std::vector<std::string>> InMemoryStore::macro_codes() const {
    std::shared_lock<std::shared_mutex> lock(macro_mutex_);
    std::vector<std::string> result;
    for (const auto& [code, series] : macro_) {
        if (!series.empty()) {
            result.push_back(code);
        }
    }
    return result;
}

Result<std::vector<MacroObservation>> InMemoryStore::latest_macro() const {
    std::shared_lock<std::shared_mutex> lock(macro_mutex_);
    std::vector<MacroObservation> result;
    for (const auto& [_, series] : macro_) {
        if (!series.empty()) {
            result.push_back(series.rbegin()->second);
        }
    }
    return result;
}

// Indicators

Result<void> InMemoryStore::replace_indicator_series(const IndicatorSeries& series) {
    if (series.symbol.empty() || series.name.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Indicator series needs a symbol and a name", kComponent);
    }
    if (!symbol_exists(series.symbol)) {
        return constraint<void>("Indicator series references unknown symbol: " + series.symbol);
    }
    IndicatorSeries stored = series;
    std::sort(stored.points.begin(), stored.points.end(),
              [](const IndicatorPoint& a, const IndicatorPoint& b) { return a.date < b.date; });

    std::unique_lock<std::shared_mutex> lock(indicator_mutex_);
    indicators_[{series.symbol, series.name}] = std::move(stored);
    return Result<void>();
}

Result<IndicatorSeries> InMemoryStore::indicator_history(const std::string& symbol,
                                                         const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(indicator_mutex_);
    auto it = indicators_.find({symbol, name});
    if (it == indicators_.end()) {
        return not_found<IndicatorSeries>("No stored " + name + " series for " + symbol);
    }
    return IndicatorSeries(it->second);
}

Result<std::unordered_map<std::string, IndicatorPoint>> InMemoryStore::latest_indicators(
    const std::string& symbol) const {
    std::shared_lock<std::shared_mutex> lock(indicator_mutex_);
    std::unordered_map<std::string, IndicatorPoint> result;
    for (auto it = indicators_.lower_bound({symbol, ""});
         it != indicators_.end() && it->first.first == symbol; ++it) {
        if (!it->second.points.empty()) {
            result[it->first.second] = it->second.points.back();
        }
    }
    return result;
}

// Alerts

Result<Alert> InMemoryStore::create_alert(const Alert& alert) {
    std::unique_lock<std::shared_mutex> lock(entities_mutex_);
    if (!symbols_.count(alert.symbol)) {
        return constraint<Alert>("Alert references unknown symbol: " + alert.symbol);
    }
    Alert row = alert;
    row.id = next_alert_id_++;
    alerts_[row.id] = row;
    return row;
}

Result<std::vector<Alert>> InMemoryStore::list_alerts(bool only_active) const {
    std::shared_lock<std::shared_mutex> lock(entities_mutex_);
    std::vector<Alert> result;
    for (const auto& [_, alert] : alerts_) {
        if (!only_active || !alert.triggered) {
            result.push_back(alert);
        }
    }
    return result;
}

Result<void> InMemoryStore::mark_alert_triggered(int64_t alert_id) {
    std::unique_lock<std::shared_mutex> lock(entities_mutex_);
    auto it = alerts_.find(alert_id);
    if (it == alerts_.end()) {
        return not_found<void>("Unknown alert id " + std::to_string(alert_id));
    }
    it->second.triggered = true;
    return Result<void>();
}

Result<void> InMemoryStore::delete_alert(int64_t alert_id) {
    std::unique_lock<std::shared_mutex> lock(entities_mutex_);
    if (alerts_.erase(alert_id) == 0) {
        return not_found<void>("Unknown alert id " + std::to_string(alert_id));
    }
    return Result<void>();
}

// Indicator alerts

Result<IndicatorAlert> InMemoryStore::create_indicator_alert(const IndicatorAlert& alert) {
    std::unique_lock<std::shared_mutex> lock(entities_mutex_);
    if (!symbols_.count(alert.symbol)) {
        return constraint<IndicatorAlert>("Indicator alert references unknown symbol: " +
                                          alert.symbol);
    }
    IndicatorAlert row = alert;
    row.id = next_indicator_alert_id_++;
    indicator_alerts_[row.id] = row;
    return row;
}

Result<std::vector<IndicatorAlert>> InMemoryStore::list_indicator_alerts(bool only_active) const {
    std::shared_lock<std::shared_mutex> lock(entities_mutex_);
    std::vector<IndicatorAlert> result;
    for (const auto& [_, alert] : indicator_alerts_) {
        if (!only_active || !alert.triggered) {
            result.push_back(alert);
        }
    }
    return result;
}

Result<void> InMemoryStore::mark_indicator_alert_triggered(int64_t alert_id) {
    std::unique_lock<std::shared_mutex> lock(entities_mutex_);
    auto it = indicator_alerts_.find(alert_id);
    if (it == indicator_alerts_.end()) {
        return not_found<void>("Unknown indicator alert id " + std::to_string(alert_id));
    }
    it->second.triggered = true;
    return Result<void>();
}

Result<void> InMemoryStore::update_indicator_alert_value(int64_t alert_id, double last_value) {
    std::unique_lock<std::shared_mutex> lock(entities_mutex_);
    auto it = indicator_alerts_.find(alert_id);
    if (it == indicator_alerts_.end()) {
        return not_found<void>("Unknown indicator alert id " + std::to_string(alert_id));
    }
    it->second.last_value = last_value;
    return Result<void>();
}

Result<void> InMemoryStore::delete_indicator_alert(int64_t alert_id) {
    std::unique_lock<std::shared_mutex> lock(entities_mutex_);
    if (indicator_alerts_.erase(alert_id) == 0) {
        return not_found<void>("Unknown indicator alert id " + std::to_string(alert_id));
    }
    return Result<void>();
}

// Positions

Result<Position> InMemoryStore::create_position(const Position& position) {
    std::unique_lock<std::shared_mutex> lock(entities_mutex_);
    if (!symbols_.count(position.symbol)) {
        return constraint<Position>("Position references unknown symbol: " + position.symbol);
    }
    Position row = position;
    row.id = next_position_id_++;
    row.entry_date = core::floor_to_day(position.entry_date);
    positions_[row.id] = row;
    return row;
}

Result<std::vector<Position>> InMemoryStore::list_positions() const {
    std::shared_lock<std::shared_mutex> lock(entities_mutex_);
    std::vector<Position> result;
    for (const auto& [_, position] : positions_) {
        result.push_back(position);
    }
    return result;
}

Result<void> InMemoryStore::delete_position(int64_t position_id) {
    std::unique_lock<std::shared_mutex> lock(entities_mutex_);
    if (positions_.erase(position_id) == 0) {
        return not_found<void>("Unknown position id " + std::to_string(position_id));
    }
    return Result<void>();
}

// Watchlists

Result<Watchlist> InMemoryStore::create_watchlist(const Watchlist& watchlist) {
    std::unique_lock<std::shared_mutex> lock(entities_mutex_);
    for (const auto& [_, row] : watchlists_) {
        if (row.info.name == watchlist.name) {
            return constraint<Watchlist>("Watchlist name already exists: " + watchlist.name);
        }
    }
    WatchlistRow row;
    row.info = watchlist;
    row.info.id = next_watchlist_id_++;
    watchlists_[row.info.id] = row;
    return Watchlist(row.info);
}

Result<std::vector<Watchlist>> InMemoryStore::list_watchlists() const {
    std::shared_lock<std::shared_mutex> lock(entities_mutex_);
    std::vector<Watchlist> result;
    for (const auto& [_, row] : watchlists_) {
        result.push_back(row.info);
    }
    std::sort(result.begin(), result.end(),
              [](const Watchlist& a, const Watchlist& b) { return a.name < b.name; });
    return result;
}

Result<void> InMemoryStore::delete_watchlist(int64_t watchlist_id) {
    std::unique_lock<std::shared_mutex> lock(entities_mutex_);
    if (watchlists_.erase(watchlist_id) == 0) {
        return not_found<void>("Unknown watchlist id " + std::to_string(watchlist_id));
    }
    return Result<void>();
}

Result<void> InMemoryStore::add_to_watchlist(int64_t watchlist_id, const std::string& symbol) {
    std::unique_lock<std::shared_mutex> lock(entities_mutex_);
    auto it = watchlists_.find(watchlist_id);
    if (it == watchlists_.end()) {
        return not_found<void>("Unknown watchlist id " + std::to_string(watchlist_id));
    }
    if (!symbols_.count(symbol)) {
        return constraint<void>("Watchlist member references unknown symbol: " + symbol);
    }
    it->second.members.insert(symbol);
    return Result<void>();
}

Result<void> InMemoryStore::remove_from_watchlist(int64_t watchlist_id,
                                                  const std::string& symbol) {
    std::unique_lock<std::shared_mutex> lock(entities_mutex_);
    auto it = watchlists_.find(watchlist_id);
    if (it == watchlists_.end()) {
        return not_found<void>("Unknown watchlist id " + std::to_string(watchlist_id));
    }
    if (it->second.members.erase(symbol) == 0) {
        return not_found<void>(symbol + " is not in watchlist " + it->second.info.name);
    }
    return Result<void>();
}

Result<std::vector<std::string>> InMemoryStore::watchlist_symbols(int64_t watchlist_id) const {
    std::shared_lock<std::shared_mutex> lock(entities_mutex_);
    auto it = watchlists_.find(watchlist_id);
    if (it == watchlists_.end()) {
        return not_found<std::vector<std::string>>("Unknown watchlist id " +
                                                   std::to_string(watchlist_id));
    }
    return std::vector<std::string>(it->second.members.begin(), it->second.members.end());
}

// API call log

Result<void> InMemoryStore::record_api_call(const ApiCallRecord& record) {
    std::lock_guard<std::mutex> lock(api_mutex_);
    // Keep the log ordered by timestamp even when a late record arrives
    auto pos = std::upper_bound(
        api_calls_.begin(), api_calls_.end(), record,
        [](const ApiCallRecord& a, const ApiCallRecord& b) { return a.timestamp < b.timestamp; });
    api_calls_.insert(pos, record);
    return Result<void>();
}

Result<std::vector<ApiCallRecord>> InMemoryStore::api_calls_since(const std::string& source,
                                                                  const Timestamp& since) const {
    std::lock_guard<std::mutex> lock(api_mutex_);
    std::vector<ApiCallRecord> result;
    for (const auto& record : api_calls_) {
        if (record.source == source && record.timestamp >= since) {
            result.push_back(record);
        }
    }
    return result;
}

Result<size_t> InMemoryStore::count_api_calls(const std::string& source, const Timestamp& since,
                                              bool successful_only) const {
    std::lock_guard<std::mutex> lock(api_mutex_);
    size_t count = 0;
    for (const auto& record : api_calls_) {
        if (record.source == source && record.timestamp >= since &&
            (!successful_only || record.success)) {
            ++count;
        }
    }
    return count;
}

}  // namespace finpipe
