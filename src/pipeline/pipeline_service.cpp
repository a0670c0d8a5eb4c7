// src/pipeline/pipeline_service.cpp

#include "finpipe/pipeline/pipeline_service.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <set>
#include <sstream>
#include "finpipe/core/logger.hpp"
#include "finpipe/core/time_utils.hpp"
#include "finpipe/data/conversion_utils.hpp"
#include "finpipe/data/event_bus.hpp"
#include "finpipe/data/symbol_catalog.hpp"
#include "finpipe/ingest/fred_macro_adapter.hpp"
#include "finpipe/ingest/yahoo_eod_adapter.hpp"
#include "finpipe/ingest/yahoo_intraday_adapter.hpp"

namespace finpipe {

namespace {

constexpr const char* kComponent = "PipelineService";
constexpr const char* kEodSource = "yahoo_eod";
constexpr const char* kIntradaySource = "yahoo_intraday";
constexpr const char* kMacroSource = "fred";

template <typename T>
QueryResult<T> query_ok(T data, std::string message = "") {
    QueryResult<T> out;
    out.success = true;
    out.message = std::move(message);
    out.data = std::move(data);
    return out;
}

template <typename T, typename U>
QueryResult<T> query_fail(const Result<U>& failed) {
    QueryResult<T> out;
    out.success = false;
    out.message = failed.error()->what();
    return out;
}

template <typename T>
QueryResult<T> query_fail(const std::string& message) {
    QueryResult<T> out;
    out.success = false;
    out.message = message;
    return out;
}

template <typename T>
CommandResult command_fail(const Result<T>& failed) {
    return CommandResult::fail(failed.error()->what());
}

std::string upper_trimmed(const std::string& value) {
    const auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t");
    std::string out = value.substr(first, last - first + 1);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

template <typename Adapter>
std::unique_ptr<SourceAdapter> make_adapter(const PipelineConfig& config, const char* name,
                                            const std::shared_ptr<HttpTransport>& transport,
                                            const std::shared_ptr<RateLimiter>& limiter,
                                            const std::shared_ptr<const Clock>& clock) {
    const SourceConfig* source = config.source(name);
    if (!source) {
        WARN("Source " << name << " is not configured");
        return nullptr;
    }
    return std::make_unique<Adapter>(*source, transport, limiter, clock);
}

}  // namespace

PipelineService::PipelineService(PipelineConfig config, std::shared_ptr<TimeSeriesStore> store,
                                 std::shared_ptr<HttpTransport> transport,
                                 std::shared_ptr<const Clock> clock)
    : config_(std::move(config)),
      store_(std::move(store)),
      clock_(std::move(clock)),
      limiter_(std::make_shared<RateLimiter>(clock_, store_)),
      indicators_(store_),
      alerts_(store_, clock_),
      indicator_alerts_(store_, clock_) {
    auto specs = config_.indicator_specs();
    if (specs.is_ok()) {
        indicator_specs_ = specs.take_value();
    } else {
        WARN("Falling back to the default indicator set: " << specs.error()->what());
        indicator_specs_ = default_indicator_set();
    }

    limiter_->configure(config_.sources);
    eod_ = make_adapter<YahooEodAdapter>(config_, kEodSource, transport, limiter_, clock_);
    intraday_ =
        make_adapter<YahooIntradayAdapter>(config_, kIntradaySource, transport, limiter_, clock_);
    macro_ = make_adapter<FredMacroAdapter>(config_, kMacroSource, transport, limiter_, clock_);
}

void PipelineService::publish(PipelineEventType type, const std::string& symbol,
                              std::unordered_map<std::string, double> numeric) const {
    PipelineEvent event;
    event.type = type;
    event.symbol = symbol;
    event.timestamp = clock_->now();
    event.numeric_fields = std::move(numeric);
    PipelineEventBus::instance().publish(event);
}

CommandResult PipelineService::persisted(CommandResult result) {
    auto flushed = store_->flush();
    if (flushed.is_error()) {
        ERROR("Store flush failed: " << flushed.error()->what());
        result.success = false;
        result.message += " (not persisted: " + std::string(flushed.error()->what()) + ")";
    }
    return result;
}

Result<void> PipelineService::ensure_symbols(const std::vector<std::string>& symbols) {
    std::vector<SymbolInfo> missing;
    for (const auto& symbol : symbols) {
        auto existing = store_->get_symbol(symbol);
        if (existing.is_ok()) {
            continue;
        }
        if (existing.error()->code() != ErrorCode::DATA_NOT_FOUND) {
            return forward_error<void>(existing);
        }
        SymbolInfo info;
        info.symbol = symbol;
        missing.push_back(std::move(info));
    }
    if (missing.empty()) {
        return Result<void>();
    }
    auto created = store_->upsert_symbols(missing);
    if (created.is_error()) {
        return forward_error<void>(created);
    }
    DEBUG("Created " << created.value() << " symbols absent from the catalog");
    return Result<void>();
}

PipelineService::PriceIngest PipelineService::ingest_prices(
    SourceAdapter& adapter, const std::vector<std::string>& symbols, FetchRange range,
    const std::string& period) {
    ScopedLogComponent log_component(kComponent);
    PriceIngest ingest;

    std::vector<std::string> tickers;
    for (const auto& raw : symbols) {
        auto normalized = normalize_symbol(raw);
        if (normalized.is_error()) {
            ingest.rejected.push_back(raw + ": " + normalized.error()->what());
            continue;
        }
        tickers.push_back(normalized.value());
    }
    std::sort(tickers.begin(), tickers.end());
    tickers.erase(std::unique(tickers.begin(), tickers.end()), tickers.end());
    if (tickers.empty()) {
        ingest.batch.source = adapter.name();
        return ingest;
    }

    auto guard = lock_.acquire(tickers);

    // Only tickers that actually returned bars get a catalog row
    BatchSink sink = [this](const FetchedRecords& records) -> Result<void> {
        if (records.bars.empty()) {
            return Result<void>();
        }
        std::map<std::string, size_t> per_symbol;
        for (const auto& bar : records.bars) {
            ++per_symbol[bar.symbol];
        }
        std::vector<std::string> symbols;
        for (const auto& entry : per_symbol) {
            symbols.push_back(entry.first);
        }
        auto created = ensure_symbols(symbols);
        if (created.is_error()) {
            return created;
        }
        auto upserted = store_->upsert_price_bars(records.bars);
        if (upserted.is_error()) {
            return forward_error<void>(upserted);
        }
        for (const auto& [symbol, count] : per_symbol) {
            publish(PipelineEventType::PRICES_UPSERTED, symbol,
                    {{"bars", static_cast<double>(count)}});
        }
        return Result<void>();
    };

    ingest.batch = period.empty() ? adapter.fetch(tickers, range, sink)
                                  : adapter.fetch_period(tickers, period, sink);

    std::vector<std::string> ingested = ingest.batch.succeeded_symbols();
    for (const auto& symbol : ingested) {
        auto report = indicators_.compute_all(symbol, indicator_specs_);
        if (report.is_error()) {
            WARN("Indicator recompute failed for " << symbol << ": " << report.error()->what());
            continue;
        }
        publish(PipelineEventType::INDICATORS_RECOMPUTED, symbol,
                {{"series", static_cast<double>(report.value().computed.size())}});
    }

    if (!ingested.empty()) {
        auto triggered = alerts_.evaluate_active(ingested);
        if (triggered.is_error()) {
            WARN("Alert evaluation failed: " << triggered.error()->what());
        } else {
            ingest.alerts_triggered = triggered.value().size();
        }
        auto crossed = indicator_alerts_.evaluate_active(ingested);
        if (crossed.is_error()) {
            WARN("Indicator alert evaluation failed: " << crossed.error()->what());
        } else {
            ingest.indicator_alerts_triggered = crossed.value().size();
        }
    }

    if (ingest.batch.quota_exhausted) {
        publish(PipelineEventType::QUOTA_EXCEEDED, "",
                {{"retry_after_ms", static_cast<double>(ingest.batch.retry_after.count())}});
    }
    return ingest;
}

std::string PipelineService::price_ingest_message(const PriceIngest& ingest) const {
    std::ostringstream ss;
    ss << ingest.batch.summary();
    if (!ingest.rejected.empty()) {
        ss << ". Rejected: ";
        for (size_t i = 0; i < ingest.rejected.size(); ++i) {
            ss << (i ? "; " : "") << ingest.rejected[i];
        }
    }
    if (ingest.alerts_triggered > 0) {
        ss << ". " << ingest.alerts_triggered << " alert(s) triggered";
    }
    if (ingest.indicator_alerts_triggered > 0) {
        ss << ". " << ingest.indicator_alerts_triggered << " indicator alert(s) triggered";
    }
    return ss.str();
}

QueryResult<std::vector<SymbolQuote>> PipelineService::get_symbols() const {
    auto symbols = store_->list_symbols();
    if (symbols.is_error()) {
        return query_fail<std::vector<SymbolQuote>>(symbols);
    }

    std::vector<SymbolQuote> quotes;
    quotes.reserve(symbols.value().size());
    for (const auto& info : symbols.value()) {
        SymbolQuote quote;
        quote.info = info;
        auto latest = store_->latest_price(info.symbol);
        if (latest.is_ok()) {
            const auto& q = latest.value();
            quote.date = q.bar.date;
            quote.price = q.bar.close;
            if (q.previous_close && *q.previous_close != 0.0) {
                quote.change_percent = (q.bar.close - *q.previous_close) / *q.previous_close * 100.0;
            }
        } else if (latest.error()->code() != ErrorCode::DATA_NOT_FOUND) {
            return query_fail<std::vector<SymbolQuote>>(latest);
        }
        quotes.push_back(std::move(quote));
    }
    return query_ok(std::move(quotes));
}

CommandResult PipelineService::fetch_prices(const std::vector<std::string>& symbols,
                                            const std::string& period) {
    if (!eod_) {
        return CommandResult::fail(std::string("Source ") + kEodSource + " is not configured");
    }
    if (symbols.empty()) {
        return CommandResult::fail("No symbols given");
    }

    FetchRange range = FetchRange::COMPACT;
    std::string provider_period;
    auto named = fetch_range_from_string(period);
    if (named.is_ok()) {
        range = named.value();
    } else {
        provider_period = period;
    }

    PriceIngest ingest = ingest_prices(*eod_, symbols, range, provider_period);
    CommandResult result;
    result.success = ingest.batch.succeeded() > 0;
    result.message = price_ingest_message(ingest);
    return persisted(std::move(result));
}

CommandResult PipelineService::fetch_intraday(const std::vector<std::string>& symbols) {
    if (!intraday_) {
        return CommandResult::fail(std::string("Source ") + kIntradaySource +
                                   " is not configured");
    }
    if (symbols.empty()) {
        return CommandResult::fail("No symbols given");
    }
    PriceIngest ingest = ingest_prices(*intraday_, symbols, FetchRange::COMPACT, "");
    CommandResult result;
    result.success = ingest.batch.succeeded() > 0;
    result.message = price_ingest_message(ingest);
    return persisted(std::move(result));
}

CommandResult PipelineService::fetch_macro(const std::vector<std::string>& codes) {
    ScopedLogComponent log_component(kComponent);
    if (!macro_) {
        return CommandResult::fail(std::string("Source ") + kMacroSource + " is not configured");
    }
    if (codes.empty()) {
        return CommandResult::fail("No macro indicators given");
    }

    BatchSink sink = [this](const FetchedRecords& records) -> Result<void> {
        if (records.observations.empty()) {
            return Result<void>();
        }
        auto upserted = store_->upsert_macro(records.observations);
        if (upserted.is_error()) {
            return forward_error<void>(upserted);
        }
        std::map<std::string, size_t> per_code;
        for (const auto& obs : records.observations) {
            ++per_code[obs.indicator];
        }
        for (const auto& [code, count] : per_code) {
            publish(PipelineEventType::MACRO_UPSERTED, code,
                    {{"observations", static_cast<double>(count)}});
        }
        return Result<void>();
    };

    BatchResult batch = macro_->fetch(codes, FetchRange::FULL, sink);
    if (batch.quota_exhausted) {
        publish(PipelineEventType::QUOTA_EXCEEDED, "",
                {{"retry_after_ms", static_cast<double>(batch.retry_after.count())}});
    }
    CommandResult result;
    result.success = batch.succeeded() > 0;
    result.message = batch.summary();
    return persisted(std::move(result));
}

QueryResult<std::vector<PriceBar>> PipelineService::get_price_history(
    const std::string& symbol, const DateRange& range) const {
    auto ticker = normalize_symbol(symbol);
    if (ticker.is_error()) {
        return query_fail<std::vector<PriceBar>>(ticker);
    }
    auto history = store_->price_history(ticker.value(), range);
    if (history.is_error()) {
        return query_fail<std::vector<PriceBar>>(history);
    }
    const size_t count = history.value().size();
    return query_ok(history.take_value(), std::to_string(count) + " bars");
}

Result<std::shared_ptr<arrow::Table>> PipelineService::export_price_history(
    const std::string& symbol, const DateRange& range) const {
    auto ticker = normalize_symbol(symbol);
    if (ticker.is_error()) {
        return forward_error<std::shared_ptr<arrow::Table>>(ticker, kComponent);
    }
    auto history = store_->price_history(ticker.value(), range);
    if (history.is_error()) {
        return forward_error<std::shared_ptr<arrow::Table>>(history);
    }
    return DataConversionUtils::price_bars_to_table(history.value());
}

QueryResult<std::vector<IndicatorPoint>> PipelineService::get_indicator_history(
    const std::string& symbol, const std::string& name) const {
    auto ticker = normalize_symbol(symbol);
    if (ticker.is_error()) {
        return query_fail<std::vector<IndicatorPoint>>(ticker);
    }
    auto series = store_->indicator_history(ticker.value(), name);
    if (series.is_error()) {
        return query_fail<std::vector<IndicatorPoint>>(series);
    }
    return query_ok(series.take_value().points);
}

CommandResult PipelineService::calculate_indicators(const std::string& symbol) {
    auto ticker = normalize_symbol(symbol);
    if (ticker.is_error()) {
        return command_fail(ticker);
    }
    auto guard = lock_.acquire({ticker.value()});
    auto report = indicators_.compute_all(ticker.value(), indicator_specs_);
    if (report.is_error()) {
        return command_fail(report);
    }
    const auto& r = report.value();
    if (r.bars == 0) {
        return CommandResult::fail("No cached prices for " + r.symbol);
    }
    publish(PipelineEventType::INDICATORS_RECOMPUTED, r.symbol,
            {{"series", static_cast<double>(r.computed.size())}});

    std::ostringstream ss;
    ss << "Computed " << r.computed.size() << " series for " << r.symbol << " from " << r.bars
       << " bars";
    if (!r.insufficient.empty()) {
        ss << ". Insufficient history for: ";
        for (size_t i = 0; i < r.insufficient.size(); ++i) {
            ss << (i ? ", " : "") << r.insufficient[i];
        }
    }
    if (!r.failed.empty()) {
        ss << ". Failed: ";
        for (size_t i = 0; i < r.failed.size(); ++i) {
            ss << (i ? "; " : "") << r.failed[i];
        }
    }
    CommandResult result;
    result.success = r.ok() && !r.computed.empty();
    result.message = ss.str();
    return persisted(std::move(result));
}

QueryResult<bool> PipelineService::toggle_favorite(const std::string& symbol) {
    auto ticker = normalize_symbol(symbol);
    if (ticker.is_error()) {
        return query_fail<bool>(ticker);
    }
    auto toggled = store_->toggle_favorite(ticker.value());
    if (toggled.is_error()) {
        return query_fail<bool>(toggled);
    }
    const bool state = toggled.value();
    CommandResult flushed = persisted(CommandResult::ok(
        ticker.value() + (state ? " added to" : " removed from") + " favorites"));
    QueryResult<bool> out;
    out.success = flushed.success;
    out.message = flushed.message;
    out.data = state;
    return out;
}

CommandResult PipelineService::load_catalog(const std::string& path) {
    auto loaded = SymbolCatalogLoader::load_into(*store_, path);
    if (loaded.is_error()) {
        return command_fail(loaded);
    }
    return persisted(
        CommandResult::ok("Loaded " + std::to_string(loaded.value()) + " symbols from " + path));
}

CommandResult PipelineService::create_alert(const std::string& symbol, Price target_price,
                                            const std::string& condition) {
    auto ticker = normalize_symbol(symbol);
    if (ticker.is_error()) {
        return command_fail(ticker);
    }
    auto parsed = alert_condition_from_string(condition);
    if (!parsed) {
        return CommandResult::fail("Unknown alert condition: " + condition);
    }
    if (!(target_price > 0.0)) {
        return CommandResult::fail("Alert target price must be positive");
    }

    Alert alert;
    alert.symbol = ticker.value();
    alert.target_price = target_price;
    alert.condition = *parsed;
    alert.created_at = clock_->now();
    auto created = store_->create_alert(alert);
    if (created.is_error()) {
        return command_fail(created);
    }
    const auto& stored = created.value();
    std::ostringstream ss;
    ss << "Alert " << stored.id << " created: " << stored.symbol << " "
       << alert_condition_to_string(stored.condition) << " " << stored.target_price;
    return persisted(CommandResult::ok(ss.str()));
}

QueryResult<std::vector<Alert>> PipelineService::list_alerts(bool only_active) const {
    auto alerts = store_->list_alerts(only_active);
    if (alerts.is_error()) {
        return query_fail<std::vector<Alert>>(alerts);
    }
    return query_ok(alerts.take_value());
}

CommandResult PipelineService::delete_alert(int64_t alert_id) {
    auto deleted = store_->delete_alert(alert_id);
    if (deleted.is_error()) {
        return command_fail(deleted);
    }
    return persisted(CommandResult::ok("Alert " + std::to_string(alert_id) + " deleted"));
}

QueryResult<std::vector<Alert>> PipelineService::check_alerts() {
    auto active = store_->list_alerts(true);
    if (active.is_error()) {
        return query_fail<std::vector<Alert>>(active);
    }
    std::vector<std::string> symbols;
    for (const auto& alert : active.value()) {
        symbols.push_back(alert.symbol);
    }
    auto guard = lock_.acquire(symbols);

    auto triggered = alerts_.evaluate(active.value());
    if (triggered.is_error()) {
        return query_fail<std::vector<Alert>>(triggered);
    }
    const size_t count = triggered.value().size();
    CommandResult flushed = persisted(CommandResult::ok(
        "Checked " + std::to_string(active.value().size()) + " alerts, " +
        std::to_string(count) + " triggered"));
    QueryResult<std::vector<Alert>> out;
    out.success = flushed.success;
    out.message = flushed.message;
    out.data = triggered.take_value();
    return out;
}

CommandResult PipelineService::add_indicator_alert(const std::string& symbol,
                                                   const std::string& alert_type,
                                                   const std::string& indicator,
                                                   const std::string& condition,
                                                   std::optional<double> threshold,
                                                   std::optional<std::string> secondary_indicator,
                                                   std::optional<std::string> message) {
    auto ticker = normalize_symbol(symbol);
    if (ticker.is_error()) {
        return command_fail(ticker);
    }
    auto type = indicator_alert_type_from_string(alert_type);
    if (!type) {
        return CommandResult::fail("Unknown indicator alert type: " + alert_type +
                                   ". Use threshold, crossover or band_touch");
    }
    auto parsed = indicator_alert_condition_from_string(condition);
    if (!parsed) {
        return CommandResult::fail("Unknown indicator alert condition: " + condition);
    }

    IndicatorAlert alert;
    alert.symbol = ticker.value();
    alert.alert_type = *type;
    alert.indicator = upper_trimmed(indicator);
    alert.condition = *parsed;
    alert.message = std::move(message);
    alert.created_at = clock_->now();
    if (alert.indicator.empty()) {
        return CommandResult::fail("Indicator alert needs a series name");
    }
    if (is_crossover_condition(alert.condition)) {
        std::string other = secondary_indicator ? upper_trimmed(*secondary_indicator) : "";
        if (other.empty()) {
            return CommandResult::fail("Condition " + condition + " needs a secondary series");
        }
        alert.secondary_indicator = other;
    } else {
        if (!threshold || !std::isfinite(*threshold)) {
            return CommandResult::fail("Condition " + condition + " needs a threshold");
        }
        alert.threshold = threshold;
    }

    auto created = store_->create_indicator_alert(alert);
    if (created.is_error()) {
        return command_fail(created);
    }
    const auto& stored = created.value();
    std::ostringstream ss;
    ss << "Indicator alert " << stored.id << " created: " << stored.symbol << " "
       << stored.indicator << " " << indicator_alert_condition_to_string(stored.condition) << " ";
    if (stored.threshold) {
        ss << *stored.threshold;
    } else {
        ss << *stored.secondary_indicator;
    }
    return persisted(CommandResult::ok(ss.str()));
}

QueryResult<std::vector<IndicatorAlert>> PipelineService::list_indicator_alerts(
    bool only_active) const {
    auto alerts = store_->list_indicator_alerts(only_active);
    if (alerts.is_error()) {
        return query_fail<std::vector<IndicatorAlert>>(alerts);
    }
    return query_ok(alerts.take_value());
}

CommandResult PipelineService::delete_indicator_alert(int64_t alert_id) {
    auto deleted = store_->delete_indicator_alert(alert_id);
    if (deleted.is_error()) {
        return command_fail(deleted);
    }
    return persisted(
        CommandResult::ok("Indicator alert " + std::to_string(alert_id) + " deleted"));
}

QueryResult<std::vector<IndicatorAlert>> PipelineService::check_indicator_alerts() {
    auto active = store_->list_indicator_alerts(true);
    if (active.is_error()) {
        return query_fail<std::vector<IndicatorAlert>>(active);
    }
    std::vector<std::string> symbols;
    for (const auto& alert : active.value()) {
        symbols.push_back(alert.symbol);
    }
    auto guard = lock_.acquire(symbols);

    auto triggered = indicator_alerts_.evaluate(active.value());
    if (triggered.is_error()) {
        return query_fail<std::vector<IndicatorAlert>>(triggered);
    }
    CommandResult flushed = persisted(CommandResult::ok(
        "Checked " + std::to_string(active.value().size()) + " indicator alerts, " +
        std::to_string(triggered.value().size()) + " triggered"));
    QueryResult<std::vector<IndicatorAlert>> out;
    out.success = flushed.success;
    out.message = flushed.message;
    out.data = triggered.take_value();
    return out;
}

CommandResult PipelineService::add_position(const std::string& symbol, Quantity quantity,
                                            Price entry_price, const std::string& side,
                                            std::optional<Timestamp> entry_date,
                                            std::optional<std::string> notes) {
    auto ticker = normalize_symbol(symbol);
    if (ticker.is_error()) {
        return command_fail(ticker);
    }
    auto parsed_side = position_side_from_string(side);
    if (!parsed_side) {
        return CommandResult::fail("Unknown position side: " + side);
    }
    if (!(quantity > 0.0)) {
        return CommandResult::fail("Position quantity must be positive");
    }
    if (!(entry_price > 0.0)) {
        return CommandResult::fail("Position entry price must be positive");
    }

    Position position;
    position.symbol = ticker.value();
    position.quantity = quantity;
    position.entry_price = entry_price;
    position.side = *parsed_side;
    position.entry_date = core::floor_to_day(entry_date.value_or(clock_->now()));
    position.notes = std::move(notes);
    auto created = store_->create_position(position);
    if (created.is_error()) {
        return command_fail(created);
    }
    return persisted(CommandResult::ok("Position " + std::to_string(created.value().id) +
                                       " added: " + position_side_to_string(position.side) + " " +
                                       position.symbol));
}

QueryResult<std::vector<Position>> PipelineService::list_positions() const {
    auto positions = store_->list_positions();
    if (positions.is_error()) {
        return query_fail<std::vector<Position>>(positions);
    }
    return query_ok(positions.take_value());
}

CommandResult PipelineService::delete_position(int64_t position_id) {
    auto deleted = store_->delete_position(position_id);
    if (deleted.is_error()) {
        return command_fail(deleted);
    }
    return persisted(CommandResult::ok("Position " + std::to_string(position_id) + " deleted"));
}

QueryResult<PortfolioSummary> PipelineService::get_portfolio() const {
    auto positions = store_->list_positions();
    if (positions.is_error()) {
        return query_fail<PortfolioSummary>(positions);
    }

    PortfolioSummary summary;
    for (const auto& position : positions.value()) {
        PositionValuation v;
        v.position = position;
        v.current_price = position.entry_price;
        auto latest = store_->latest_price(position.symbol);
        if (latest.is_ok()) {
            v.current_price = latest.value().bar.close;
        } else if (latest.error()->code() != ErrorCode::DATA_NOT_FOUND) {
            return query_fail<PortfolioSummary>(latest);
        }
        v.cost_basis = position.quantity * position.entry_price;
        v.current_value = position.quantity * v.current_price;
        v.pnl = position.side == PositionSide::LONG ? v.current_value - v.cost_basis
                                                    : v.cost_basis - v.current_value;
        v.pnl_percent = v.cost_basis != 0.0 ? v.pnl / v.cost_basis * 100.0 : 0.0;

        summary.total_cost += v.cost_basis;
        summary.total_value += v.current_value;
        summary.total_pnl += v.pnl;
        summary.positions.push_back(std::move(v));
    }
    summary.total_pnl_percent =
        summary.total_cost != 0.0 ? summary.total_pnl / summary.total_cost * 100.0 : 0.0;
    return query_ok(std::move(summary));
}

CommandResult PipelineService::create_watchlist(const std::string& name,
                                                std::optional<std::string> description) {
    if (name.empty()) {
        return CommandResult::fail("Watchlist name must not be empty");
    }
    Watchlist watchlist;
    watchlist.name = name;
    watchlist.description = std::move(description);
    watchlist.created_at = clock_->now();
    auto created = store_->create_watchlist(watchlist);
    if (created.is_error()) {
        return command_fail(created);
    }
    return persisted(CommandResult::ok("Watchlist " + std::to_string(created.value().id) +
                                       " created: " + name));
}

QueryResult<std::vector<Watchlist>> PipelineService::list_watchlists() const {
    auto watchlists = store_->list_watchlists();
    if (watchlists.is_error()) {
        return query_fail<std::vector<Watchlist>>(watchlists);
    }
    return query_ok(watchlists.take_value());
}

CommandResult PipelineService::delete_watchlist(int64_t watchlist_id) {
    auto deleted = store_->delete_watchlist(watchlist_id);
    if (deleted.is_error()) {
        return command_fail(deleted);
    }
    return persisted(CommandResult::ok("Watchlist " + std::to_string(watchlist_id) + " deleted"));
}

CommandResult PipelineService::add_to_watchlist(int64_t watchlist_id, const std::string& symbol) {
    auto ticker = normalize_symbol(symbol);
    if (ticker.is_error()) {
        return command_fail(ticker);
    }
    auto added = store_->add_to_watchlist(watchlist_id, ticker.value());
    if (added.is_error()) {
        return command_fail(added);
    }
    return persisted(CommandResult::ok(ticker.value() + " added to watchlist " +
                                       std::to_string(watchlist_id)));
}

CommandResult PipelineService::remove_from_watchlist(int64_t watchlist_id,
                                                     const std::string& symbol) {
    auto ticker = normalize_symbol(symbol);
    if (ticker.is_error()) {
        return command_fail(ticker);
    }
    auto removed = store_->remove_from_watchlist(watchlist_id, ticker.value());
    if (removed.is_error()) {
        return command_fail(removed);
    }
    return persisted(CommandResult::ok(ticker.value() + " removed from watchlist " +
                                       std::to_string(watchlist_id)));
}

QueryResult<std::vector<std::string>> PipelineService::get_watchlist_symbols(
    int64_t watchlist_id) const {
    auto members = store_->watchlist_symbols(watchlist_id);
    if (members.is_error()) {
        return query_fail<std::vector<std::string>>(members);
    }
    return query_ok(members.take_value());
}

QueryResult<std::vector<MacroObservation>> PipelineService::get_macro_data() const {
    auto latest = store_->latest_macro();
    if (latest.is_error()) {
        return query_fail<std::vector<MacroObservation>>(latest);
    }
    return query_ok(latest.take_value());
}

QueryResult<std::vector<MacroObservation>> PipelineService::get_macro_series(
    const std::string& code) const {
    auto series = store_->macro_series(code);
    if (series.is_error()) {
        return query_fail<std::vector<MacroObservation>>(series);
    }
    return query_ok(series.take_value());
}

QueryResult<QuotaUsage> PipelineService::get_api_usage(const std::string& source) const {
    if (!config_.source(source)) {
        return query_fail<QuotaUsage>("Unknown source: " + source);
    }
    QuotaUsage usage = limiter_->usage(source);
    std::ostringstream ss;
    ss << source << ": " << usage.used << "/"
       << (usage.quota > 0 ? std::to_string(usage.quota) : "unlimited") << " calls in the last "
       << usage.window.count() << "s";
    return query_ok(usage, ss.str());
}

RefreshReport PipelineService::refresh_favorites(const SchedulerConfig& scheduler) {
    ScopedLogComponent log_component(kComponent);
    RefreshReport report;
    report.started = clock_->now();

    auto favorites = store_->favorited_symbols();
    if (favorites.is_error()) {
        report.success = false;
        report.message = favorites.error()->what();
        report.finished = clock_->now();
        return report;
    }
    report.symbols = favorites.take_value();

    std::vector<std::string> parts;
    if (report.symbols.empty()) {
        parts.push_back("No favorited symbols");
    } else if (!eod_) {
        report.success = false;
        parts.push_back(std::string("Source ") + kEodSource + " is not configured");
    } else {
        PriceIngest ingest = ingest_prices(*eod_, report.symbols, scheduler.range, "");
        report.succeeded = ingest.batch.succeeded();
        report.failed = ingest.batch.failed() + ingest.rejected.size();
        report.alerts_triggered = ingest.alerts_triggered + ingest.indicator_alerts_triggered;
        report.quota_exhausted = ingest.batch.quota_exhausted;
        parts.push_back(price_ingest_message(ingest));

        // Intraday runs after EOD so today's aggregated bar wins until the next close
        if (scheduler.intraday && intraday_ && !report.quota_exhausted) {
            PriceIngest today = ingest_prices(*intraday_, report.symbols, FetchRange::COMPACT, "");
            report.alerts_triggered += today.alerts_triggered + today.indicator_alerts_triggered;
            report.quota_exhausted = report.quota_exhausted || today.batch.quota_exhausted;
            parts.push_back("Intraday: " + price_ingest_message(today));
        }
    }

    if (scheduler.run_macro && !scheduler.macro_codes.empty()) {
        CommandResult macro = fetch_macro(scheduler.macro_codes);
        parts.push_back("Macro: " + macro.message);
    }

    std::ostringstream ss;
    for (size_t i = 0; i < parts.size(); ++i) {
        ss << (i ? " | " : "") << parts[i];
    }
    report.message = ss.str();

    CommandResult flushed = persisted(CommandResult::ok(report.message));
    report.success = report.success && flushed.success;
    report.message = flushed.message;
    report.finished = clock_->now();

    publish(PipelineEventType::REFRESH_COMPLETED, "",
            {{"symbols", static_cast<double>(report.symbols.size())},
             {"succeeded", static_cast<double>(report.succeeded)},
             {"alerts_triggered", static_cast<double>(report.alerts_triggered)}});
    return report;
}

}  // namespace finpipe
