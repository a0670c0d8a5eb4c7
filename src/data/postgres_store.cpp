// src/data/postgres_store.cpp

#include "finpipe/data/postgres_store.hpp"
#include <atomic>
#include <cmath>
#include <map>
#include "finpipe/core/logger.hpp"
#include "finpipe/core/state_manager.hpp"
#include "finpipe/core/time_utils.hpp"

namespace finpipe {

namespace {

constexpr const char* kComponent = "PostgresStore";

// Arbitrary key shared by every process migrating the same database
constexpr int64_t kMigrationLockKey = 0x66696e70697065;

struct Migration {
    int version;
    std::vector<std::string> statements;
};

const std::vector<Migration>& migrations() {
    static const std::vector<Migration> steps = {
        {1,
         {
             R"(CREATE TABLE IF NOT EXISTS finpipe.symbols (
                    symbol      TEXT PRIMARY KEY,
                    name        TEXT NOT NULL DEFAULT '',
                    sector      TEXT NOT NULL DEFAULT '',
                    industry    TEXT NOT NULL DEFAULT '',
                    exchange    TEXT NOT NULL DEFAULT '',
                    currency    TEXT NOT NULL DEFAULT '',
                    country     TEXT NOT NULL DEFAULT '',
                    asset_class TEXT NOT NULL DEFAULT 'equity',
                    favorited   BOOLEAN NOT NULL DEFAULT FALSE,
                    updated_at  TIMESTAMP NOT NULL DEFAULT (now() AT TIME ZONE 'UTC')))",
             R"(CREATE TABLE IF NOT EXISTS finpipe.daily_prices (
                    symbol TEXT NOT NULL REFERENCES finpipe.symbols(symbol),
                    date   DATE NOT NULL,
                    open   DOUBLE PRECISION NOT NULL,
                    high   DOUBLE PRECISION NOT NULL,
                    low    DOUBLE PRECISION NOT NULL,
                    close  DOUBLE PRECISION NOT NULL,
                    volume DOUBLE PRECISION NOT NULL DEFAULT 0,
                    PRIMARY KEY (symbol, date)))",
             R"(CREATE TABLE IF NOT EXISTS finpipe.macro_data (
                    indicator TEXT NOT NULL,
                    date      DATE NOT NULL,
                    value     DOUBLE PRECISION NOT NULL,
                    frequency TEXT NOT NULL DEFAULT 'daily',
                    source    TEXT NOT NULL DEFAULT 'FRED',
                    PRIMARY KEY (indicator, date)))",
             R"(CREATE TABLE IF NOT EXISTS finpipe.technical_indicators (
                    symbol         TEXT NOT NULL REFERENCES finpipe.symbols(symbol),
                    indicator_name TEXT NOT NULL,
                    date           DATE NOT NULL,
                    value          DOUBLE PRECISION NOT NULL,
                    PRIMARY KEY (symbol, indicator_name, date)))",
             R"(CREATE TABLE IF NOT EXISTS finpipe.alerts (
                    id           BIGSERIAL PRIMARY KEY,
                    symbol       TEXT NOT NULL REFERENCES finpipe.symbols(symbol),
                    target_price DOUBLE PRECISION NOT NULL,
                    condition    TEXT NOT NULL CHECK (condition IN ('above', 'below')),
                    triggered    BOOLEAN NOT NULL DEFAULT FALSE,
                    created_at   TIMESTAMP NOT NULL DEFAULT (now() AT TIME ZONE 'UTC')))",
             R"(CREATE TABLE IF NOT EXISTS finpipe.watchlists (
                    id          BIGSERIAL PRIMARY KEY,
                    name        TEXT NOT NULL UNIQUE,
                    description TEXT,
                    created_at  TIMESTAMP NOT NULL DEFAULT (now() AT TIME ZONE 'UTC')))",
             R"(CREATE TABLE IF NOT EXISTS finpipe.watchlist_symbols (
                    watchlist_id BIGINT NOT NULL REFERENCES finpipe.watchlists(id) ON DELETE CASCADE,
                    symbol       TEXT NOT NULL REFERENCES finpipe.symbols(symbol),
                    added_at     TIMESTAMP NOT NULL DEFAULT (now() AT TIME ZONE 'UTC'),
                    PRIMARY KEY (watchlist_id, symbol)))",
         }},
        {2,
         {
             R"(CREATE TABLE IF NOT EXISTS finpipe.positions (
                    id          BIGSERIAL PRIMARY KEY,
                    symbol      TEXT NOT NULL REFERENCES finpipe.symbols(symbol),
                    quantity    DOUBLE PRECISION NOT NULL,
                    entry_price DOUBLE PRECISION NOT NULL,
                    side        TEXT NOT NULL DEFAULT 'long',
                    entry_date  DATE NOT NULL))",
             R"(CREATE TABLE IF NOT EXISTS finpipe.api_calls (
                    id            BIGSERIAL PRIMARY KEY,
                    source        TEXT NOT NULL,
                    endpoint      TEXT NOT NULL DEFAULT '',
                    symbol        TEXT NOT NULL DEFAULT '',
                    called_at     TIMESTAMP NOT NULL,
                    success       BOOLEAN NOT NULL,
                    error_message TEXT NOT NULL DEFAULT ''))",
             "CREATE INDEX IF NOT EXISTS api_calls_source_time_idx "
             "ON finpipe.api_calls (source, called_at)",
         }},
        {3,
         {
             "ALTER TABLE finpipe.daily_prices "
             "ADD COLUMN IF NOT EXISTS adjusted_close DOUBLE PRECISION DEFAULT NULL",
             "ALTER TABLE finpipe.daily_prices "
             "ADD COLUMN IF NOT EXISTS source TEXT NOT NULL DEFAULT ''",
             "ALTER TABLE finpipe.positions ADD COLUMN IF NOT EXISTS notes TEXT DEFAULT NULL",
         }},
        {4,
         {
             R"(CREATE TABLE IF NOT EXISTS finpipe.indicator_alerts (
                    id                  BIGSERIAL PRIMARY KEY,
                    symbol              TEXT NOT NULL REFERENCES finpipe.symbols(symbol),
                    alert_type          TEXT NOT NULL
                        CHECK (alert_type IN ('threshold', 'crossover', 'band_touch')),
                    indicator_name      TEXT NOT NULL,
                    secondary_indicator TEXT,
                    condition           TEXT NOT NULL CHECK (condition IN (
                        'crosses_above', 'crosses_below', 'bullish_crossover', 'bearish_crossover')),
                    threshold           DOUBLE PRECISION,
                    triggered           BOOLEAN NOT NULL DEFAULT FALSE,
                    last_value          DOUBLE PRECISION,
                    message             TEXT,
                    created_at          TIMESTAMP NOT NULL DEFAULT (now() AT TIME ZONE 'UTC')))",
             "CREATE INDEX IF NOT EXISTS indicator_alerts_symbol_idx "
             "ON finpipe.indicator_alerts (symbol)",
         }},
    };
    return steps;
}

// Rows are read back through to_char so the text format never depends on DateStyle
Timestamp read_date(const pqxx::field& field) {
    auto parsed = core::parse_date(field.as<std::string>());
    if (!parsed) {
        throw std::runtime_error("Unparseable date from database: " + field.as<std::string>());
    }
    return *parsed;
}

Timestamp read_timestamp(const pqxx::field& field) {
    auto parsed = core::parse_timestamp(field.as<std::string>());
    if (!parsed) {
        throw std::runtime_error("Unparseable timestamp from database: " +
                                 field.as<std::string>());
    }
    return *parsed;
}

std::optional<std::string> read_optional(const pqxx::field& field) {
    if (field.is_null()) {
        return std::nullopt;
    }
    return field.as<std::string>();
}

const char* kSymbolColumns =
    "symbol, name, sector, industry, exchange, currency, country, asset_class, favorited";

SymbolInfo symbol_from_row(const pqxx::row& row) {
    SymbolInfo info;
    info.symbol = row["symbol"].as<std::string>();
    info.name = row["name"].as<std::string>();
    info.sector = row["sector"].as<std::string>();
    info.industry = row["industry"].as<std::string>();
    info.exchange = row["exchange"].as<std::string>();
    info.currency = row["currency"].as<std::string>();
    info.country = row["country"].as<std::string>();
    info.asset_class = row["asset_class"].as<std::string>();
    info.favorited = row["favorited"].as<bool>();
    return info;
}

const char* kBarColumns =
    "symbol, to_char(date, 'YYYY-MM-DD') AS date, open, high, low, close, volume, "
    "COALESCE(adjusted_close, close) AS adjusted_close, source";

PriceBar bar_from_row(const pqxx::row& row) {
    PriceBar bar(row["symbol"].as<std::string>(), read_date(row["date"]),
                 row["open"].as<double>(), row["high"].as<double>(), row["low"].as<double>(),
                 row["close"].as<double>(), row["volume"].as<double>(),
                 row["source"].as<std::string>());
    bar.adjusted_close = row["adjusted_close"].as<double>();
    return bar;
}

const char* kMacroColumns =
    "indicator, to_char(date, 'YYYY-MM-DD') AS date, value, frequency, source";

MacroObservation macro_from_row(const pqxx::row& row) {
    MacroObservation obs;
    obs.indicator = row["indicator"].as<std::string>();
    obs.date = read_date(row["date"]);
    obs.value = row["value"].as<double>();
    obs.frequency = macro_frequency_from_string(row["frequency"].as<std::string>());
    obs.source = row["source"].as<std::string>();
    return obs;
}

const char* kAlertColumns =
    "id, symbol, target_price, condition, triggered, "
    "to_char(created_at, 'YYYY-MM-DD HH24:MI:SS') AS created_at";

Alert alert_from_row(const pqxx::row& row) {
    Alert alert;
    alert.id = row["id"].as<int64_t>();
    alert.symbol = row["symbol"].as<std::string>();
    alert.target_price = row["target_price"].as<double>();
    auto condition = alert_condition_from_string(row["condition"].as<std::string>());
    if (!condition) {
        throw std::runtime_error("Unknown alert condition " + row["condition"].as<std::string>());
    }
    alert.condition = *condition;
    alert.triggered = row["triggered"].as<bool>();
    alert.created_at = read_timestamp(row["created_at"]);
    return alert;
}

const char* kIndicatorAlertColumns =
    "id, symbol, alert_type, indicator_name, secondary_indicator, condition, threshold, "
    "triggered, last_value, message, to_char(created_at, 'YYYY-MM-DD HH24:MI:SS') AS created_at";

std::optional<double> read_optional_double(const pqxx::field& field) {
    if (field.is_null()) {
        return std::nullopt;
    }
    return field.as<double>();
}

IndicatorAlert indicator_alert_from_row(const pqxx::row& row) {
    IndicatorAlert alert;
    alert.id = row["id"].as<int64_t>();
    alert.symbol = row["symbol"].as<std::string>();
    auto type = indicator_alert_type_from_string(row["alert_type"].as<std::string>());
    auto condition = indicator_alert_condition_from_string(row["condition"].as<std::string>());
    if (!type || !condition) {
        throw std::runtime_error("Unknown indicator alert kind for alert " +
                                 std::to_string(alert.id));
    }
    alert.alert_type = *type;
    alert.condition = *condition;
    alert.indicator = row["indicator_name"].as<std::string>();
    alert.secondary_indicator = read_optional(row["secondary_indicator"]);
    alert.threshold = read_optional_double(row["threshold"]);
    alert.triggered = row["triggered"].as<bool>();
    alert.last_value = read_optional_double(row["last_value"]);
    alert.message = read_optional(row["message"]);
    alert.created_at = read_timestamp(row["created_at"]);
    return alert;
}

const char* kPositionColumns =
    "id, symbol, quantity, entry_price, side, to_char(entry_date, 'YYYY-MM-DD') AS entry_date, "
    "notes";

Position position_from_row(const pqxx::row& row) {
    Position position;
    position.id = row["id"].as<int64_t>();
    position.symbol = row["symbol"].as<std::string>();
    position.quantity = row["quantity"].as<double>();
    position.entry_price = row["entry_price"].as<double>();
    auto side = position_side_from_string(row["side"].as<std::string>());
    if (!side) {
        throw std::runtime_error("Unknown position side " + row["side"].as<std::string>());
    }
    position.side = *side;
    position.entry_date = read_date(row["entry_date"]);
    position.notes = read_optional(row["notes"]);
    return position;
}

const char* kWatchlistColumns =
    "id, name, description, to_char(created_at, 'YYYY-MM-DD HH24:MI:SS') AS created_at";

Watchlist watchlist_from_row(const pqxx::row& row) {
    Watchlist watchlist;
    watchlist.id = row["id"].as<int64_t>();
    watchlist.name = row["name"].as<std::string>();
    watchlist.description = read_optional(row["description"]);
    watchlist.created_at = read_timestamp(row["created_at"]);
    return watchlist;
}

const char* kApiCallColumns =
    "source, endpoint, symbol, to_char(called_at, 'YYYY-MM-DD HH24:MI:SS') AS called_at, "
    "success, error_message";

ApiCallRecord api_call_from_row(const pqxx::row& row) {
    ApiCallRecord record;
    record.source = row["source"].as<std::string>();
    record.endpoint = row["endpoint"].as<std::string>();
    record.symbol = row["symbol"].as<std::string>();
    record.timestamp = read_timestamp(row["called_at"]);
    record.success = row["success"].as<bool>();
    record.error_message = row["error_message"].as<std::string>();
    return record;
}

template <typename T>
Result<T> not_found(const std::string& what) {
    return make_error<T>(ErrorCode::DATA_NOT_FOUND, what, kComponent);
}

}  // namespace

PostgresStore::PostgresStore(std::string connection_string, size_t pool_size)
    : connection_string_(std::move(connection_string)), pool_size_(pool_size) {}

PostgresStore::~PostgresStore() {
    disconnect();
}

Result<void> PostgresStore::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pool_) {
        return Result<void>();
    }

    auto pool = std::make_unique<ConnectionPool>(connection_string_, pool_size_);
    auto init = pool->initialize();
    if (init.is_error()) {
        return forward_error<void>(init, kComponent);
    }
    pool_ = std::move(pool);

    static std::atomic<int> counter{0};
    std::string unique_id = "POSTGRES_STORE_" + std::to_string(++counter);
    ComponentInfo info{ComponentType::STORE, ComponentState::INITIALIZED, unique_id, "",
                       std::chrono::system_clock::now(), {}};
    auto register_result = StateManager::instance().register_component(info);
    if (register_result.is_error()) {
        // The store is still usable without a registry entry
        WARN("Failed to register store with StateManager: " << register_result.error()->what());
    } else {
        component_id_ = unique_id;
        auto state = StateManager::instance().update_state(component_id_, ComponentState::RUNNING);
        if (state.is_error()) {
            WARN("Failed to mark store running: " << state.error()->what());
        }
    }

    INFO("Connected to PostgreSQL with " << pool_->size() << " pooled connections");
    return Result<void>();
}

void PostgresStore::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pool_) {
        return;
    }
    pool_.reset();
    if (!component_id_.empty()) {
        auto result = StateManager::instance().unregister_component(component_id_);
        if (result.is_error()) {
            WARN("Error unregistering store component: " << result.error()->what());
        }
        component_id_.clear();
    }
    INFO("Disconnected from PostgreSQL");
}

bool PostgresStore::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_ != nullptr && pool_->size() > 0;
}

template <typename T, typename Func>
Result<T> PostgresStore::run_transaction(const std::string& operation, Func&& body) const {
    ConnectionPool* pool = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pool = pool_.get();
    }
    if (!pool) {
        return make_error<T>(ErrorCode::NOT_INITIALIZED,
                             "Store is not connected (" + operation + ")", kComponent);
    }

    auto guard = pool->acquire();
    if (!guard) {
        return make_error<T>(ErrorCode::CONNECTION_ERROR,
                             "No database connection available for " + operation, kComponent);
    }

    try {
        pqxx::work txn(*guard.get());
        Result<T> result = body(txn);
        if (result.is_ok()) {
            txn.commit();
        }
        return result;
    } catch (const pqxx::unique_violation& e) {
        return make_error<T>(ErrorCode::CONSTRAINT_VIOLATION,
                             operation + ": duplicate key: " + e.what(), kComponent);
    } catch (const pqxx::foreign_key_violation& e) {
        return make_error<T>(ErrorCode::CONSTRAINT_VIOLATION,
                             operation + ": unknown reference: " + e.what(), kComponent);
    } catch (const pqxx::check_violation& e) {
        return make_error<T>(ErrorCode::CONSTRAINT_VIOLATION,
                             operation + ": check failed: " + e.what(), kComponent);
    } catch (const pqxx::broken_connection& e) {
        return make_error<T>(ErrorCode::CONNECTION_ERROR,
                             operation + ": connection lost: " + e.what(), kComponent);
    } catch (const std::exception& e) {
        return make_error<T>(ErrorCode::DATABASE_ERROR, operation + " failed: " + e.what(),
                             kComponent);
    }
}

Result<int> PostgresStore::migrate() {
    auto connected = connect();
    if (connected.is_error()) {
        return forward_error<int>(connected, kComponent);
    }

    return run_transaction<int>("migrate", [](pqxx::work& txn) -> Result<int> {
        txn.exec_params("SELECT pg_advisory_xact_lock($1)", kMigrationLockKey);
        txn.exec("CREATE SCHEMA IF NOT EXISTS finpipe");
        txn.exec(R"(CREATE TABLE IF NOT EXISTS finpipe.schema_meta (
                        id         INT PRIMARY KEY CHECK (id = 1),
                        version    INT NOT NULL,
                        updated_at TIMESTAMP NOT NULL DEFAULT (now() AT TIME ZONE 'UTC')))");

        auto current = txn.exec("SELECT version FROM finpipe.schema_meta WHERE id = 1");
        int version = current.empty() ? 0 : current[0][0].as<int>();
        if (version > kSchemaVersion) {
            return make_error<int>(ErrorCode::INVALID_DATA,
                                   "Database schema version " + std::to_string(version) +
                                       " is newer than supported version " +
                                       std::to_string(kSchemaVersion),
                                   kComponent);
        }

        for (const auto& step : migrations()) {
            if (step.version <= version) {
                continue;
            }
            for (const auto& statement : step.statements) {
                txn.exec(statement);
            }
            INFO("Applied schema migration " << step.version);
        }

        txn.exec_params(
            "INSERT INTO finpipe.schema_meta (id, version) VALUES (1, $1) "
            "ON CONFLICT (id) DO UPDATE SET version = EXCLUDED.version, "
            "updated_at = now() AT TIME ZONE 'UTC'",
            kSchemaVersion);
        return kSchemaVersion;
    });
}

// Symbols

Result<size_t> PostgresStore::upsert_symbols(const std::vector<SymbolInfo>& symbols) {
    std::vector<SymbolInfo> normalized;
    normalized.reserve(symbols.size());
    for (const auto& info : symbols) {
        auto ticker = normalize_symbol(info.symbol);
        if (ticker.is_error()) {
            return forward_error<size_t>(ticker, kComponent);
        }
        SymbolInfo copy = info;
        copy.symbol = ticker.value();
        if (copy.asset_class.empty()) {
            copy.asset_class = "equity";
        }
        normalized.push_back(std::move(copy));
    }

    return run_transaction<size_t>("upsert_symbols", [&](pqxx::work& txn) -> Result<size_t> {
        // Blank metadata never overwrites known values; favorited is never touched
        const std::string query = R"(
            INSERT INTO finpipe.symbols
                (symbol, name, sector, industry, exchange, currency, country, asset_class)
            VALUES ($1, $2, $3, $4, $5, $6, $7, $8)
            ON CONFLICT (symbol) DO UPDATE SET
                name        = COALESCE(NULLIF(EXCLUDED.name, ''), finpipe.symbols.name),
                sector      = COALESCE(NULLIF(EXCLUDED.sector, ''), finpipe.symbols.sector),
                industry    = COALESCE(NULLIF(EXCLUDED.industry, ''), finpipe.symbols.industry),
                exchange    = COALESCE(NULLIF(EXCLUDED.exchange, ''), finpipe.symbols.exchange),
                currency    = COALESCE(NULLIF(EXCLUDED.currency, ''), finpipe.symbols.currency),
                country     = COALESCE(NULLIF(EXCLUDED.country, ''), finpipe.symbols.country),
                asset_class = COALESCE(NULLIF(EXCLUDED.asset_class, ''),
                                       finpipe.symbols.asset_class),
                updated_at  = now() AT TIME ZONE 'UTC')";
        for (const auto& info : normalized) {
            txn.exec_params(query, info.symbol, info.name, info.sector, info.industry,
                            info.exchange, info.currency, info.country, info.asset_class);
        }
        return normalized.size();
    });
}

Result<SymbolInfo> PostgresStore::get_symbol(const std::string& symbol) const {
    return run_transaction<SymbolInfo>("get_symbol", [&](pqxx::work& txn) -> Result<SymbolInfo> {
        auto rows = txn.exec_params(std::string("SELECT ") + kSymbolColumns +
                                        " FROM finpipe.symbols WHERE symbol = $1",
                                    symbol);
        if (rows.empty()) {
            return not_found<SymbolInfo>("Unknown symbol: " + symbol);
        }
        return symbol_from_row(rows[0]);
    });
}

Result<std::vector<SymbolInfo>> PostgresStore::list_symbols() const {
    using Rows = std::vector<SymbolInfo>;
    return run_transaction<Rows>("list_symbols", [](pqxx::work& txn) -> Result<Rows> {
        auto rows = txn.exec(std::string("SELECT ") + kSymbolColumns +
                             " FROM finpipe.symbols ORDER BY symbol");
        Rows result;
        result.reserve(rows.size());
        for (const auto& row : rows) {
            result.push_back(symbol_from_row(row));
        }
        return result;
    });
}

Result<void> PostgresStore::set_favorite(const std::string& symbol, bool favorited) {
    return run_transaction<void>("set_favorite", [&](pqxx::work& txn) -> Result<void> {
        auto rows = txn.exec_params(
            "UPDATE finpipe.symbols SET favorited = $2 WHERE symbol = $1", symbol, favorited);
        if (rows.affected_rows() == 0) {
            return not_found<void>("Unknown symbol: " + symbol);
        }
        return Result<void>();
    });
}

Result<bool> PostgresStore::toggle_favorite(const std::string& symbol) {
    return run_transaction<bool>("toggle_favorite", [&](pqxx::work& txn) -> Result<bool> {
        auto rows = txn.exec_params(
            "UPDATE finpipe.symbols SET favorited = NOT favorited WHERE symbol = $1 "
            "RETURNING favorited",
            symbol);
        if (rows.empty()) {
            return not_found<bool>("Unknown symbol: " + symbol);
        }
        return rows[0][0].as<bool>();
    });
}

Result<std::vector<std::string>> PostgresStore::favorited_symbols() const {
    using Rows = std::vector<std::string>;
    return run_transaction<Rows>("favorited_symbols", [](pqxx::work& txn) -> Result<Rows> {
        auto rows =
            txn.exec("SELECT symbol FROM finpipe.symbols WHERE favorited ORDER BY symbol");
        Rows result;
        for (const auto& row : rows) {
            result.push_back(row[0].as<std::string>());
        }
        return result;
    });
}

Result<std::vector<std::string>> PostgresStore::symbols_with_prices() const {
    using Rows = std::vector<std::string>;
    return run_transaction<Rows>("symbols_with_prices", [](pqxx::work& txn) -> Result<Rows> {
        auto rows =
            txn.exec("SELECT DISTINCT symbol FROM finpipe.daily_prices ORDER BY symbol");
        Rows result;
        for (const auto& row : rows) {
            result.push_back(row[0].as<std::string>());
        }
        return result;
    });
}

// Prices

Result<size_t> PostgresStore::upsert_price_bars(const std::vector<PriceBar>& bars) {
    for (const auto& bar : bars) {
        if (!std::isfinite(bar.close) || !std::isfinite(bar.open) || !std::isfinite(bar.high) ||
            !std::isfinite(bar.low)) {
            return make_error<size_t>(ErrorCode::INVALID_DATA,
                                      "Non-finite price in bar for " + bar.symbol + " on " +
                                          core::format_date(bar.date),
                                      kComponent);
        }
    }

    auto result =
        run_transaction<size_t>("upsert_price_bars", [&](pqxx::work& txn) -> Result<size_t> {
            const std::string query = R"(
                INSERT INTO finpipe.daily_prices
                    (symbol, date, open, high, low, close, volume, adjusted_close, source)
                VALUES ($1, $2::date, $3, $4, $5, $6, $7, $8, $9)
                ON CONFLICT (symbol, date) DO UPDATE SET
                    open = EXCLUDED.open, high = EXCLUDED.high, low = EXCLUDED.low,
                    close = EXCLUDED.close, volume = EXCLUDED.volume,
                    adjusted_close = EXCLUDED.adjusted_close, source = EXCLUDED.source)";
            for (const auto& bar : bars) {
                txn.exec_params(query, bar.symbol, core::format_date(bar.date), bar.open,
                                bar.high, bar.low, bar.close, bar.volume, bar.adjusted_close,
                                bar.source);
            }
            return bars.size();
        });
    if (result.is_ok()) {
        TRACE("Upserted " << result.value() << " bars");
    }
    return result;
}

Result<LatestQuote> PostgresStore::latest_price(const std::string& symbol) const {
    return run_transaction<LatestQuote>(
        "latest_price", [&](pqxx::work& txn) -> Result<LatestQuote> {
            auto rows = txn.exec_params(std::string("SELECT ") + kBarColumns +
                                            " FROM finpipe.daily_prices WHERE symbol = $1 "
                                            "ORDER BY date DESC LIMIT 2",
                                        symbol);
            if (rows.empty()) {
                return not_found<LatestQuote>("No cached prices for " + symbol);
            }
            LatestQuote quote;
            quote.bar = bar_from_row(rows[0]);
            if (rows.size() > 1) {
                quote.previous_close = rows[1]["close"].as<double>();
            }
            return quote;
        });
}

Result<std::vector<PriceBar>> PostgresStore::price_history(const std::string& symbol,
                                                           const DateRange& range) const {
    using Rows = std::vector<PriceBar>;
    return run_transaction<Rows>("price_history", [&](pqxx::work& txn) -> Result<Rows> {
        std::optional<std::string> start;
        std::optional<std::string> end;
        if (range.start)
            start = core::format_date(*range.start);
        if (range.end)
            end = core::format_date(*range.end);

        auto rows = txn.exec_params(std::string("SELECT ") + kBarColumns +
                                        " FROM finpipe.daily_prices WHERE symbol = $1 "
                                        "AND ($2::date IS NULL OR date >= $2::date) "
                                        "AND ($3::date IS NULL OR date <= $3::date) "
                                        "ORDER BY date",
                                    symbol, start, end);
        Rows result;
        result.reserve(rows.size());
        for (const auto& row : rows) {
            result.push_back(bar_from_row(row));
        }
        return result;
    });
}

// Macro

Result<size_t> PostgresStore::upsert_macro(const std::vector<MacroObservation>& observations) {
    for (const auto& obs : observations) {
        if (obs.indicator.empty()) {
            return make_error<size_t>(ErrorCode::INVALID_ARGUMENT,
                                      "Macro observation without indicator code", kComponent);
        }
    }

    return run_transaction<size_t>("upsert_macro", [&](pqxx::work& txn) -> Result<size_t> {
        const std::string query = R"(
            INSERT INTO finpipe.macro_data (indicator, date, value, frequency, source)
            VALUES ($1, $2::date, $3, $4, $5)
            ON CONFLICT (indicator, date) DO UPDATE SET
                value = EXCLUDED.value, frequency = EXCLUDED.frequency,
                source = EXCLUDED.source)";
        for (const auto& obs : observations) {
            txn.exec_params(query, obs.indicator, core::format_date(obs.date), obs.value,
                            macro_frequency_to_string(obs.frequency), obs.source);
        }
        return observations.size();
    });
}

Result<std::vector<MacroObservation>> PostgresStore::macro_series(const std::string& code) const {
    using Rows = std::vector<MacroObservation>;
    return run_transaction<Rows>("macro_series", [&](pqxx::work& txn) -> Result<Rows> {
        auto rows = txn.exec_params(std::string("SELECT ") + kMacroColumns +
                                        " FROM finpipe.macro_data WHERE indicator = $1 "
                                        "ORDER BY date",
                                    code);
        Rows result;
        result.reserve(rows.size());
        for (const auto& row : rows) {
            result.push_back(macro_from_row(row));
        }
        return result;
    });
}

Result<std::vector<std::string>> PostgresStore::macro_codes() const {
    using Rows = std::vector<std::string>;
    return run_transaction<Rows>("macro_codes", [](pqxx::work& txn) -> Result<Rows> {
        auto rows =
            txn.exec("SELECT DISTINCT indicator FROM finpipe.macro_data ORDER BY indicator");
        Rows result;
        for (const auto& row : rows) {
            result.push_back(row[0].as<std::string>());
        }
        return result;
    });
}

Result<std::vector<MacroObservation>> PostgresStore::latest_macro() const {
    using Rows = std::vector<MacroObservation>;
    return run_transaction<Rows>("latest_macro", [](pqxx::work& txn) -> Result<Rows> {
        auto rows = txn.exec(std::string("SELECT DISTINCT ON (indicator) ") + kMacroColumns +
                             " FROM finpipe.macro_data ORDER BY indicator, date DESC");
        Rows result;
        for (const auto& row : rows) {
            result.push_back(macro_from_row(row));
        }
        return result;
    });
}

// Indicators

Result<void> PostgresStore::replace_indicator_series(const IndicatorSeries& series) {
    if (series.symbol.empty() || series.name.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Indicator series needs a symbol and a name", kComponent);
    }

    return run_transaction<void>("replace_indicator_series", [&](pqxx::work& txn) -> Result<void> {
        auto known = txn.exec_params("SELECT 1 FROM finpipe.symbols WHERE symbol = $1",
                                     series.symbol);
        if (known.empty()) {
            return make_error<void>(ErrorCode::CONSTRAINT_VIOLATION,
                                    "Indicator series references unknown symbol: " +
                                        series.symbol,
                                    kComponent);
        }
        txn.exec_params(
            "DELETE FROM finpipe.technical_indicators WHERE symbol = $1 AND indicator_name = $2",
            series.symbol, series.name);
        for (const auto& point : series.points) {
            txn.exec_params(
                "INSERT INTO finpipe.technical_indicators (symbol, indicator_name, date, value) "
                "VALUES ($1, $2, $3::date, $4) "
                "ON CONFLICT (symbol, indicator_name, date) DO UPDATE SET value = EXCLUDED.value",
                series.symbol, series.name, core::format_date(point.date), point.value);
        }
        return Result<void>();
    });
}

Result<IndicatorSeries> PostgresStore::indicator_history(const std::string& symbol,
                                                         const std::string& name) const {
    return run_transaction<IndicatorSeries>(
        "indicator_history", [&](pqxx::work& txn) -> Result<IndicatorSeries> {
            auto rows = txn.exec_params(
                "SELECT to_char(date, 'YYYY-MM-DD') AS date, value "
                "FROM finpipe.technical_indicators "
                "WHERE symbol = $1 AND indicator_name = $2 ORDER BY date",
                symbol, name);
            if (rows.empty()) {
                return not_found<IndicatorSeries>("No stored " + name + " series for " + symbol);
            }
            IndicatorSeries series;
            series.symbol = symbol;
            series.name = name;
            series.points.reserve(rows.size());
            for (const auto& row : rows) {
                series.points.push_back({read_date(row["date"]), row["value"].as<double>()});
            }
            return series;
        });
}

Result<std::unordered_map<std::string, IndicatorPoint>> PostgresStore::latest_indicators(
    const std::string& symbol) const {
    using Latest = std::unordered_map<std::string, IndicatorPoint>;
    return run_transaction<Latest>("latest_indicators", [&](pqxx::work& txn) -> Result<Latest> {
        auto rows = txn.exec_params(
            "SELECT DISTINCT ON (indicator_name) indicator_name, "
            "to_char(date, 'YYYY-MM-DD') AS date, value "
            "FROM finpipe.technical_indicators WHERE symbol = $1 "
            "ORDER BY indicator_name, date DESC",
            symbol);
        Latest result;
        for (const auto& row : rows) {
            result[row["indicator_name"].as<std::string>()] =
                IndicatorPoint{read_date(row["date"]), row["value"].as<double>()};
        }
        return result;
    });
}

// Alerts

Result<Alert> PostgresStore::create_alert(const Alert& alert) {
    return run_transaction<Alert>("create_alert", [&](pqxx::work& txn) -> Result<Alert> {
        auto rows = txn.exec_params(
            std::string("INSERT INTO finpipe.alerts (symbol, target_price, condition, triggered, "
                        "created_at) VALUES ($1, $2, $3, $4, $5::timestamp) RETURNING ") +
                kAlertColumns,
            alert.symbol, alert.target_price, alert_condition_to_string(alert.condition),
            alert.triggered, core::format_timestamp(alert.created_at));
        return alert_from_row(rows[0]);
    });
}

Result<std::vector<Alert>> PostgresStore::list_alerts(bool only_active) const {
    using Rows = std::vector<Alert>;
    return run_transaction<Rows>("list_alerts", [&](pqxx::work& txn) -> Result<Rows> {
        auto rows = txn.exec_params(std::string("SELECT ") + kAlertColumns +
                                        " FROM finpipe.alerts WHERE NOT ($1 AND triggered) "
                                        "ORDER BY id",
                                    only_active);
        Rows result;
        for (const auto& row : rows) {
            result.push_back(alert_from_row(row));
        }
        return result;
    });
}

Result<void> PostgresStore::mark_alert_triggered(int64_t alert_id) {
    return run_transaction<void>("mark_alert_triggered", [&](pqxx::work& txn) -> Result<void> {
        auto rows =
            txn.exec_params("UPDATE finpipe.alerts SET triggered = TRUE WHERE id = $1", alert_id);
        if (rows.affected_rows() == 0) {
            return not_found<void>("Unknown alert id " + std::to_string(alert_id));
        }
        return Result<void>();
    });
}

Result<void> PostgresStore::delete_alert(int64_t alert_id) {
    return run_transaction<void>("delete_alert", [&](pqxx::work& txn) -> Result<void> {
        auto rows = txn.exec_params("DELETE FROM finpipe.alerts WHERE id = $1", alert_id);
        if (rows.affected_rows() == 0) {
            return not_found<void>("Unknown alert id " + std::to_string(alert_id));
        }
        return Result<void>();
    });
}

// Indicator alerts

Result<IndicatorAlert> PostgresStore::create_indicator_alert(const IndicatorAlert& alert) {
    return run_transaction<IndicatorAlert>(
        "create_indicator_alert", [&](pqxx::work& txn) -> Result<IndicatorAlert> {
            auto rows = txn.exec_params(
                std::string("INSERT INTO finpipe.indicator_alerts (symbol, alert_type, "
                            "indicator_name, secondary_indicator, condition, threshold, "
                            "triggered, message, created_at) "
                            "VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9::timestamp) RETURNING ") +
                    kIndicatorAlertColumns,
                alert.symbol, indicator_alert_type_to_string(alert.alert_type), alert.indicator,
                alert.secondary_indicator, indicator_alert_condition_to_string(alert.condition),
                alert.threshold, alert.triggered, alert.message,
                core::format_timestamp(alert.created_at));
            return indicator_alert_from_row(rows[0]);
        });
}

Result<std::vector<IndicatorAlert>> PostgresStore::list_indicator_alerts(bool only_active) const {
    using Rows = std::vector<IndicatorAlert>;
    return run_transaction<Rows>("list_indicator_alerts", [&](pqxx::work& txn) -> Result<Rows> {
        auto rows = txn.exec_params(std::string("SELECT ") + kIndicatorAlertColumns +
                                        " FROM finpipe.indicator_alerts "
                                        "WHERE NOT ($1 AND triggered) ORDER BY id",
                                    only_active);
        Rows result;
        for (const auto& row : rows) {
            result.push_back(indicator_alert_from_row(row));
        }
        return result;
    });
}

Result<void> PostgresStore::mark_indicator_alert_triggered(int64_t alert_id) {
    return run_transaction<void>(
        "mark_indicator_alert_triggered", [&](pqxx::work& txn) -> Result<void> {
            auto rows = txn.exec_params(
                "UPDATE finpipe.indicator_alerts SET triggered = TRUE WHERE id = $1", alert_id);
            if (rows.affected_rows() == 0) {
                return not_found<void>("Unknown indicator alert id " + std::to_string(alert_id));
            }
            return Result<void>();
        });
}

Result<void> PostgresStore::update_indicator_alert_value(int64_t alert_id, double last_value) {
    return run_transaction<void>(
        "update_indicator_alert_value", [&](pqxx::work& txn) -> Result<void> {
            auto rows = txn.exec_params(
                "UPDATE finpipe.indicator_alerts SET last_value = $1 WHERE id = $2", last_value,
                alert_id);
            if (rows.affected_rows() == 0) {
                return not_found<void>("Unknown indicator alert id " + std::to_string(alert_id));
            }
            return Result<void>();
        });
}

Result<void> PostgresStore::delete_indicator_alert(int64_t alert_id) {
    return run_transaction<void>("delete_indicator_alert", [&](pqxx::work& txn) -> Result<void> {
        auto rows =
            txn.exec_params("DELETE FROM finpipe.indicator_alerts WHERE id = $1", alert_id);
        if (rows.affected_rows() == 0) {
            return not_found<void>("Unknown indicator alert id " + std::to_string(alert_id));
        }
        return Result<void>();
    });
}

// Positions

Result<Position> PostgresStore::create_position(const Position& position) {
    return run_transaction<Position>("create_position", [&](pqxx::work& txn) -> Result<Position> {
        auto rows = txn.exec_params(
            std::string("INSERT INTO finpipe.positions (symbol, quantity, entry_price, side, "
                        "entry_date, notes) VALUES ($1, $2, $3, $4, $5::date, $6) RETURNING ") +
                kPositionColumns,
            position.symbol, position.quantity, position.entry_price,
            position_side_to_string(position.side), core::format_date(position.entry_date),
            position.notes);
        return position_from_row(rows[0]);
    });
}

Result<std::vector<Position>> PostgresStore::list_positions() const {
    using Rows = std::vector<Position>;
    return run_transaction<Rows>("list_positions", [](pqxx::work& txn) -> Result<Rows> {
        auto rows = txn.exec(std::string("SELECT ") + kPositionColumns +
                             " FROM finpipe.positions ORDER BY id");
        Rows result;
        for (const auto& row : rows) {
            result.push_back(position_from_row(row));
        }
        return result;
    });
}

Result<void> PostgresStore::delete_position(int64_t position_id) {
    return run_transaction<void>("delete_position", [&](pqxx::work& txn) -> Result<void> {
        auto rows = txn.exec_params("DELETE FROM finpipe.positions WHERE id = $1", position_id);
        if (rows.affected_rows() == 0) {
            return not_found<void>("Unknown position id " + std::to_string(position_id));
        }
        return Result<void>();
    });
}

// Watchlists

Result<Watchlist> PostgresStore::create_watchlist(const Watchlist& watchlist) {
    return run_transaction<Watchlist>(
        "create_watchlist", [&](pqxx::work& txn) -> Result<Watchlist> {
            auto rows = txn.exec_params(
                std::string("INSERT INTO finpipe.watchlists (name, description, created_at) "
                            "VALUES ($1, $2, $3::timestamp) RETURNING ") +
                    kWatchlistColumns,
                watchlist.name, watchlist.description,
                core::format_timestamp(watchlist.created_at));
            return watchlist_from_row(rows[0]);
        });
}

Result<std::vector<Watchlist>> PostgresStore::list_watchlists() const {
    using Rows = std::vector<Watchlist>;
    return run_transaction<Rows>("list_watchlists", [](pqxx::work& txn) -> Result<Rows> {
        auto rows = txn.exec(std::string("SELECT ") + kWatchlistColumns +
                             " FROM finpipe.watchlists ORDER BY name");
        Rows result;
        for (const auto& row : rows) {
            result.push_back(watchlist_from_row(row));
        }
        return result;
    });
}

Result<void> PostgresStore::delete_watchlist(int64_t watchlist_id) {
    return run_transaction<void>("delete_watchlist", [&](pqxx::work& txn) -> Result<void> {
        auto rows =
            txn.exec_params("DELETE FROM finpipe.watchlists WHERE id = $1", watchlist_id);
        if (rows.affected_rows() == 0) {
            return not_found<void>("Unknown watchlist id " + std::to_string(watchlist_id));
        }
        return Result<void>();
    });
}

Result<void> PostgresStore::add_to_watchlist(int64_t watchlist_id, const std::string& symbol) {
    return run_transaction<void>("add_to_watchlist", [&](pqxx::work& txn) -> Result<void> {
        auto exists =
            txn.exec_params("SELECT 1 FROM finpipe.watchlists WHERE id = $1", watchlist_id);
        if (exists.empty()) {
            return not_found<void>("Unknown watchlist id " + std::to_string(watchlist_id));
        }
        txn.exec_params(
            "INSERT INTO finpipe.watchlist_symbols (watchlist_id, symbol) VALUES ($1, $2) "
            "ON CONFLICT DO NOTHING",
            watchlist_id, symbol);
        return Result<void>();
    });
}

Result<void> PostgresStore::remove_from_watchlist(int64_t watchlist_id,
                                                  const std::string& symbol) {
    return run_transaction<void>("remove_from_watchlist", [&](pqxx::work& txn) -> Result<void> {
        auto exists =
            txn.exec_params("SELECT 1 FROM finpipe.watchlists WHERE id = $1", watchlist_id);
        if (exists.empty()) {
            return not_found<void>("Unknown watchlist id " + std::to_string(watchlist_id));
        }
        auto rows = txn.exec_params(
            "DELETE FROM finpipe.watchlist_symbols WHERE watchlist_id = $1 AND symbol = $2",
            watchlist_id, symbol);
        if (rows.affected_rows() == 0) {
            return not_found<void>(symbol + " is not in watchlist " +
                                   std::to_string(watchlist_id));
        }
        return Result<void>();
    });
}

Result<std::vector<std::string>> PostgresStore::watchlist_symbols(int64_t watchlist_id) const {
    using Rows = std::vector<std::string>;
    return run_transaction<Rows>("watchlist_symbols", [&](pqxx::work& txn) -> Result<Rows> {
        auto exists =
            txn.exec_params("SELECT 1 FROM finpipe.watchlists WHERE id = $1", watchlist_id);
        if (exists.empty()) {
            return not_found<Rows>("Unknown watchlist id " + std::to_string(watchlist_id));
        }
        auto rows = txn.exec_params(
            "SELECT symbol FROM finpipe.watchlist_symbols WHERE watchlist_id = $1 ORDER BY symbol",
            watchlist_id);
        Rows result;
        for (const auto& row : rows) {
            result.push_back(row[0].as<std::string>());
        }
        return result;
    });
}

// API call log

Result<void> PostgresStore::record_api_call(const ApiCallRecord& record) {
    return run_transaction<void>("record_api_call", [&](pqxx::work& txn) -> Result<void> {
        txn.exec_params(
            "INSERT INTO finpipe.api_calls (source, endpoint, symbol, called_at, success, "
            "error_message) VALUES ($1, $2, $3, $4::timestamp, $5, $6)",
            record.source, record.endpoint, record.symbol,
            core::format_timestamp(record.timestamp), record.success, record.error_message);
        return Result<void>();
    });
}

Result<std::vector<ApiCallRecord>> PostgresStore::api_calls_since(const std::string& source,
                                                                  const Timestamp& since) const {
    using Rows = std::vector<ApiCallRecord>;
    return run_transaction<Rows>("api_calls_since", [&](pqxx::work& txn) -> Result<Rows> {
        auto rows = txn.exec_params(std::string("SELECT ") + kApiCallColumns +
                                        " FROM finpipe.api_calls WHERE source = $1 "
                                        "AND called_at >= $2::timestamp ORDER BY called_at, id",
                                    source, core::format_timestamp(since));
        Rows result;
        result.reserve(rows.size());
        for (const auto& row : rows) {
            result.push_back(api_call_from_row(row));
        }
        return result;
    });
}

Result<size_t> PostgresStore::count_api_calls(const std::string& source, const Timestamp& since,
                                              bool successful_only) const {
    return run_transaction<size_t>("count_api_calls", [&](pqxx::work& txn) -> Result<size_t> {
        auto rows = txn.exec_params(
            "SELECT COUNT(*) FROM finpipe.api_calls WHERE source = $1 "
            "AND called_at >= $2::timestamp AND (NOT $3 OR success)",
            source, core::format_timestamp(since), successful_only);
        return static_cast<size_t>(rows[0][0].as<int64_t>());
    });
}

}  // namespace finpipe
