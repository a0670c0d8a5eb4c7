// include/finpipe/core/types.hpp

#pragma once

#include <cctype>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace finpipe {

/**
 * @brief Timestamp type for consistent time representation
 * Calendar dates are represented as the timestamp of 00:00 UTC on that day
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief Quantity type for position sizes
 * Double to support fractional quantities
 */
using Quantity = double;

/**
 * @brief Alert trigger direction
 */
enum class AlertCondition {
    ABOVE,  // Fires when latest price >= target
    BELOW   // Fires when latest price <= target
};

/**
 * @brief What an indicator alert watches for
 */
enum class IndicatorAlertType {
    THRESHOLD,  // A series crossing a fixed level, e.g. RSI through 30
    CROSSOVER,  // One series crossing another, e.g. MACD through its signal line
    BAND_TOUCH  // A series reaching a band, e.g. close against BB_UPPER
};

enum class IndicatorAlertCondition {
    CROSSES_ABOVE,      // previous < threshold, current >= threshold
    CROSSES_BELOW,      // previous > threshold, current <= threshold
    BULLISH_CROSSOVER,  // primary moves from <= secondary to > secondary
    BEARISH_CROSSOVER   // primary moves from >= secondary to < secondary
};

/**
 * @brief Portfolio position side
 */
enum class PositionSide {
    LONG,
    SHORT
};

/**
 * @brief Amount of history requested from a provider
 */
enum class FetchRange {
    COMPACT,  // Recent window, cheap refresh
    FULL      // Entire available history
};

/**
 * @brief Sampling frequency of a macro series
 */
enum class MacroFrequency {
    DAILY,
    WEEKLY,
    MONTHLY,
    QUARTERLY,
    ANNUAL
};

inline std::string alert_condition_to_string(AlertCondition condition) {
    return condition == AlertCondition::ABOVE ? "above" : "below";
}

inline std::optional<AlertCondition> alert_condition_from_string(const std::string& value) {
    if (value == "above")
        return AlertCondition::ABOVE;
    if (value == "below")
        return AlertCondition::BELOW;
    return std::nullopt;
}

inline std::string indicator_alert_type_to_string(IndicatorAlertType type) {
    switch (type) {
        case IndicatorAlertType::THRESHOLD:
            return "threshold";
        case IndicatorAlertType::CROSSOVER:
            return "crossover";
        case IndicatorAlertType::BAND_TOUCH:
            return "band_touch";
    }
    return "threshold";
}

inline std::optional<IndicatorAlertType> indicator_alert_type_from_string(std::string value) {
    for (auto& c : value)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (value == "threshold")
        return IndicatorAlertType::THRESHOLD;
    if (value == "crossover")
        return IndicatorAlertType::CROSSOVER;
    if (value == "band_touch")
        return IndicatorAlertType::BAND_TOUCH;
    return std::nullopt;
}

inline std::string indicator_alert_condition_to_string(IndicatorAlertCondition condition) {
    switch (condition) {
        case IndicatorAlertCondition::CROSSES_ABOVE:
            return "crosses_above";
        case IndicatorAlertCondition::CROSSES_BELOW:
            return "crosses_below";
        case IndicatorAlertCondition::BULLISH_CROSSOVER:
            return "bullish_crossover";
        case IndicatorAlertCondition::BEARISH_CROSSOVER:
            return "bearish_crossover";
    }
    return "crosses_above";
}

inline std::optional<IndicatorAlertCondition> indicator_alert_condition_from_string(
    std::string value) {
    for (auto& c : value)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (value == "crosses_above")
        return IndicatorAlertCondition::CROSSES_ABOVE;
    if (value == "crosses_below")
        return IndicatorAlertCondition::CROSSES_BELOW;
    if (value == "bullish_crossover")
        return IndicatorAlertCondition::BULLISH_CROSSOVER;
    if (value == "bearish_crossover")
        return IndicatorAlertCondition::BEARISH_CROSSOVER;
    return std::nullopt;
}

inline bool is_crossover_condition(IndicatorAlertCondition condition) {
    return condition == IndicatorAlertCondition::BULLISH_CROSSOVER ||
           condition == IndicatorAlertCondition::BEARISH_CROSSOVER;
}

inline std::string position_side_to_string(PositionSide side) {
    return side == PositionSide::LONG ? "long" : "short";
}

inline std::optional<PositionSide> position_side_from_string(const std::string& value) {
    if (value == "long" || value == "buy")
        return PositionSide::LONG;
    if (value == "short" || value == "sell")
        return PositionSide::SHORT;
    return std::nullopt;
}

inline std::string macro_frequency_to_string(MacroFrequency freq) {
    switch (freq) {
        case MacroFrequency::DAILY:
            return "daily";
        case MacroFrequency::WEEKLY:
            return "weekly";
        case MacroFrequency::MONTHLY:
            return "monthly";
        case MacroFrequency::QUARTERLY:
            return "quarterly";
        case MacroFrequency::ANNUAL:
            return "annual";
        default:
            return "daily";
    }
}

inline MacroFrequency macro_frequency_from_string(const std::string& value) {
    if (value == "weekly")
        return MacroFrequency::WEEKLY;
    if (value == "monthly")
        return MacroFrequency::MONTHLY;
    if (value == "quarterly")
        return MacroFrequency::QUARTERLY;
    if (value == "annual")
        return MacroFrequency::ANNUAL;
    return MacroFrequency::DAILY;
}

/**
 * @brief Catalog entry for a tradeable ticker
 */
struct SymbolInfo {
    std::string symbol;
    std::string name;
    std::string sector;
    std::string industry;
    std::string exchange;
    std::string currency;
    std::string country;
    std::string asset_class{"equity"};
    bool favorited{false};
};

/**
 * @brief Daily OHLCV bar, keyed by (symbol, date)
 */
struct PriceBar {
    std::string symbol;
    Timestamp date;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    double volume{0.0};
    Price adjusted_close{0.0};
    std::string source;

    PriceBar() = default;
    PriceBar(std::string sym, Timestamp d, Price o, Price h, Price l, Price c, double v,
             std::string src = "")
        : symbol(std::move(sym)),
          date(d),
          open(o),
          high(h),
          low(l),
          close(c),
          volume(v),
          adjusted_close(c),
          source(std::move(src)) {}

    bool operator==(const PriceBar& other) const {
        return symbol == other.symbol && date == other.date && open == other.open &&
               high == other.high && low == other.low && close == other.close &&
               volume == other.volume && adjusted_close == other.adjusted_close &&
               source == other.source;
    }
};

/**
 * @brief Macro indicator observation, keyed by (indicator code, date)
 */
struct MacroObservation {
    std::string indicator;
    Timestamp date;
    double value{0.0};
    MacroFrequency frequency{MacroFrequency::DAILY};
    std::string source{"FRED"};
};

/**
 * @brief Single point of a derived series
 */
struct IndicatorPoint {
    Timestamp date;
    double value{0.0};
};

/**
 * @brief Derived series keyed by (symbol, indicator name)
 */
struct IndicatorSeries {
    std::string symbol;
    std::string name;
    std::vector<IndicatorPoint> points;
};

/**
 * @brief User price alert
 */
struct Alert {
    int64_t id{0};
    std::string symbol;
    Price target_price{0.0};
    AlertCondition condition{AlertCondition::ABOVE};
    bool triggered{false};
    Timestamp created_at;
};

/**
 * @brief Alert on a stored indicator series of a symbol
 *
 * Threshold conditions compare `indicator` against `threshold`; crossover conditions compare
 * it against the `secondary_indicator` series. `last_value` holds the primary value seen at
 * the previous check.
 */
struct IndicatorAlert {
    int64_t id{0};
    std::string symbol;
    IndicatorAlertType alert_type{IndicatorAlertType::THRESHOLD};
    std::string indicator;
    std::optional<std::string> secondary_indicator;
    IndicatorAlertCondition condition{IndicatorAlertCondition::CROSSES_ABOVE};
    std::optional<double> threshold;
    bool triggered{false};
    std::optional<double> last_value;
    std::optional<std::string> message;
    Timestamp created_at;
};

/**
 * @brief Portfolio position. Value and P&L are derived at read time.
 */
struct Position {
    int64_t id{0};
    std::string symbol;
    Quantity quantity{0.0};
    Price entry_price{0.0};
    PositionSide side{PositionSide::LONG};
    Timestamp entry_date;
    std::optional<std::string> notes;
};

/**
 * @brief Named set of symbols. A view over symbols, never their owner.
 */
struct Watchlist {
    int64_t id{0};
    std::string name;
    std::optional<std::string> description;
    Timestamp created_at;
};

/**
 * @brief Append-only audit record of an outbound provider call
 */
struct ApiCallRecord {
    std::string source;
    std::string endpoint;
    std::string symbol;
    Timestamp timestamp;
    bool success{false};
    std::string error_message;
};

/**
 * @brief Inclusive date range for history queries. Unset bounds are open.
 */
struct DateRange {
    std::optional<Timestamp> start;
    std::optional<Timestamp> end;

    bool contains(const Timestamp& ts) const {
        if (start && ts < *start)
            return false;
        if (end && ts > *end)
            return false;
        return true;
    }
};

}  // namespace finpipe
