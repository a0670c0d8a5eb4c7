// src/ingest/yahoo_chart.cpp

#include "finpipe/ingest/yahoo_chart.hpp"
#include <algorithm>
#include <array>
#include <nlohmann/json.hpp>
#include <optional>
#include "finpipe/core/time_utils.hpp"

namespace finpipe {
namespace yahoo {

namespace {

using json = nlohmann::json;

std::optional<double> number_at(const json& series, size_t index) {
    if (!series.is_array() || index >= series.size() || !series[index].is_number()) {
        return std::nullopt;
    }
    return series[index].get<double>();
}

const json& empty_array() {
    static const json empty = json::array();
    return empty;
}

const json& series_of(const json& object, const char* key) {
    if (object.is_object() && object.contains(key) && object.at(key).is_array()) {
        return object.at(key);
    }
    return empty_array();
}

// Yahoo sends null for fields it has nothing to say about
std::string string_field(const json& object, const char* key, const char* fallback) {
    if (object.is_object() && object.contains(key) && object.at(key).is_string()) {
        return object.at(key).get<std::string>();
    }
    return fallback;
}

}  // namespace

bool is_valid_period(const std::string& period) {
    static const std::array<const char*, 11> periods = {
        "1d", "5d", "1mo", "3mo", "6mo", "1y", "2y", "5y", "10y", "ytd", "max"};
    return std::any_of(periods.begin(), periods.end(),
                       [&](const char* p) { return period == p; });
}

Result<std::vector<PriceBar>> parse_chart(const std::string& symbol, const std::string& body,
                                          const std::string& source) {
    using Bars = std::vector<PriceBar>;
    try {
        json doc = json::parse(body);
        const json& chart = doc.at("chart");

        if (chart.contains("error") && !chart.at("error").is_null()) {
            const json& err = chart.at("error");
            return make_error<Bars>(NOT_FOUND,
                                    string_field(err, "code", "Error") + ": " +
                                        string_field(err, "description", "unknown symbol"),
                                    source);
        }
        if (!chart.contains("result") || !chart.at("result").is_array() ||
            chart.at("result").empty()) {
            return make_error<Bars>(NOT_FOUND, "no chart result for " + symbol, source);
        }

        const json& data = chart.at("result").at(0);
        const json& timestamps = series_of(data, "timestamp");
        if (timestamps.empty()) {
            return make_error<Bars>(NOT_FOUND, "no price points for " + symbol, source);
        }

        const json& indicators = data.at("indicators");
        const json& quote = indicators.at("quote").at(0);
        const json& opens = series_of(quote, "open");
        const json& highs = series_of(quote, "high");
        const json& lows = series_of(quote, "low");
        const json& closes = series_of(quote, "close");
        const json& volumes = series_of(quote, "volume");

        const json* adjusted = &empty_array();
        if (indicators.contains("adjclose") && indicators.at("adjclose").is_array() &&
            !indicators.at("adjclose").empty()) {
            adjusted = &series_of(indicators.at("adjclose").at(0), "adjclose");
        }

        Bars bars;
        bars.reserve(timestamps.size());
        for (size_t i = 0; i < timestamps.size(); ++i) {
            auto open = number_at(opens, i);
            auto high = number_at(highs, i);
            auto low = number_at(lows, i);
            auto close = number_at(closes, i);
            if (!open || !high || !low || !close || !timestamps[i].is_number()) {
                continue;
            }
            PriceBar bar(symbol, core::from_unix_seconds(timestamps[i].get<int64_t>()), *open,
                         *high, *low, *close, number_at(volumes, i).value_or(0.0), source);
            if (auto adj = number_at(*adjusted, i)) {
                bar.adjusted_close = *adj;
            }
            bars.push_back(std::move(bar));
        }
        if (bars.empty()) {
            return make_error<Bars>(NOT_FOUND, "no complete price points for " + symbol, source);
        }
        return bars;
    } catch (const json::exception& e) {
        return make_error<Bars>(ErrorCode::SOURCE_UNAVAILABLE,
                                std::string("malformed chart response: ") + e.what(), source);
    }
}

}  // namespace yahoo
}  // namespace finpipe
