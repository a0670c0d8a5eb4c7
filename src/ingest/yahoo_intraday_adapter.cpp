// src/ingest/yahoo_intraday_adapter.cpp

#include "finpipe/ingest/yahoo_intraday_adapter.hpp"
#include <algorithm>
#include "finpipe/core/time_utils.hpp"
#include "finpipe/data/time_series_store.hpp"
#include "finpipe/ingest/yahoo_chart.hpp"

namespace finpipe {

Result<std::string> YahooIntradayAdapter::normalize_key(const std::string& key) const {
    return normalize_symbol(key);
}

std::string YahooIntradayAdapter::build_url(const std::string& key,
                                            const std::string& /*period*/) const {
    return config_.base_url + "/v8/finance/chart/" + key + "?interval=5m&range=1d";
}

Result<FetchedRecords> YahooIntradayAdapter::parse(const std::string& key,
                                                   const std::string& body) const {
    auto quotes = yahoo::parse_chart(key, body, YahooIntradayAdapter::kSourceTag);
    if (quotes.is_error()) {
        return forward_error<FetchedRecords>(quotes, config_.name);
    }

    const auto& points = quotes.value();
    Timestamp session = core::floor_to_day(points.back().date);

    FetchedRecords records;
    PriceBar* day = nullptr;
    for (const auto& point : points) {
        if (core::floor_to_day(point.date) != session) {
            continue;
        }
        if (!day) {
            records.bars.emplace_back(key, session, point.open, point.high, point.low,
                                      point.close, point.volume,
                                      YahooIntradayAdapter::kSourceTag);
            day = &records.bars.back();
            continue;
        }
        day->high = std::max(day->high, point.high);
        day->low = std::min(day->low, point.low);
        day->close = point.close;
        day->adjusted_close = point.close;
        day->volume += point.volume;
    }
    return records;
}

}  // namespace finpipe
