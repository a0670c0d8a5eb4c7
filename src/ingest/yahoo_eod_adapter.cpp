// src/ingest/yahoo_eod_adapter.cpp

#include "finpipe/ingest/yahoo_eod_adapter.hpp"
#include "finpipe/core/time_utils.hpp"
#include "finpipe/data/time_series_store.hpp"
#include "finpipe/ingest/yahoo_chart.hpp"

namespace finpipe {

Result<std::string> YahooEodAdapter::normalize_key(const std::string& key) const {
    return normalize_symbol(key);
}

std::string YahooEodAdapter::build_url(const std::string& key, const std::string& period) const {
    return config_.base_url + "/v8/finance/chart/" + key + "?interval=1d&range=" + period;
}

std::string YahooEodAdapter::period_for(FetchRange range) const {
    return range == FetchRange::FULL ? "max" : "3mo";
}

Result<void> YahooEodAdapter::validate_period(const std::string& period) const {
    if (!yahoo::is_valid_period(period)) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Unsupported period: " + period,
                                config_.name);
    }
    return Result<void>();
}

Result<FetchedRecords> YahooEodAdapter::parse(const std::string& key,
                                              const std::string& body) const {
    auto bars = yahoo::parse_chart(key, body, config_.name);
    if (bars.is_error()) {
        return forward_error<FetchedRecords>(bars);
    }

    FetchedRecords records;
    records.bars = bars.take_value();
    for (auto& bar : records.bars) {
        bar.date = core::floor_to_day(bar.date);
    }
    return records;
}

}  // namespace finpipe
