// include/finpipe/ingest/yahoo_intraday_adapter.hpp

#pragma once

#include "finpipe/ingest/source_adapter.hpp"

namespace finpipe {

/**
 * @brief Today's bar built from the current session's 5-minute quotes
 *
 * The quotes of the latest session are folded into one bar: first open, highest high,
 * lowest low, last close and summed volume. The bar is tagged yahoo_intraday and is
 * overwritten by the next end-of-day fetch for the same date.
 */
class YahooIntradayAdapter : public SourceAdapter {
public:
    using SourceAdapter::SourceAdapter;

    static constexpr const char* kSourceTag = "yahoo_intraday";

protected:
    Result<std::string> normalize_key(const std::string& key) const override;
    std::string build_url(const std::string& key, const std::string& period) const override;
    Result<FetchedRecords> parse(const std::string& key, const std::string& body) const override;
    std::string endpoint() const override {
        return "chart_intraday";
    }
};

}  // namespace finpipe
