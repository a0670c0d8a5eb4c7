// include/finpipe/ingest/yahoo_eod_adapter.hpp

#pragma once

#include "finpipe/ingest/source_adapter.hpp"

namespace finpipe {

/**
 * @brief Daily bars from the Yahoo chart endpoint
 * Compact fetches the last three months, Full the whole history.
 */
class YahooEodAdapter : public SourceAdapter {
public:
    using SourceAdapter::SourceAdapter;

protected:
    Result<std::string> normalize_key(const std::string& key) const override;
    std::string build_url(const std::string& key, const std::string& period) const override;
    std::string period_for(FetchRange range) const override;
    Result<void> validate_period(const std::string& period) const override;
    Result<FetchedRecords> parse(const std::string& key, const std::string& body) const override;
    std::string endpoint() const override {
        return "chart";
    }
};

}  // namespace finpipe
