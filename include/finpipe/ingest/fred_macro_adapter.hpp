// include/finpipe/ingest/fred_macro_adapter.hpp

#pragma once

#include "finpipe/ingest/source_adapter.hpp"

namespace finpipe {

/**
 * @brief Macro series from the FRED graph CSV endpoint
 * Keys are catalog codes (see macro_catalog()); the whole series is fetched every time.
 */
class FredMacroAdapter : public SourceAdapter {
public:
    using SourceAdapter::SourceAdapter;

    /**
     * @brief Parse a fredgraph CSV body
     * Rows whose value is "." or empty, or whose date does not parse, are skipped.
     */
    static Result<std::vector<MacroObservation>> parse_csv(const std::string& code,
                                                           const std::string& body);

protected:
    Result<std::string> normalize_key(const std::string& key) const override;
    std::string build_url(const std::string& key, const std::string& period) const override;
    Result<FetchedRecords> parse(const std::string& key, const std::string& body) const override;
    std::string endpoint() const override {
        return "graph";
    }
};

}  // namespace finpipe
