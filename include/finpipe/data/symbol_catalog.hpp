// include/finpipe/data/symbol_catalog.hpp

#pragma once

#include <string>
#include <vector>
#include "finpipe/core/error.hpp"
#include "finpipe/core/types.hpp"
#include "finpipe/data/time_series_store.hpp"

namespace finpipe {

/**
 * @brief Reads the ticker catalog CSV
 *
 * Recognized columns: symbol, name, sector, industry, exchange, currency, country,
 * asset_class. Only `symbol` is required; other columns are ignored.
 */
class SymbolCatalogLoader {
public:
    /**
     * @brief Parse a catalog file
     * Rows whose ticker fails validation are skipped with a warning. A ticker listed twice
     * keeps its last row.
     */
    static Result<std::vector<SymbolInfo>> load_csv(const std::string& path);

    /**
     * @brief Parse a catalog file and upsert it. Favorite flags are left untouched.
     * @return Number of symbols upserted
     */
    static Result<size_t> load_into(TimeSeriesStore& store, const std::string& path);
};

}  // namespace finpipe
