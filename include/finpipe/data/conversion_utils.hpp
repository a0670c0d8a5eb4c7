// include/finpipe/data/conversion_utils.hpp

#pragma once

#include <arrow/api.h>
#include <arrow/type_traits.h>
#include <memory>
#include <vector>
#include "finpipe/core/error.hpp"
#include "finpipe/core/types.hpp"

namespace finpipe {

class DataConversionUtils {
public:
    /**
     * @brief Schema of exported price tables:
     * time (timestamp[s], UTC midnight), symbol, open, high, low, close, volume, adjusted_close
     */
    static std::shared_ptr<arrow::Schema> price_schema();

    /**
     * @brief Build an Arrow table from price bars, preserving their order
     */
    static Result<std::shared_ptr<arrow::Table>> price_bars_to_table(
        const std::vector<PriceBar>& bars);

    /**
     * @brief Convert an Arrow table of OHLCV data back to price bars
     * adjusted_close is optional and falls back to close when the column is absent.
     * @param table Arrow table containing OHLCV data
     * @param source Source tag given to every bar
     */
    static Result<std::vector<PriceBar>> arrow_table_to_price_bars(
        const std::shared_ptr<arrow::Table>& table, const std::string& source = "");

private:
    static Result<Timestamp> extract_timestamp(const std::shared_ptr<arrow::Array>& array,
                                               int64_t index);

    static Result<double> extract_double(const std::shared_ptr<arrow::Array>& array,
                                         int64_t index);

    static Result<std::string> extract_string(const std::shared_ptr<arrow::Array>& array,
                                              int64_t index);
};

}  // namespace finpipe
