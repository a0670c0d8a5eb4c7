// include/finpipe/ingest/yahoo_chart.hpp

#pragma once

#include <string>
#include <vector>
#include "finpipe/core/error.hpp"
#include "finpipe/core/types.hpp"

namespace finpipe {
namespace yahoo {

/**
 * @brief Parse a v8 chart response into bars, one per returned timestamp
 *
 * Points with a null open, high, low or close are dropped; a null volume reads as 0 and a
 * missing adjclose series leaves adjusted_close equal to close. Bar dates keep the full
 * point timestamp; callers floor them as needed.
 *
 * @return NOT_FOUND when the provider reports an error or returns no result,
 * SOURCE_UNAVAILABLE when the body is not a chart document
 */
Result<std::vector<PriceBar>> parse_chart(const std::string& symbol, const std::string& body,
                                          const std::string& source);

/**
 * @brief Range strings the chart endpoint accepts for daily bars
 */
bool is_valid_period(const std::string& period);

}  // namespace yahoo
}  // namespace finpipe
