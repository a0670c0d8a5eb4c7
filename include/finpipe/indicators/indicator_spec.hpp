// include/finpipe/indicators/indicator_spec.hpp
#pragma once

#include <string>
#include <vector>
#include "finpipe/core/error.hpp"

namespace finpipe {

enum class IndicatorFamily {
    SMA,
    EMA,
    RSI,
    MACD,
    BBANDS,
    STOCH,
    ADX,
    ATR,
    CCI,
    OBV,
    WILLR,
    MFI,
    ROC
};

std::string indicator_family_to_string(IndicatorFamily family);

/**
 * @brief A parameterized indicator request, e.g. SMA(20) or MACD(12,26,9)
 *
 * Parameter layout per family:
 *   SMA, EMA, RSI, ADX, ATR, CCI, WILLR, MFI, ROC: {period}
 *   MACD:   {fast, slow, signal}
 *   BBANDS: {period}, width in band_width
 *   STOCH:  {k_period, d_period}
 *   OBV:    {}
 */
struct IndicatorSpec {
    IndicatorFamily family{IndicatorFamily::SMA};
    std::vector<int> params;
    double band_width{2.0};

    /**
     * @brief Canonical text form accepted by parse(), e.g. "MACD(12,26,9)"
     */
    std::string label() const;

    /**
     * @brief Names of the series this spec produces, e.g. {"BB_UPPER_20", "BB_MIDDLE_20",
     * "BB_LOWER_20"}
     */
    std::vector<std::string> output_names() const;

    /**
     * @brief Minimum number of bars required before any value is defined
     */
    size_t min_history() const;

    /**
     * @brief Check parameter count and ranges
     */
    Result<void> validate() const;

    /**
     * @brief Parse "FAMILY" or "FAMILY(p1,p2,...)"; missing params take the family defaults
     */
    static Result<IndicatorSpec> parse(const std::string& text);

    /**
     * @brief Resolve a stored series name ("RSI_14", "MACD_SIGNAL_9", "+DI_14") to the
     * IndicatorSpec that produces it
     */
    static Result<IndicatorSpec> from_series_name(const std::string& name);

    bool operator==(const IndicatorSpec& other) const {
        return family == other.family && params == other.params &&
               band_width == other.band_width;
    }
};

/**
 * @brief The standard set computed when no indicator list is configured
 */
std::vector<IndicatorSpec> default_indicator_set();

}  // namespace finpipe
