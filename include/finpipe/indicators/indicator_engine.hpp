// include/finpipe/indicators/indicator_engine.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "finpipe/core/error.hpp"
#include "finpipe/core/types.hpp"
#include "finpipe/data/time_series_store.hpp"
#include "finpipe/indicators/indicator_spec.hpp"

namespace finpipe {

/**
 * @brief Outcome of recomputing a set of indicators for one symbol
 */
struct ComputeReport {
    std::string symbol;
    size_t bars{0};
    std::vector<std::string> computed;      // Series names written
    std::vector<std::string> insufficient;  // Spec labels skipped for lack of history
    std::vector<std::string> failed;        // "label: reason"

    bool ok() const {
        return failed.empty();
    }
};

/**
 * @brief Derives technical indicator series from stored daily bars
 *
 * Every produced series is aligned to bar dates and only contains points where the value
 * is defined; a spec whose minimum history exceeds the available bars produces nothing and
 * is reported as INSUFFICIENT_HISTORY.
 */
class IndicatorEngine {
public:
    explicit IndicatorEngine(std::shared_ptr<TimeSeriesStore> store);

    /**
     * @brief Compute one spec over the given bars
     * @param bars Daily bars of a single symbol, in any order
     * @return One series per output name of the IndicatorSpec
     */
    static Result<std::vector<IndicatorSeries>> compute_from_bars(
        const std::string& symbol, const std::vector<PriceBar>& bars, const IndicatorSpec& spec);

    /**
     * @brief Compute one spec over the symbol's full stored history without persisting
     */
    Result<std::vector<IndicatorSeries>> compute(const std::string& symbol,
                                                 const IndicatorSpec& spec) const;

    /**
     * @brief Recompute every spec for a symbol, replacing the stored series when persist is set
     *
     * Only a store read failure fails the whole call; individual specs land in the report.
     */
    Result<ComputeReport> compute_all(const std::string& symbol,
                                      const std::vector<IndicatorSpec>& specs,
                                      bool persist = true);

private:
    std::shared_ptr<TimeSeriesStore> store_;
};

}  // namespace finpipe
