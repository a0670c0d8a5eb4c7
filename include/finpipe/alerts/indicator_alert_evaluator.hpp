// include/finpipe/alerts/indicator_alert_evaluator.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "finpipe/core/clock.hpp"
#include "finpipe/core/error.hpp"
#include "finpipe/core/types.hpp"
#include "finpipe/data/time_series_store.hpp"

namespace finpipe {

/**
 * @brief Latest and prior value of a stored indicator series
 */
struct SeriesTail {
    std::optional<double> current;
    std::optional<double> previous;
};

/**
 * @brief Detects crossings on stored indicator series
 *
 * The primary series' previous value is the one remembered from the last check, or the
 * second-to-last stored point before the first check. A crossing needs both a previous and a
 * current value. Like price alerts, an indicator alert fires once and stays triggered.
 */
class IndicatorAlertEvaluator {
public:
    IndicatorAlertEvaluator(std::shared_ptr<TimeSeriesStore> store,
                            std::shared_ptr<const Clock> clock);

    /**
     * @brief Whether the alert's condition holds for the given series values
     * @param primary Primary series, with `previous` already resolved
     * @param secondary Secondary series, used by crossover conditions only
     */
    static bool crossed(const IndicatorAlert& alert, const SeriesTail& primary,
                        const SeriesTail& secondary);

    Result<std::vector<IndicatorAlert>> evaluate(const std::vector<IndicatorAlert>& alerts);

    /**
     * @brief Evaluate every active indicator alert, optionally restricted to a set of symbols
     */
    Result<std::vector<IndicatorAlert>> evaluate_active(
        const std::vector<std::string>& symbols = {});

private:
    Result<SeriesTail> tail(const std::string& symbol, const std::string& name) const;

    std::shared_ptr<TimeSeriesStore> store_;
    std::shared_ptr<const Clock> clock_;
};

}  // namespace finpipe
