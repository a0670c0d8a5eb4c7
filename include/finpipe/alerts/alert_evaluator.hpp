// include/finpipe/alerts/alert_evaluator.hpp
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "finpipe/core/clock.hpp"
#include "finpipe/core/error.hpp"
#include "finpipe/core/types.hpp"
#include "finpipe/data/time_series_store.hpp"

namespace finpipe {

/**
 * @brief Compares the latest cached close of each alert's symbol against its threshold
 *
 * Triggering is one-way: an alert that has fired is never re-armed here, only deleting
 * and recreating it does that.
 */
class AlertEvaluator {
public:
    AlertEvaluator(std::shared_ptr<TimeSeriesStore> store, std::shared_ptr<const Clock> clock);

    /**
     * @brief Whether a price satisfies the alert's condition (above: >=, below: <=)
     */
    static bool condition_met(const Alert& alert, Price price);

    /**
     * @brief Evaluate the given alerts, persisting and returning the ones that fired
     *
     * Already triggered alerts and symbols without cached prices are skipped. A failure to
     * read or persist one alert is logged and does not stop the others.
     */
    Result<std::vector<Alert>> evaluate(const std::vector<Alert>& alerts);

    /**
     * @brief Evaluate every active alert, optionally restricted to a set of symbols
     */
    Result<std::vector<Alert>> evaluate_active(const std::vector<std::string>& symbols = {});

private:
    std::shared_ptr<TimeSeriesStore> store_;
    std::shared_ptr<const Clock> clock_;
};

}  // namespace finpipe
