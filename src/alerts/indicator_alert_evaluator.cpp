// src/alerts/indicator_alert_evaluator.cpp

#include "finpipe/alerts/indicator_alert_evaluator.hpp"
#include <set>
#include "finpipe/core/logger.hpp"
#include "finpipe/data/event_bus.hpp"

namespace finpipe {

namespace {
constexpr const char* kComponent = "IndicatorAlertEvaluator";

// Pseudo-series read from the stored closes, so bands can be compared against price
constexpr const char* kCloseSeries = "CLOSE";
}  // namespace

IndicatorAlertEvaluator::IndicatorAlertEvaluator(std::shared_ptr<TimeSeriesStore> store,
                                                 std::shared_ptr<const Clock> clock)
    : store_(std::move(store)), clock_(std::move(clock)) {}

bool IndicatorAlertEvaluator::crossed(const IndicatorAlert& alert, const SeriesTail& primary,
                                      const SeriesTail& secondary) {
    if (!primary.current || !primary.previous) {
        return false;
    }
    const double current = *primary.current;
    const double previous = *primary.previous;

    switch (alert.condition) {
        case IndicatorAlertCondition::CROSSES_ABOVE:
            return alert.threshold && previous < *alert.threshold && current >= *alert.threshold;
        case IndicatorAlertCondition::CROSSES_BELOW:
            return alert.threshold && previous > *alert.threshold && current <= *alert.threshold;
        case IndicatorAlertCondition::BULLISH_CROSSOVER:
            return secondary.current && secondary.previous && previous <= *secondary.previous &&
                   current > *secondary.current;
        case IndicatorAlertCondition::BEARISH_CROSSOVER:
            return secondary.current && secondary.previous && previous >= *secondary.previous &&
                   current < *secondary.current;
    }
    return false;
}

Result<SeriesTail> IndicatorAlertEvaluator::tail(const std::string& symbol,
                                                 const std::string& name) const {
    SeriesTail result;
    if (name == kCloseSeries) {
        auto bars = store_->price_history(symbol);
        if (bars.is_error()) {
            if (bars.error()->code() == ErrorCode::DATA_NOT_FOUND) {
                return result;
            }
            return forward_error<SeriesTail>(bars, kComponent);
        }
        const auto& rows = bars.value();
        if (!rows.empty()) {
            result.current = rows.back().close;
        }
        if (rows.size() > 1) {
            result.previous = rows[rows.size() - 2].close;
        }
        return result;
    }

    auto series = store_->indicator_history(symbol, name);
    if (series.is_error()) {
        if (series.error()->code() == ErrorCode::DATA_NOT_FOUND) {
            return result;
        }
        return forward_error<SeriesTail>(series, kComponent);
    }
    const auto& points = series.value().points;
    if (!points.empty()) {
        result.current = points.back().value;
    }
    if (points.size() > 1) {
        result.previous = points[points.size() - 2].value;
    }
    return result;
}

Result<std::vector<IndicatorAlert>> IndicatorAlertEvaluator::evaluate(
    const std::vector<IndicatorAlert>& alerts) {
    ScopedLogComponent log_component(kComponent);
    std::vector<IndicatorAlert> triggered;

    for (const auto& alert : alerts) {
        if (alert.triggered) {
            continue;
        }

        auto primary = tail(alert.symbol, alert.indicator);
        if (primary.is_error()) {
            WARN("Skipping indicator alert " << alert.id << ": " << primary.error()->what());
            continue;
        }
        SeriesTail values = primary.value();
        if (!values.current) {
            TRACE("Indicator alert " << alert.id << ": no " << alert.indicator << " values for "
                                     << alert.symbol);
            continue;
        }
        if (alert.last_value) {
            values.previous = alert.last_value;
        }

        SeriesTail secondary;
        if (is_crossover_condition(alert.condition) && alert.secondary_indicator) {
            auto other = tail(alert.symbol, *alert.secondary_indicator);
            if (other.is_error()) {
                WARN("Skipping indicator alert " << alert.id << ": " << other.error()->what());
                continue;
            }
            secondary = other.value();
        }

        if (!crossed(alert, values, secondary)) {
            auto remembered = store_->update_indicator_alert_value(alert.id, *values.current);
            if (remembered.is_error()) {
                WARN("Failed to record value for indicator alert "
                     << alert.id << ": " << remembered.error()->what());
            }
            continue;
        }

        auto marked = store_->mark_indicator_alert_triggered(alert.id);
        if (marked.is_error()) {
            WARN("Failed to mark indicator alert " << alert.id
                                                   << " triggered: " << marked.error()->what());
            continue;
        }

        IndicatorAlert fired = alert;
        fired.triggered = true;
        fired.last_value = values.current;
        const std::string condition = indicator_alert_condition_to_string(fired.condition);
        INFO("Indicator alert " << fired.id << " triggered: " << fired.symbol << " "
                                << fired.indicator << " " << condition << " at "
                                << *values.current);

        PipelineEvent event;
        event.type = PipelineEventType::INDICATOR_ALERT_TRIGGERED;
        event.symbol = fired.symbol;
        event.timestamp = clock_->now();
        event.numeric_fields["alert_id"] = static_cast<double>(fired.id);
        event.numeric_fields["value"] = *values.current;
        if (fired.threshold) {
            event.numeric_fields["threshold"] = *fired.threshold;
        }
        event.string_fields["indicator"] = fired.indicator;
        event.string_fields["condition"] = condition;
        if (fired.secondary_indicator) {
            event.string_fields["secondary_indicator"] = *fired.secondary_indicator;
        }
        if (fired.message) {
            event.string_fields["message"] = *fired.message;
        }
        PipelineEventBus::instance().publish(event);

        triggered.push_back(std::move(fired));
    }

    return triggered;
}

Result<std::vector<IndicatorAlert>> IndicatorAlertEvaluator::evaluate_active(
    const std::vector<std::string>& symbols) {
    auto active = store_->list_indicator_alerts(true);
    if (active.is_error()) {
        return forward_error<std::vector<IndicatorAlert>>(active, kComponent);
    }
    if (symbols.empty()) {
        return evaluate(active.value());
    }

    std::set<std::string> scope(symbols.begin(), symbols.end());
    std::vector<IndicatorAlert> in_scope;
    for (const auto& alert : active.value()) {
        if (scope.count(alert.symbol) > 0) {
            in_scope.push_back(alert);
        }
    }
    return evaluate(in_scope);
}

}  // namespace finpipe
