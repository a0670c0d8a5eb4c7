// src/alerts/alert_evaluator.cpp

#include "finpipe/alerts/alert_evaluator.hpp"
#include <set>
#include "finpipe/core/logger.hpp"
#include "finpipe/data/event_bus.hpp"

namespace finpipe {

namespace {
constexpr const char* kComponent = "AlertEvaluator";
}

AlertEvaluator::AlertEvaluator(std::shared_ptr<TimeSeriesStore> store,
                               std::shared_ptr<const Clock> clock)
    : store_(std::move(store)), clock_(std::move(clock)) {}

bool AlertEvaluator::condition_met(const Alert& alert, Price price) {
    if (alert.condition == AlertCondition::ABOVE) {
        return price >= alert.target_price;
    }
    return price <= alert.target_price;
}

Result<std::vector<Alert>> AlertEvaluator::evaluate(const std::vector<Alert>& alerts) {
    ScopedLogComponent log_component(kComponent);
    std::vector<Alert> triggered;

    for (const auto& alert : alerts) {
        if (alert.triggered) {
            continue;
        }

        auto quote = store_->latest_price(alert.symbol);
        if (quote.is_error()) {
            if (quote.error()->code() != ErrorCode::DATA_NOT_FOUND) {
                WARN("Skipping alert " << alert.id << ": " << quote.error()->what());
            }
            continue;
        }

        const Price price = quote.value().bar.close;
        if (!condition_met(alert, price)) {
            TRACE("Alert " << alert.id << " " << alert.symbol << " "
                           << alert_condition_to_string(alert.condition) << " "
                           << alert.target_price << " not met at " << price);
            continue;
        }

        auto marked = store_->mark_alert_triggered(alert.id);
        if (marked.is_error()) {
            WARN("Failed to mark alert " << alert.id << " triggered: " << marked.error()->what());
            continue;
        }

        Alert fired = alert;
        fired.triggered = true;
        INFO("Alert " << fired.id << " triggered: " << fired.symbol << " "
                      << alert_condition_to_string(fired.condition) << " " << fired.target_price
                      << " at " << price);

        PipelineEvent event;
        event.type = PipelineEventType::ALERT_TRIGGERED;
        event.symbol = fired.symbol;
        event.timestamp = clock_->now();
        event.numeric_fields["alert_id"] = static_cast<double>(fired.id);
        event.numeric_fields["target_price"] = fired.target_price;
        event.numeric_fields["price"] = price;
        event.string_fields["condition"] = alert_condition_to_string(fired.condition);
        PipelineEventBus::instance().publish(event);

        triggered.push_back(std::move(fired));
    }

    return triggered;
}

Result<std::vector<Alert>> AlertEvaluator::evaluate_active(
    const std::vector<std::string>& symbols) {
    auto active = store_->list_alerts(true);
    if (active.is_error()) {
        return forward_error<std::vector<Alert>>(active, kComponent);
    }
    if (symbols.empty()) {
        return evaluate(active.value());
    }

    std::set<std::string> scope(symbols.begin(), symbols.end());
    std::vector<Alert> in_scope;
    for (const auto& alert : active.value()) {
        if (scope.count(alert.symbol) > 0) {
            in_scope.push_back(alert);
        }
    }
    return evaluate(in_scope);
}

}  // namespace finpipe
