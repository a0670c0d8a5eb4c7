// src/ingest/source_adapter.cpp

#include "finpipe/ingest/source_adapter.hpp"
#include <algorithm>
#include <atomic>
#include <sstream>
#include "finpipe/core/logger.hpp"
#include "finpipe/core/state_manager.hpp"

namespace finpipe {

void FetchedRecords::append(FetchedRecords&& other) {
    bars.insert(bars.end(), std::make_move_iterator(other.bars.begin()),
                std::make_move_iterator(other.bars.end()));
    observations.insert(observations.end(), std::make_move_iterator(other.observations.begin()),
                        std::make_move_iterator(other.observations.end()));
}

std::string batch_status_to_string(BatchStatus status) {
    switch (status) {
        case BatchStatus::COMPLETED:
            return "COMPLETED";
        case BatchStatus::PARTIAL:
            return "PARTIAL";
        case BatchStatus::FAILED:
            return "FAILED";
        case BatchStatus::DENIED:
            return "DENIED";
        case BatchStatus::SKIPPED:
            return "SKIPPED";
        default:
            return "UNKNOWN";
    }
}

size_t BatchResult::succeeded() const {
    return std::count_if(outcomes.begin(), outcomes.end(),
                         [](const SymbolOutcome& o) { return o.success; });
}

size_t BatchResult::failed() const {
    return outcomes.size() - succeeded();
}

std::vector<std::string> BatchResult::succeeded_symbols() const {
    std::vector<std::string> result;
    for (const auto& o : outcomes) {
        if (o.success) {
            result.push_back(o.symbol);
        }
    }
    return result;
}

const SymbolOutcome* BatchResult::outcome(const std::string& symbol) const {
    for (const auto& o : outcomes) {
        if (o.symbol == symbol) {
            return &o;
        }
    }
    return nullptr;
}

std::string BatchResult::summary() const {
    std::ostringstream ss;
    ss << "Fetched " << succeeded() << "/" << outcomes.size() << " symbols";
    std::vector<std::string> failures;
    for (const auto& o : outcomes) {
        if (!o.success && o.error != ErrorCode::QUOTA_EXCEEDED) {
            failures.push_back(o.symbol + ": " + o.message);
        }
    }
    if (!failures.empty()) {
        ss << ". Failed: ";
        for (size_t i = 0; i < failures.size(); ++i) {
            ss << (i ? "; " : "") << failures[i];
        }
    }
    if (quota_exhausted) {
        size_t skipped = std::count_if(outcomes.begin(), outcomes.end(), [](const SymbolOutcome& o) {
            return o.error == ErrorCode::QUOTA_EXCEEDED;
        });
        ss << ". " << source << " quota exhausted, " << skipped << " symbols not fetched (retry in "
           << std::chrono::duration_cast<std::chrono::seconds>(retry_after).count() << "s)";
    }
    return ss.str();
}

SourceAdapter::SourceAdapter(SourceConfig config, std::shared_ptr<HttpTransport> transport,
                             std::shared_ptr<RateLimiter> limiter,
                             std::shared_ptr<const Clock> clock)
    : config_(std::move(config)),
      transport_(std::move(transport)),
      limiter_(std::move(limiter)),
      clock_(std::move(clock)) {
    register_component();
}

SourceAdapter::~SourceAdapter() {
    if (!component_id_.empty()) {
        auto result = StateManager::instance().unregister_component(component_id_);
        if (result.is_error()) {
            WARN("Error unregistering " << config_.name << " adapter: " << result.error()->what());
        }
    }
}

void SourceAdapter::register_component() {
    static std::atomic<int> counter{0};
    std::string unique_id = "SOURCE_" + config_.name + "_" + std::to_string(++counter);
    ComponentInfo info{ComponentType::SOURCE_ADAPTER, ComponentState::INITIALIZED, unique_id, "",
                       std::chrono::system_clock::now(), {}};
    auto registered = StateManager::instance().register_component(info);
    if (registered.is_error()) {
        WARN("Failed to register " << config_.name
                                   << " adapter with StateManager: " << registered.error()->what());
        return;
    }
    component_id_ = unique_id;
    auto running = StateManager::instance().update_state(component_id_, ComponentState::RUNNING);
    if (running.is_error()) {
        WARN("Failed to mark " << config_.name << " adapter running: " << running.error()->what());
    }
}

void SourceAdapter::update_metrics(const BatchResult& result) {
    if (component_id_.empty()) {
        return;
    }
    for (const auto& batch : result.batches) {
        if (batch.status != BatchStatus::DENIED && batch.status != BatchStatus::SKIPPED) {
            total_requests_ += batch.symbols.size();
        }
    }
    total_succeeded_ += result.succeeded();
    auto updated = StateManager::instance().update_metrics(
        component_id_, {{"requests", static_cast<double>(total_requests_)},
                        {"succeeded", static_cast<double>(total_succeeded_)},
                        {"quota_exhausted", result.quota_exhausted ? 1.0 : 0.0}});
    if (updated.is_error()) {
        DEBUG(updated.error()->what());
    }
}

Result<FetchedRecords> SourceAdapter::fetch_one(const std::string& key,
                                                const std::string& period) {
    const std::string url = build_url(key, period);
    auto response = transport_->get(url, std::chrono::milliseconds(config_.timeout_ms));

    ApiCallRecord record;
    record.source = config_.name;
    record.endpoint = endpoint();
    record.symbol = key;
    record.timestamp = now();

    Result<FetchedRecords> outcome = [&]() -> Result<FetchedRecords> {
        if (response.is_error()) {
            bool timed_out = response.error()->code() == ErrorCode::TIMEOUT_ERROR;
            return make_error<FetchedRecords>(
                ErrorCode::SOURCE_UNAVAILABLE,
                std::string(timed_out ? "timeout: " : "") + response.error()->what(),
                config_.name);
        }
        const HttpResponse& http = response.value();
        if (http.status == 404) {
            return make_error<FetchedRecords>(NOT_FOUND, "not found at provider (HTTP 404)",
                                              config_.name);
        }
        if (http.status < 200 || http.status >= 300) {
            return make_error<FetchedRecords>(ErrorCode::SOURCE_UNAVAILABLE,
                                              "HTTP " + std::to_string(http.status),
                                              config_.name);
        }
        return parse(key, http.body);
    }();

    record.success = outcome.is_ok();
    record.error_message = outcome.is_error() ? outcome.error()->what() : "";
    auto audited = limiter_->record_call(record);
    if (audited.is_error()) {
        WARN("Failed to audit " << config_.name << " call for " << key << ": "
                                << audited.error()->what());
    }
    return outcome;
}

BatchResult SourceAdapter::fetch(const std::vector<std::string>& keys, FetchRange range,
                                 const BatchSink& sink) {
    return run(keys, period_for(range), sink);
}

BatchResult SourceAdapter::fetch_period(const std::vector<std::string>& keys,
                                        const std::string& period, const BatchSink& sink) {
    auto valid = validate_period(period);
    if (valid.is_error()) {
        BatchResult result;
        result.source = config_.name;
        for (const auto& key : keys) {
            result.outcomes.push_back(
                {key, false, valid.error()->code(), valid.error()->what(), 0});
        }
        return result;
    }
    return run(keys, period, sink);
}

void SourceAdapter::run_batch(BatchReport report, const std::string& period,
                              const BatchSink& sink, BatchResult& result) {
    FetchedRecords batch_records;
    std::vector<SymbolOutcome> batch_outcomes;
    for (const auto& key : report.symbols) {
        auto fetched = fetch_one(key, period);
        if (fetched.is_error()) {
            DEBUG(key << " failed: " << fetched.error()->what());
            batch_outcomes.push_back(
                {key, false, fetched.error()->code(), fetched.error()->what(), 0});
            continue;
        }
        FetchedRecords records = fetched.take_value();
        size_t count = records.bars.size() + records.observations.size();
        batch_outcomes.push_back({key, true, ErrorCode::NONE, "", count});
        batch_records.append(std::move(records));
    }

    if (sink && !batch_records.empty()) {
        auto sunk = sink(batch_records);
        if (sunk.is_error()) {
            ERROR("Failed to store batch " << report.index << ": " << sunk.error()->what());
            for (auto& outcome : batch_outcomes) {
                if (outcome.success) {
                    outcome.success = false;
                    outcome.error = sunk.error()->code();
                    outcome.message = sunk.error()->what();
                    outcome.records = 0;
                }
            }
        }
    } else if (!sink) {
        result.records.append(std::move(batch_records));
    }

    size_t ok = std::count_if(batch_outcomes.begin(), batch_outcomes.end(),
                              [](const SymbolOutcome& o) { return o.success; });
    report.status = ok == batch_outcomes.size() ? BatchStatus::COMPLETED
                    : ok == 0                   ? BatchStatus::FAILED
                                                : BatchStatus::PARTIAL;
    DEBUG("Batch " << report.index << " " << batch_status_to_string(report.status) << ": " << ok
                   << "/" << batch_outcomes.size() << " succeeded");
    result.outcomes.insert(result.outcomes.end(), batch_outcomes.begin(), batch_outcomes.end());
    result.batches.push_back(std::move(report));
}

BatchResult SourceAdapter::run(const std::vector<std::string>& keys, const std::string& period,
                               const BatchSink& sink) {
    ScopedLogComponent log_component(config_.name);
    BatchResult result;
    result.source = config_.name;

    // Validation failures cost no permit and never reach the provider
    std::vector<std::string> accepted;
    for (const auto& key : keys) {
        auto normalized = normalize_key(key);
        if (normalized.is_error()) {
            result.outcomes.push_back(
                {key, false, normalized.error()->code(), normalized.error()->what(), 0});
            continue;
        }
        const std::string& canonical = normalized.value();
        if (std::find(accepted.begin(), accepted.end(), canonical) == accepted.end()) {
            accepted.push_back(canonical);
        }
    }

    const size_t batch_size = static_cast<size_t>(std::max(1, config_.batch_size));
    for (size_t start = 0, index = 0; start < accepted.size(); start += batch_size, ++index) {
        BatchReport report;
        report.index = index;
        report.symbols.assign(accepted.begin() + start,
                              accepted.begin() + std::min(accepted.size(), start + batch_size));

        if (result.quota_exhausted) {
            report.status = BatchStatus::SKIPPED;
            for (const auto& key : report.symbols) {
                result.outcomes.push_back({key, false, ErrorCode::QUOTA_EXCEEDED,
                                           "quota exhausted before this batch", 0});
            }
            result.batches.push_back(std::move(report));
            continue;
        }

        // A batch shrinks to the permits left in the window; the rest is denied
        const int wanted = static_cast<int>(report.symbols.size());
        PermitGrant grant = limiter_->try_acquire_up_to(config_.name, wanted);
        if (grant.granted < wanted) {
            result.quota_exhausted = true;
            result.retry_after = grant.retry_after;

            BatchReport denied;
            denied.index = index;
            denied.status = BatchStatus::DENIED;
            denied.symbols.assign(report.symbols.begin() + grant.granted, report.symbols.end());
            report.symbols.resize(static_cast<size_t>(grant.granted));
            WARN("Batch " << index << " limited to " << grant.granted << " of " << wanted
                          << " requests by quota, aborting remaining batches");

            if (!report.symbols.empty()) {
                run_batch(report, period, sink, result);
            }
            for (const auto& key : denied.symbols) {
                result.outcomes.push_back(
                    {key, false, ErrorCode::QUOTA_EXCEEDED, "quota exhausted", 0});
            }
            result.batches.push_back(std::move(denied));
            continue;
        }

        run_batch(report, period, sink, result);
    }

    update_metrics(result);
    INFO(result.summary());
    return result;
}

}  // namespace finpipe
