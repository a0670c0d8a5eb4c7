// include/finpipe/ingest/source_adapter.hpp

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "finpipe/config/pipeline_config.hpp"
#include "finpipe/core/clock.hpp"
#include "finpipe/core/error.hpp"
#include "finpipe/core/types.hpp"
#include "finpipe/ingest/http_transport.hpp"
#include "finpipe/ingest/rate_limiter.hpp"

namespace finpipe {

/**
 * @brief Canonical records produced by a provider
 */
struct FetchedRecords {
    std::vector<PriceBar> bars;
    std::vector<MacroObservation> observations;

    bool empty() const {
        return bars.empty() && observations.empty();
    }
    void append(FetchedRecords&& other);
};

/**
 * @brief Result of one requested key (ticker or macro code)
 */
struct SymbolOutcome {
    std::string symbol;
    bool success{false};
    ErrorCode error{ErrorCode::NONE};
    std::string message;
    size_t records{0};
};

enum class BatchStatus {
    COMPLETED,  // every key in the batch succeeded
    PARTIAL,    // requests went out, some keys failed
    FAILED,     // requests went out, every key failed
    DENIED,     // quota denied, no request issued
    SKIPPED     // not attempted because an earlier batch was denied
};

std::string batch_status_to_string(BatchStatus status);

struct BatchReport {
    size_t index{0};
    std::vector<std::string> symbols;
    BatchStatus status{BatchStatus::SKIPPED};
};

/**
 * @brief Aggregate outcome of a fetch: one outcome per distinct requested key
 */
struct BatchResult {
    std::string source;
    std::vector<SymbolOutcome> outcomes;
    std::vector<BatchReport> batches;
    bool quota_exhausted{false};
    std::chrono::milliseconds retry_after{0};

    // Filled only when fetch() ran without a sink
    FetchedRecords records;

    size_t succeeded() const;
    size_t failed() const;
    std::vector<std::string> succeeded_symbols() const;
    const SymbolOutcome* outcome(const std::string& symbol) const;

    /**
     * @brief "Fetched X/Y symbols" plus the failures, for the {success, message} surface
     */
    std::string summary() const;
};

/**
 * @brief Receives the records of each batch as soon as the batch completes
 * An error marks that batch's keys failed with the returned code.
 */
using BatchSink = std::function<Result<void>(const FetchedRecords&)>;

/**
 * @brief Base class of the provider adapters
 *
 * fetch() splits the keys into batches of the configured size. Each batch takes one
 * permit per request from the RateLimiter before any request goes out. When the window
 * holds fewer permits than the batch needs, the batch shrinks to what was granted and the
 * fetch stops there; the remaining keys are reported as QUOTA_EXCEEDED.
 * Failures are recorded per key and never abort sibling keys or batches.
 */
class SourceAdapter {
public:
    SourceAdapter(SourceConfig config, std::shared_ptr<HttpTransport> transport,
                  std::shared_ptr<RateLimiter> limiter, std::shared_ptr<const Clock> clock);
    virtual ~SourceAdapter();

    SourceAdapter(const SourceAdapter&) = delete;
    SourceAdapter& operator=(const SourceAdapter&) = delete;

    const std::string& name() const {
        return config_.name;
    }

    const SourceConfig& config() const {
        return config_;
    }

    BatchResult fetch(const std::vector<std::string>& keys, FetchRange range,
                      const BatchSink& sink = nullptr);

    /**
     * @brief Fetch with a provider-specific period string such as "1y"
     * Every key fails with INVALID_ARGUMENT when the provider rejects the period.
     */
    BatchResult fetch_period(const std::vector<std::string>& keys, const std::string& period,
                             const BatchSink& sink = nullptr);

protected:
    /**
     * @brief Canonical form of a requested key, or an error that rejects it before any
     * request (and without spending a permit)
     */
    virtual Result<std::string> normalize_key(const std::string& key) const = 0;

    virtual std::string build_url(const std::string& key, const std::string& period) const = 0;

    /**
     * @brief Provider period string for a range; providers without history windows ignore it
     */
    virtual std::string period_for(FetchRange range) const {
        (void)range;
        return "";
    }

    virtual Result<void> validate_period(const std::string& period) const {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                config_.name + " does not accept a period (" + period + ")",
                                config_.name);
    }

    /**
     * @brief Turn a 2xx response body into canonical records
     */
    virtual Result<FetchedRecords> parse(const std::string& key,
                                         const std::string& body) const = 0;

    /**
     * @brief Endpoint label written to the audit log
     */
    virtual std::string endpoint() const = 0;

    Timestamp now() const {
        return clock_->now();
    }

    SourceConfig config_;

private:
    BatchResult run(const std::vector<std::string>& keys, const std::string& period,
                    const BatchSink& sink);
    Result<FetchedRecords> fetch_one(const std::string& key, const std::string& period);
    void run_batch(BatchReport report, const std::string& period, const BatchSink& sink,
                   BatchResult& result);
    void register_component();
    void update_metrics(const BatchResult& result);

    std::shared_ptr<HttpTransport> transport_;
    std::shared_ptr<RateLimiter> limiter_;
    std::shared_ptr<const Clock> clock_;
    std::string component_id_;
    size_t total_requests_{0};
    size_t total_succeeded_{0};
};

}  // namespace finpipe
