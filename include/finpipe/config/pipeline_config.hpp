// include/finpipe/config/pipeline_config.hpp
#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include "finpipe/core/config_base.hpp"
#include "finpipe/core/logger.hpp"
#include "finpipe/core/types.hpp"
#include "finpipe/indicators/indicator_spec.hpp"

namespace finpipe {

enum class StoreBackend { POSTGRES, MEMORY };

/**
 * @brief Quota window semantics
 * ROLLING counts calls in (now - window, now]; FIXED counts calls since the start of the
 * current epoch-aligned window (e.g. since 00:00 UTC for a 86400s window)
 */
enum class WindowKind { ROLLING, FIXED };

std::string fetch_range_to_string(FetchRange range);
Result<FetchRange> fetch_range_from_string(const std::string& value);

struct StoreConfig : public ConfigBase {
    StoreBackend backend{StoreBackend::MEMORY};
    std::string connection_string;  // postgres only
    size_t pool_size{4};            // postgres only
    std::string snapshot_path;      // memory only; empty disables persistence

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Per-provider endpoint and quota settings
 */
struct SourceConfig : public ConfigBase {
    std::string name;
    std::string base_url;
    std::string api_key;
    int quota{0};  // calls per window, 0 = unlimited
    int window_seconds{3600};
    WindowKind window_kind{WindowKind::ROLLING};
    bool count_failures{true};  // whether failed-but-sent requests consume quota
    int batch_size{5};
    int timeout_ms{15000};

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

struct SchedulerConfig : public ConfigBase {
    int interval_seconds{900};
    FetchRange range{FetchRange::COMPACT};
    bool run_macro{false};
    std::vector<std::string> macro_codes;
    bool intraday{false};  // also refresh today's bar from the intraday source

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Top level configuration of the ingestion pipeline
 */
struct PipelineConfig : public ConfigBase {
    StoreConfig store;
    std::map<std::string, SourceConfig> sources;
    std::vector<std::string> indicators;  // e.g. "SMA(20)", "MACD(12,26,9)"
    SchedulerConfig scheduler;
    LoggerConfig logging;
    std::string catalog_path;  // optional symbol catalog CSV

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;

    /**
     * @brief Reject inconsistent settings before any component is built
     */
    Result<void> validate() const;

    /**
     * @brief Parsed indicator list; the standard set when none is configured
     */
    Result<std::vector<IndicatorSpec>> indicator_specs() const;

    const SourceConfig* source(const std::string& name) const;

    /**
     * @brief Defaults for the three built-in providers and a memory store
     */
    static PipelineConfig defaults();
};

/**
 * @brief Load and validate configuration; FINPIPE_CONFIG_PATH overrides the given path
 */
Result<PipelineConfig> load_pipeline_config(const std::string& path);

}  // namespace finpipe
