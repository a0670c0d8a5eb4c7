// src/config/pipeline_config.cpp

#include "finpipe/config/pipeline_config.hpp"
#include <cstdlib>
#include <set>
#include <stdexcept>
#include "finpipe/ingest/macro_catalog.hpp"

namespace finpipe {

namespace {

std::string backend_to_string(StoreBackend backend) {
    return backend == StoreBackend::POSTGRES ? "postgres" : "memory";
}

std::string window_kind_to_string(WindowKind kind) {
    return kind == WindowKind::FIXED ? "fixed" : "rolling";
}

}  // namespace

std::string fetch_range_to_string(FetchRange range) {
    return range == FetchRange::FULL ? "full" : "compact";
}

Result<FetchRange> fetch_range_from_string(const std::string& value) {
    if (value == "compact")
        return FetchRange::COMPACT;
    if (value == "full")
        return FetchRange::FULL;
    return make_error<FetchRange>(ErrorCode::INVALID_ARGUMENT, "Unknown fetch range: " + value,
                                  "PipelineConfig");
}

nlohmann::json StoreConfig::to_json() const {
    nlohmann::json j;
    j["backend"] = backend_to_string(backend);
    j["connection_string"] = connection_string;
    j["pool_size"] = pool_size;
    j["snapshot_path"] = snapshot_path;
    return j;
}

void StoreConfig::from_json(const nlohmann::json& j) {
    if (j.contains("backend")) {
        std::string value = j.at("backend").get<std::string>();
        if (value == "postgres") {
            backend = StoreBackend::POSTGRES;
        } else if (value == "memory") {
            backend = StoreBackend::MEMORY;
        } else {
            throw std::invalid_argument("Unknown store backend: " + value);
        }
    }
    if (j.contains("connection_string"))
        connection_string = j.at("connection_string").get<std::string>();
    if (j.contains("pool_size"))
        pool_size = j.at("pool_size").get<size_t>();
    if (j.contains("snapshot_path"))
        snapshot_path = j.at("snapshot_path").get<std::string>();
}

nlohmann::json SourceConfig::to_json() const {
    nlohmann::json j;
    j["name"] = name;
    j["base_url"] = base_url;
    j["api_key"] = api_key;
    j["quota"] = quota;
    j["window_seconds"] = window_seconds;
    j["window_kind"] = window_kind_to_string(window_kind);
    j["count_failures"] = count_failures;
    j["batch_size"] = batch_size;
    j["timeout_ms"] = timeout_ms;
    return j;
}

void SourceConfig::from_json(const nlohmann::json& j) {
    if (j.contains("name"))
        name = j.at("name").get<std::string>();
    if (j.contains("base_url"))
        base_url = j.at("base_url").get<std::string>();
    if (j.contains("api_key"))
        api_key = j.at("api_key").get<std::string>();
    if (j.contains("quota"))
        quota = j.at("quota").get<int>();
    if (j.contains("window_seconds"))
        window_seconds = j.at("window_seconds").get<int>();
    if (j.contains("window_kind")) {
        std::string value = j.at("window_kind").get<std::string>();
        if (value == "rolling") {
            window_kind = WindowKind::ROLLING;
        } else if (value == "fixed") {
            window_kind = WindowKind::FIXED;
        } else {
            throw std::invalid_argument("Unknown window kind: " + value);
        }
    }
    if (j.contains("count_failures"))
        count_failures = j.at("count_failures").get<bool>();
    if (j.contains("batch_size"))
        batch_size = j.at("batch_size").get<int>();
    if (j.contains("timeout_ms"))
        timeout_ms = j.at("timeout_ms").get<int>();
}

nlohmann::json SchedulerConfig::to_json() const {
    nlohmann::json j;
    j["interval_seconds"] = interval_seconds;
    j["range"] = fetch_range_to_string(range);
    j["run_macro"] = run_macro;
    j["macro_codes"] = macro_codes;
    j["intraday"] = intraday;
    return j;
}

void SchedulerConfig::from_json(const nlohmann::json& j) {
    if (j.contains("interval_seconds"))
        interval_seconds = j.at("interval_seconds").get<int>();
    if (j.contains("range")) {
        auto parsed = fetch_range_from_string(j.at("range").get<std::string>());
        if (parsed.is_error()) {
            throw std::invalid_argument(parsed.error()->what());
        }
        range = parsed.value();
    }
    if (j.contains("run_macro"))
        run_macro = j.at("run_macro").get<bool>();
    if (j.contains("macro_codes"))
        macro_codes = j.at("macro_codes").get<std::vector<std::string>>();
    if (j.contains("intraday"))
        intraday = j.at("intraday").get<bool>();
}

nlohmann::json PipelineConfig::to_json() const {
    nlohmann::json j;
    j["store"] = store.to_json();
    nlohmann::json source_json = nlohmann::json::object();
    for (const auto& [name, source] : sources) {
        source_json[name] = source.to_json();
    }
    j["sources"] = source_json;
    j["indicators"] = indicators;
    j["scheduler"] = scheduler.to_json();
    j["logging"] = logging.to_json();
    j["catalog_path"] = catalog_path;
    return j;
}

void PipelineConfig::from_json(const nlohmann::json& j) {
    if (j.contains("store"))
        store.from_json(j.at("store"));
    if (j.contains("sources")) {
        for (const auto& [name, value] : j.at("sources").items()) {
            // Partial entries refine the built-in defaults for that provider
            SourceConfig source = sources.count(name) ? sources.at(name) : SourceConfig();
            source.from_json(value);
            source.name = name;
            sources[name] = source;
        }
    }
    if (j.contains("indicators"))
        indicators = j.at("indicators").get<std::vector<std::string>>();
    if (j.contains("scheduler"))
        scheduler.from_json(j.at("scheduler"));
    if (j.contains("logging"))
        logging.from_json(j.at("logging"));
    if (j.contains("catalog_path"))
        catalog_path = j.at("catalog_path").get<std::string>();
}

Result<void> PipelineConfig::validate() const {
    auto invalid = [](const std::string& message) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, message, "PipelineConfig");
    };

    if (store.backend == StoreBackend::POSTGRES) {
        if (store.connection_string.empty())
            return invalid("Postgres store requires a connection string");
        if (store.pool_size == 0)
            return invalid("Store pool size must be at least 1");
    }

    for (const auto& [key, source] : sources) {
        if (key.empty() || source.name.empty())
            return invalid("Source name cannot be empty");
        if (source.base_url.empty())
            return invalid("Source " + key + " has no base URL");
        if (source.quota < 0)
            return invalid("Source " + key + " has a negative quota");
        if (source.quota > 0 && source.window_seconds <= 0)
            return invalid("Source " + key + " needs a positive window length");
        if (source.batch_size <= 0)
            return invalid("Source " + key + " batch size must be at least 1");
        if (source.quota > 0 && source.batch_size > source.quota)
            return invalid("Source " + key + " batch size " + std::to_string(source.batch_size) +
                           " exceeds its quota of " + std::to_string(source.quota));
        if (source.timeout_ms <= 0)
            return invalid("Source " + key + " timeout must be positive");
    }

    auto specs = indicator_specs();
    if (specs.is_error()) {
        return forward_error<void>(specs, "PipelineConfig");
    }

    if (scheduler.interval_seconds <= 0)
        return invalid("Scheduler interval must be positive");
    for (const auto& code : scheduler.macro_codes) {
        if (!find_macro_series(code))
            return invalid("Unknown macro indicator: " + code);
    }
    return Result<void>();
}

Result<std::vector<IndicatorSpec>> PipelineConfig::indicator_specs() const {
    if (indicators.empty()) {
        return default_indicator_set();
    }
    std::vector<IndicatorSpec> specs;
    std::set<std::string> seen;
    for (const auto& text : indicators) {
        auto spec = IndicatorSpec::parse(text);
        if (spec.is_error()) {
            return forward_error<std::vector<IndicatorSpec>>(spec, "PipelineConfig");
        }
        if (seen.insert(spec.value().label()).second) {
            specs.push_back(spec.value());
        }
    }
    return specs;
}

const SourceConfig* PipelineConfig::source(const std::string& name) const {
    auto it = sources.find(name);
    return it == sources.end() ? nullptr : &it->second;
}

PipelineConfig PipelineConfig::defaults() {
    PipelineConfig config;

    SourceConfig eod;
    eod.name = "yahoo_eod";
    eod.base_url = "https://query1.finance.yahoo.com";
    eod.quota = 2000;
    eod.window_seconds = 3600;
    config.sources[eod.name] = eod;

    SourceConfig intraday = eod;
    intraday.name = "yahoo_intraday";
    config.sources[intraday.name] = intraday;

    SourceConfig fred;
    fred.name = "fred";
    fred.base_url = "https://fred.stlouisfed.org";
    fred.quota = 0;
    fred.batch_size = 1;
    fred.timeout_ms = 30000;
    config.sources[fred.name] = fred;

    return config;
}

Result<PipelineConfig> load_pipeline_config(const std::string& path) {
    std::string resolved = path;
    if (const char* override_path = std::getenv("FINPIPE_CONFIG_PATH")) {
        if (*override_path != '\0') {
            resolved = override_path;
        }
    }

    PipelineConfig config = PipelineConfig::defaults();
    auto loaded = config.load_from_file(resolved);
    if (loaded.is_error()) {
        return forward_error<PipelineConfig>(loaded, "PipelineConfig");
    }

    auto valid = config.validate();
    if (valid.is_error()) {
        return forward_error<PipelineConfig>(valid);
    }
    return config;
}

}  // namespace finpipe
