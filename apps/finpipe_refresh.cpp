#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include "finpipe/config/pipeline_config.hpp"
#include "finpipe/core/clock.hpp"
#include "finpipe/core/logger.hpp"
#include "finpipe/core/state_manager.hpp"
#include "finpipe/data/in_memory_store.hpp"
#include "finpipe/data/postgres_store.hpp"
#include "finpipe/ingest/curl_transport.hpp"
#include "finpipe/pipeline/pipeline_service.hpp"
#include "finpipe/scheduler/refresh_scheduler.hpp"

using namespace finpipe;

namespace {

std::atomic<bool> g_shutdown{false};

void handle_signal(int) {
    g_shutdown.store(true);
}

std::shared_ptr<TimeSeriesStore> open_store(const StoreConfig& config) {
    if (config.backend == StoreBackend::POSTGRES) {
        std::string conn_string = config.connection_string;
        if (const char* env_url = std::getenv("FINPIPE_DATABASE_URL")) {
            if (*env_url != '\0') {
                conn_string = env_url;
            }
        }
        return std::make_shared<PostgresStore>(conn_string, config.pool_size);
    }
    return std::make_shared<InMemoryStore>(config.snapshot_path);
}

}  // namespace

int main(int argc, char* argv[]) {
    try {
        std::string config_path = "config.json";
        bool once = false;

        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--once") {
                once = true;
            } else if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else {
                std::cerr << "Invalid argument: " << arg << std::endl;
                std::cerr << "Usage: " << argv[0] << " [--config path] [--once]" << std::endl;
                return 1;
            }
        }

        auto config_result = load_pipeline_config(config_path);
        if (config_result.is_error()) {
            std::cerr << "Failed to load configuration: " << config_result.error()->to_string()
                      << std::endl;
            return 1;
        }
        PipelineConfig config = config_result.take_value();

        auto& logger = Logger::instance();
        logger.initialize(config.logging);
        if (!logger.is_initialized()) {
            std::cerr << "ERROR: Logger initialization failed" << std::endl;
            return 1;
        }
        Logger::register_component("finpipe_refresh");
        INFO("Loaded configuration from " << config_path);

        auto store = open_store(config.store);
        auto migrated = store->migrate();
        if (migrated.is_error()) {
            FATAL("Store migration failed: " << migrated.error()->to_string());
            return 1;
        }
        INFO("Store " << store->backend_name() << " at schema version " << migrated.value());

        auto clock = std::make_shared<SystemClock>();
        auto transport = std::make_shared<CurlTransport>();
        auto service = std::make_shared<PipelineService>(config, store, transport, clock);

        if (!config.catalog_path.empty()) {
            CommandResult catalog = service->load_catalog(config.catalog_path);
            if (catalog.success) {
                INFO(catalog.message);
            } else {
                WARN("Symbol catalog not loaded: " << catalog.message);
            }
        }

        auto primed = service->rate_limiter()->prime_from_store();
        if (primed.is_error()) {
            WARN("Starting with empty quota windows: " << primed.error()->what());
        }

        RefreshScheduler scheduler(service, config.scheduler, clock);

        if (once) {
            RefreshReport report = scheduler.tick();
            std::cout << report.message << std::endl;
            return report.success ? 0 : 2;
        }

        std::signal(SIGINT, handle_signal);
        std::signal(SIGTERM, handle_signal);

        auto started = scheduler.start();
        if (started.is_error()) {
            FATAL("Scheduler failed to start: " << started.error()->to_string());
            return 1;
        }

        while (!g_shutdown.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        INFO("Shutdown requested, waiting for the current refresh to finish");
        scheduler.stop();

        auto flushed = store->flush();
        if (flushed.is_error()) {
            ERROR("Final flush failed: " << flushed.error()->what());
            return 1;
        }
        INFO("finpipe_refresh exited cleanly, healthy="
             << (StateManager::instance().is_healthy() ? "yes" : "no"));
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
