#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "core/config/ConfigLoader.h"
#include "core/logging/Log.h"
#include "core/monitoring/MetricsServer.h"
#include "core/monitoring/ScrapeHandler.h"
#include "core/service/impl/windows/ScmServiceManager.h"
#include "core/service/impl/windows/WmiServiceQueryClient.h"
#include "svcmon/service/ServiceCollector.hpp"

using namespace svcmon;

namespace {

std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [--config <path>]" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    config::ConfigLoader loader;
    if (!config_path.empty() && !loader.loadFromFile(config_path)) {
        std::cerr << "Failed to load configuration, using defaults" << std::endl;
    }
    const config::ExporterConfig exporter_config = loader.toExporterConfig();

    try {
        core::logging::initialize_async_logger(exporter_config.logLevel, exporter_config.logFile);
    } catch (const std::exception& e) {
        std::cerr << "Logger setup failed: " << e.what() << std::endl;
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    service::ServiceCollectorConfig collector_config;
    collector_config.filter = exporter_config.servicesWhere;
    collector_config.useLiveApi = exporter_config.disableWmi;

    auto collector = std::make_shared<const service::ServiceCollector>(
        collector_config,
        std::make_shared<core::service::windows::WmiServiceQueryClient>(),
        std::make_shared<core::service::windows::ScmServiceManager>());

    auto handler = std::make_shared<core::monitoring::ScrapeHandler>(
        collector, exporter_config.metricNamespace);

    core::monitoring::MetricsServer server(handler, exporter_config.listenAddress, exporter_config.port);
    if (!server.start()) {
        spdlog::critical("Unable to start metrics server");
        core::logging::shutdown_logger();
        return 1;
    }

    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    spdlog::info("Shutting down");
    server.stop();
    core::logging::shutdown_logger();
    return 0;
}
