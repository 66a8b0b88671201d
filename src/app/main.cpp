/**
 * @file main.cpp
 * @brief spawner daemon entry point.
 * @author Dimitris Kafetzis
 *
 * Wires the node-local pieces together:
 *   Config → Logger → Telemetry → ContainerRuntime (events) → IdleController
 */

#include "collector/cluster_client.hpp"
#include "collector/controller.hpp"
#include "collector/workload_status.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "network/http.hpp"
#include "runtime/container_runtime.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>

using namespace spawner;

namespace {

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int /*signal*/) {
    g_shutdown_requested.store(true);
}

struct CLIArgs {
    std::filesystem::path config_path = "config/spawner.toml";
    std::string log_dir;
    std::string namespace_name;
    bool no_collector = false;
    bool no_runtime = false;
};

void print_usage() {
    std::cout << "Usage: spawner [OPTIONS]\n"
              << "  --config <path>      Configuration file (default: config/spawner.toml)\n"
              << "  --log-dir <path>     Log output directory (\"-\" for stdout)\n"
              << "  --namespace <name>   Cluster namespace watched by the idle collector\n"
              << "  --no-collector       Do not start the idle collector\n"
              << "  --no-runtime         Do not connect to the container runtime\n"
              << "  --help, -h           Show this help message\n";
}

std::optional<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--namespace" && i + 1 < argc) {
            args.namespace_name = argv[++i];
        } else if (arg == "--no-collector") {
            args.no_collector = true;
        } else if (arg == "--no-runtime") {
            args.no_runtime = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage();
            return std::nullopt;
        }
    }
    return args;
}

std::unique_ptr<ILogSink> make_log_sink(const TelemetryConfig& telemetry) {
    if (telemetry.log_dir.empty() || telemetry.log_dir == "-") {
        return std::make_unique<StdoutSink>();
    }
    return std::make_unique<JsonFileSink>(telemetry.log_dir, "spawner",
                                          telemetry.max_file_size_mb,
                                          telemetry.rotate_count);
}

std::unique_ptr<ILogSink> make_metrics_sink(const TelemetryConfig& telemetry) {
    if (telemetry.metrics_file.empty()) {
        return std::make_unique<NullSink>();
    }
    auto dir = telemetry.metrics_file.parent_path();
    return std::make_unique<JsonFileSink>(dir.empty() ? std::filesystem::path{"."} : dir,
                                          telemetry.metrics_file.stem().string(),
                                          telemetry.max_file_size_mb,
                                          telemetry.rotate_count);
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) return 2;

    // Load configuration
    auto config_result = load_config(args->config_path);
    if (!config_result && std::filesystem::exists(args->config_path)) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        return 1;
    }
    if (!config_result) {
        std::cerr << config_result.error().message << "; using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args->log_dir.empty()) config.telemetry.log_dir = args->log_dir;
    if (!args->namespace_name.empty()) config.collector.namespace_name = args->namespace_name;
    if (args->no_collector) config.collector.enabled = false;
    if (args->no_runtime) config.docker.enabled = false;

    // ── Initialize Logger ────────────────────
    auto level = parse_log_level(config.telemetry.log_level);
    if (!level) {
        std::cerr << "Unknown log level: " << config.telemetry.log_level << std::endl;
        return 1;
    }
    Logger logger(make_log_sink(config.telemetry), *level);
    MetricsCollector metrics(make_metrics_sink(config.telemetry));

    NodeId node_id{config.node.id};
    logger.info("spawner starting", {{"node", node_id.to_string()}});

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Container runtime ────────────────────
    std::optional<ContainerRuntime> runtime;
    Subscription events;
    if (config.docker.enabled) {
        auto endpoint = parse_endpoint(config.docker.endpoint);
        if (!endpoint) {
            logger.error("Invalid docker.endpoint", {{"error", endpoint.error().message}});
            return 1;
        }

        RuntimeOptions options;
        options.endpoint = *endpoint;
        if (!config.docker.runtime.empty()) options.runtime = config.docker.runtime;
        options.timeout = std::chrono::seconds{config.docker.timeout_seconds};
        options.api_version = config.docker.api_version;
        options.stats_interval = std::chrono::seconds{config.docker.stats_interval_seconds};

        auto connected = ContainerRuntime::connect(std::move(options), logger);
        if (!connected) {
            logger.error("Could not connect to container runtime",
                         {{"error", connected.error().message}});
            return 1;
        }
        runtime = std::move(*connected);

        events = runtime->follow_container_events(
            [&](const ContainerEvent& event) {
                auto workload = WorkloadId::from_resource_name(event.workload_name);
                logger.info("Container event",
                            {{"kind", std::string{to_string(event.kind)}},
                             {"name", event.workload_name},
                             {"workload", workload ? workload->id() : std::string{}}});
                metrics.record_container_event(event);
            },
            std::chrono::seconds{config.docker.events_retry_seconds});
    }

    // ── Idle collector ───────────────────────
    std::unique_ptr<KubeClusterClient> cluster;
    std::unique_ptr<HttpWorkloadStatus> status;
    std::unique_ptr<IdleController> controller;
    if (config.collector.enabled) {
        auto api = parse_endpoint(config.collector.cluster_api);
        if (!api) {
            logger.error("Invalid collector.cluster_api", {{"error", api.error().message}});
            return 1;
        }

        cluster = std::make_unique<KubeClusterClient>(*api, config.collector.label_selector);
        status = std::make_unique<HttpWorkloadStatus>(
            config.collector.status_path,
            std::chrono::milliseconds{config.collector.status_timeout_ms});

        ControllerOptions options;
        options.context.namespace_name = config.collector.namespace_name;
        options.context.application_port = config.collector.application_port;
        options.context.cleanup_frequency_seconds = config.collector.cleanup_frequency_seconds;
        options.context.error_backoff_seconds = config.collector.error_backoff_seconds;
        options.worker_threads = config.collector.worker_threads;
        options.watch_retry = std::chrono::seconds{config.collector.watch_retry_seconds};

        controller = std::make_unique<IdleController>(options, *cluster, *status, logger, &metrics);
        if (auto started = controller->start(); !started) {
            logger.error("Could not start idle collector", {{"error", started.error().message}});
            return 1;
        }
    }

    if (!runtime && !controller) {
        logger.warn("Nothing to do: runtime and collector are both disabled");
        return 0;
    }

    // ── Main loop ────────────────────────────
    logger.info("Running. Press Ctrl+C to shutdown.");
    while (!g_shutdown_requested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Cleaning up...");
    events.cancel();
    if (controller) controller->stop();

    metrics.flush();
    logger.info("spawner stopped.");
    logger.flush();
    return 0;
}
