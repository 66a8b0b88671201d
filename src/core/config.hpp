/**
 * @file config.hpp
 * @brief Daemon configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace spawner {

struct NodeConfig {
    uint32_t id = 1;
};

struct DockerConfig {
    bool enabled = true;
    std::string endpoint = "unix:///var/run/docker.sock";  ///< unix:// or http://
    std::string runtime;                                   ///< OCI runtime override, empty = default
    std::string api_version = "v1.41";
    uint32_t timeout_seconds = 30;
    uint32_t stats_interval_seconds = 10;
    uint32_t events_retry_seconds = 5;                     ///< delay before re-opening the event stream
};

struct CollectorConfig {
    bool enabled = true;
    std::string namespace_name = "default";
    uint16_t application_port = 8080;
    uint32_t cleanup_frequency_seconds = 600;
    uint32_t error_backoff_seconds = 360;
    std::string status_path = "/_api/status";
    uint32_t status_timeout_ms = 5000;
    std::string cluster_api = "http://127.0.0.1:8001";
    std::string label_selector;
    uint32_t worker_threads = 4;
    uint32_t watch_retry_seconds = 5;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
    std::filesystem::path metrics_file;                   ///< empty = metrics discarded
};

/**
 * @brief Top-level daemon configuration.
 */
struct Config {
    NodeConfig node;
    DockerConfig docker;
    CollectorConfig collector;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Every key is optional; missing keys keep the defaults above.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace spawner
