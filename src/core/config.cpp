/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <limits>
#include <optional>

namespace spawner {

namespace {

/**
 * @brief Reads integer keys into unsigned fields, keeping the first out-of-range value as an error.
 *
 * Absent or non-integer keys leave the field at its default.
 */
class IntegerReader {
public:
    template <typename T>
    void read(toml::node_view<toml::node> table, std::string_view section, std::string_view key,
              T& out, int64_t min = 0) {
        auto value = table[key].value<int64_t>();
        if (!value) return;
        constexpr auto max = static_cast<int64_t>(std::numeric_limits<T>::max());
        if (*value < min || *value > max) {
            if (!error_) {
                error_ = Error{std::string{section} + "." + std::string{key} + " must be between "
                               + std::to_string(min) + " and " + std::to_string(max)
                               + ", got " + std::to_string(*value)};
            }
            return;
        }
        out = static_cast<T>(*value);
    }

    [[nodiscard]] const std::optional<Error>& error() const noexcept { return error_; }

private:
    std::optional<Error> error_;
};

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{"Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;
        IntegerReader ints;

        // [node]
        if (auto node = tbl["node"]; node.is_table()) {
            ints.read(node, "node", "id", config.node.id);
        }

        // [docker]
        if (auto docker = tbl["docker"]; docker.is_table()) {
            config.docker.enabled = docker["enabled"].value_or(true);
            config.docker.endpoint = docker["endpoint"].value_or(
                std::string{"unix:///var/run/docker.sock"});
            config.docker.runtime = docker["runtime"].value_or(std::string{});
            config.docker.api_version = docker["api_version"].value_or(std::string{"v1.41"});
            ints.read(docker, "docker", "timeout_seconds", config.docker.timeout_seconds, 1);
            ints.read(docker, "docker", "stats_interval_seconds", config.docker.stats_interval_seconds);
            ints.read(docker, "docker", "events_retry_seconds", config.docker.events_retry_seconds);
        }

        // [collector]
        if (auto collector = tbl["collector"]; collector.is_table()) {
            config.collector.enabled = collector["enabled"].value_or(true);
            config.collector.namespace_name = collector["namespace"].value_or(std::string{"default"});
            ints.read(collector, "collector", "application_port", config.collector.application_port, 1);
            ints.read(collector, "collector", "cleanup_frequency_seconds",
                      config.collector.cleanup_frequency_seconds);
            ints.read(collector, "collector", "error_backoff_seconds", config.collector.error_backoff_seconds);
            config.collector.status_path = collector["status_path"].value_or(
                std::string{"/_api/status"});
            ints.read(collector, "collector", "status_timeout_ms", config.collector.status_timeout_ms, 1);
            config.collector.cluster_api = collector["cluster_api"].value_or(
                std::string{"http://127.0.0.1:8001"});
            config.collector.label_selector = collector["label_selector"].value_or(std::string{});
            ints.read(collector, "collector", "worker_threads", config.collector.worker_threads, 1);
            ints.read(collector, "collector", "watch_retry_seconds", config.collector.watch_retry_seconds);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            ints.read(telemetry, "telemetry", "max_file_size_mb", config.telemetry.max_file_size_mb, 1);
            ints.read(telemetry, "telemetry", "rotate_count", config.telemetry.rotate_count);
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
            config.telemetry.metrics_file = telemetry["metrics_file"].value_or(std::string{});
        }

        if (ints.error()) return *ints.error();

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Parse, std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace spawner
