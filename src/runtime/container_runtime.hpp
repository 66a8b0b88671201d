/**
 * @file container_runtime.hpp
 * @brief Client for the local container runtime (Docker Engine API).
 * @author Dimitris Kafetzis
 *
 * ContainerRuntime is a cheap-to-copy handle over shared, immutable
 * connection settings; copies may be used concurrently from any thread.
 *
 * Read operations that can legitimately find nothing (container missing,
 * no port bound) report that as a normal value. Errors are reserved for
 * infrastructure failures.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "network/http.hpp"
#include "runtime/container_event.hpp"
#include "runtime/container_stats.hpp"
#include "runtime/log_output.hpp"
#include "runtime/subscription.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace spawner {

/**
 * @brief Connection settings for the runtime.
 */
struct RuntimeOptions {
    Endpoint endpoint = Endpoint::unix_socket("/var/run/docker.sock");
    std::optional<std::string> runtime;            ///< OCI runtime applied to created containers
    std::chrono::seconds timeout{30};
    std::string api_version{"v1.41"};
    std::chrono::seconds stats_interval{10};
};

struct RegistryCredentials {
    std::string username;
    std::string password;
    std::string server_address;
};

struct RunningState {
    bool running{false};
    std::optional<int64_t> exit_code;             ///< always empty while running

    bool operator==(const RunningState&) const = default;
};

class ContainerRuntime {
public:
    /// Port inside every workload container that is published to the host.
    static constexpr uint16_t CONTAINER_PORT = 8080;
    static constexpr uint32_t STOP_GRACE_SECONDS = 10;
    static constexpr std::string_view MANAGED_LABEL = "dev.spawner.managed";
    static constexpr std::string_view BACKEND_LABEL = "dev.spawner.backend";

    using EventCallback = std::function<void(const ContainerEvent&)>;
    using LogCallback = std::function<void(const Result<LogOutput>&)>;
    using StatsCallback = std::function<void(const Result<ContainerStats>&)>;

    /**
     * @brief Connect and verify the runtime answers a ping.
     *
     * `logger` must outlive every copy of the returned handle.
     */
    static Result<ContainerRuntime> connect(RuntimeOptions options, Logger& logger);

    // ── Streams ──────────────────────────────

    /**
     * @brief Live container lifecycle events, filtered to type=container.
     *
     * Unparseable or unclassifiable events are logged and skipped. The
     * stream ends only on transport failure or cancellation.
     */
    Subscription run_container_events(EventCallback on_event,
                                      StreamClosedCallback on_closed = {}) const;

    /**
     * @brief Container events that survive stream failures.
     *
     * When the event stream fails or the runtime closes it, the failure is
     * logged and the stream is re-opened after `retry`. Ends only on cancellation.
     */
    Subscription follow_container_events(EventCallback on_event,
                                         std::chrono::milliseconds retry) const;

    /// Combined stdout/stderr, timestamped, from the first line, following.
    Subscription get_logs(const std::string& name,
                          LogCallback on_line,
                          StreamClosedCallback on_closed = {}) const;

    /// Resource-usage samples, at most one per stats interval.
    Subscription get_stats(const std::string& name,
                           StatsCallback on_stats,
                           StreamClosedCallback on_closed = {}) const;

    // ── Lifecycle ────────────────────────────

    Result<void> pull_image(const std::string& image,
                            const std::optional<RegistryCredentials>& credentials) const;

    /**
     * @brief Create and start a container.
     *
     * Publishes CONTAINER_PORT on an ephemeral host port and labels the
     * container as managed. Fails with ErrorCode::Conflict if the name is taken.
     */
    Result<void> run_container(const std::string& name,
                               const std::string& image,
                               const std::map<std::string, std::string>& env) const;

    Result<void> stop_container(const std::string& name) const;

    /// (false, none) for a container that does not exist.
    Result<RunningState> is_running(const std::string& name) const;

    /// Host port bound to CONTAINER_PORT, if it can be determined.
    std::optional<uint16_t> get_port(const std::string& name) const;

    [[nodiscard]] const Endpoint& endpoint() const noexcept { return state_->client.endpoint(); }

private:
    struct State {
        HttpClient client;
        std::optional<std::string> runtime;
        std::string api_prefix;                    ///< "/v1.41"
        std::chrono::seconds stats_interval;
        Logger* logger;
    };

    explicit ContainerRuntime(std::shared_ptr<const State> state) : state_(std::move(state)) {}

    [[nodiscard]] std::string api(std::string_view path) const;
    [[nodiscard]] std::string events_target() const;

    static Result<void> stream_events(const State& state, const std::string& target,
                                      const EventCallback& on_event, std::stop_token stop);

    std::shared_ptr<const State> state_;
};

}  // namespace spawner
