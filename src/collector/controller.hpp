/**
 * @file controller.hpp
 * @brief Idle reconciliation controller for the workloads in one namespace.
 * @author Dimitris Kafetzis
 *
 * Two threads feed the worker pool:
 *   - the watch thread lists the workloads, then follows the cluster's
 *     change stream and triggers a pass for every added or modified workload;
 *   - the scheduler thread fires passes whose requeue deadline has passed.
 *
 * A workload is never reconciled by two passes at once. A trigger that
 * arrives while its pass is running is folded into one follow-up pass.
 */

#pragma once

#include "collector/cluster_client.hpp"
#include "collector/reconciler.hpp"
#include "collector/requeue_queue.hpp"
#include "collector/workload_status.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/thread_pool.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <stop_token>
#include <string>
#include <thread>

namespace spawner {

class MetricsCollector;

struct ControllerOptions {
    ReconciliationContext context;
    size_t worker_threads{4};
    std::chrono::seconds watch_retry{5};
};

struct ControllerStats {
    uint64_t passes{0};
    uint64_t deletes{0};
    uint64_t errors{0};
};

class IdleController {
public:
    /// `metrics` may be null. All references must outlive the controller.
    IdleController(ControllerOptions options,
                   ClusterApi& cluster,
                   WorkloadStatusSource& status,
                   Logger& logger,
                   MetricsCollector* metrics = nullptr);
    ~IdleController();

    IdleController(const IdleController&) = delete;
    IdleController& operator=(const IdleController&) = delete;

    /**
     * @brief List the managed workloads and start the control loop.
     *
     * Fails if the initial list fails; nothing is started in that case.
     */
    Result<void> start();

    /// Stop watching and scheduling; passes already running complete.
    void stop();

    /// Request an immediate pass for a known workload.
    void trigger(const std::string& name);

    [[nodiscard]] ControllerStats stats() const noexcept;
    [[nodiscard]] bool running() const noexcept { return running_.load(); }
    [[nodiscard]] bool is_managed(const std::string& name) const;
    [[nodiscard]] std::optional<SteadyTime> scheduled_at(const std::string& name) const;

private:
    void watch_loop(std::stop_token stop, std::string resource_version);
    void scheduler_loop(std::stop_token stop);

    void apply_list(const WorkloadList& list);
    void handle_watch_event(const WatchEvent& event);
    void dispatch_locked(const std::string& name);
    void run_pass(const std::string& name);
    void wake_locked();

    ControllerOptions options_;
    ClusterApi& cluster_;
    WorkloadStatusSource& status_;
    Logger& logger_;
    MetricsCollector* metrics_;

    mutable std::mutex mutex_;
    std::condition_variable_any wake_cv_;
    uint64_t generation_{0};
    RequeueQueue queue_;
    std::set<std::string> known_;
    std::set<std::string> in_flight_;
    std::set<std::string> retrigger_;

    std::atomic<uint64_t> passes_{0};
    std::atomic<uint64_t> deletes_{0};
    std::atomic<uint64_t> errors_{0};
    std::atomic<bool> running_{false};

    ThreadPool pool_;
    std::jthread watch_thread_;
    std::jthread scheduler_thread_;
};

}  // namespace spawner
