/**
 * @file controller.cpp
 * @brief IdleController implementation.
 * @author Dimitris Kafetzis
 */

#include "collector/controller.hpp"

#include "core/types.hpp"
#include "telemetry/metrics_collector.hpp"

#include <utility>

namespace spawner {

namespace {

/// Workload id behind a resource name; names without the prefix are returned as-is.
std::string workload_of(const std::string& resource_name) {
    if (auto id = WorkloadId::from_resource_name(resource_name)) return id->id();
    return resource_name;
}

}  // anonymous namespace

IdleController::IdleController(ControllerOptions options,
                               ClusterApi& cluster,
                               WorkloadStatusSource& status,
                               Logger& logger,
                               MetricsCollector* metrics)
    : options_(std::move(options))
    , cluster_(cluster)
    , status_(status)
    , logger_(logger)
    , metrics_(metrics)
    , pool_(options_.worker_threads == 0 ? 1 : options_.worker_threads) {}

IdleController::~IdleController() {
    stop();
}

Result<void> IdleController::start() {
    if (running_.load()) return Result<void>{};

    const auto& ns = options_.context.namespace_name;
    auto list = cluster_.list_workloads(ns);
    if (!list) {
        return Error{list.error().code,
                     "Initial workload list in " + ns + " failed: " + list.error().message};
    }
    apply_list(*list);

    running_.store(true);
    scheduler_thread_ = std::jthread([this](std::stop_token stop) { scheduler_loop(stop); });
    watch_thread_ = std::jthread([this, rv = list->resource_version](std::stop_token stop) {
        watch_loop(stop, rv);
    });

    logger_.info("Idle controller started",
                 {{"namespace", ns},
                  {"workloads", std::to_string(list->names.size())},
                  {"cleanup_frequency_s", std::to_string(options_.context.cleanup_frequency_seconds)}});
    return Result<void>{};
}

void IdleController::stop() {
    if (!running_.exchange(false)) return;

    watch_thread_.request_stop();
    scheduler_thread_.request_stop();
    if (watch_thread_.joinable()) watch_thread_.join();
    if (scheduler_thread_.joinable()) scheduler_thread_.join();
    pool_.shutdown();

    logger_.info("Idle controller stopped",
                 {{"passes", std::to_string(passes_.load())},
                  {"deletes", std::to_string(deletes_.load())},
                  {"errors", std::to_string(errors_.load())}});
}

void IdleController::trigger(const std::string& name) {
    std::lock_guard lock(mutex_);
    if (!known_.contains(name)) return;
    queue_.schedule(name, std::chrono::steady_clock::now());
    wake_locked();
}

ControllerStats IdleController::stats() const noexcept {
    return ControllerStats{passes_.load(), deletes_.load(), errors_.load()};
}

bool IdleController::is_managed(const std::string& name) const {
    std::lock_guard lock(mutex_);
    return known_.contains(name);
}

std::optional<SteadyTime> IdleController::scheduled_at(const std::string& name) const {
    std::lock_guard lock(mutex_);
    return queue_.deadline_of(name);
}

// ─────────────────────────────────────────────
// Watch
// ─────────────────────────────────────────────

void IdleController::watch_loop(std::stop_token stop, std::string resource_version) {
    const auto& ns = options_.context.namespace_name;
    bool need_list = false;

    auto sleep_retry = [&] {
        std::unique_lock lock(mutex_);
        wake_cv_.wait_for(lock, stop, options_.watch_retry, [] { return false; });
    };

    while (!stop.stop_requested()) {
        if (need_list) {
            auto list = cluster_.list_workloads(ns);
            if (!list) {
                logger_.warn("Workload list failed", {{"namespace", ns}, {"error", list.error().message}});
                sleep_retry();
                continue;
            }
            apply_list(*list);
            resource_version = list->resource_version;
            need_list = false;
        }

        bool expired = false;
        auto watched = cluster_.watch_workloads(ns, resource_version,
            [&](const WatchEvent& event) {
                if (event.type == WatchEventType::Error) {
                    logger_.warn("Workload watch reported an error",
                                 {{"code", std::to_string(event.error_code)}});
                    expired = true;
                    return;
                }
                if (!event.resource_version.empty()) resource_version = event.resource_version;
                handle_watch_event(event);
            },
            stop);

        if (stop.stop_requested()) break;
        if (!watched) {
            logger_.warn("Workload watch failed", {{"namespace", ns}, {"error", watched.error().message}});
        } else {
            logger_.debug("Workload watch ended", {{"namespace", ns}, {"expired", expired ? "true" : "false"}});
        }

        need_list = true;
        sleep_retry();
    }
}

void IdleController::apply_list(const WorkloadList& list) {
    std::lock_guard lock(mutex_);
    std::set<std::string> listed(list.names.begin(), list.names.end());

    for (auto it = known_.begin(); it != known_.end();) {
        if (!listed.contains(*it)) {
            queue_.remove(*it);
            retrigger_.erase(*it);
            it = known_.erase(it);
        } else {
            ++it;
        }
    }

    auto now = std::chrono::steady_clock::now();
    for (const auto& name : listed) {
        known_.insert(name);
        queue_.schedule(name, now);
    }
    wake_locked();
}

void IdleController::handle_watch_event(const WatchEvent& event) {
    if (event.name.empty()) return;

    std::lock_guard lock(mutex_);
    switch (event.type) {
        case WatchEventType::Added:
        case WatchEventType::Modified:
            known_.insert(event.name);
            queue_.schedule(event.name, std::chrono::steady_clock::now());
            wake_locked();
            break;
        case WatchEventType::Deleted:
            known_.erase(event.name);
            queue_.remove(event.name);
            retrigger_.erase(event.name);
            break;
        case WatchEventType::Bookmark:
        case WatchEventType::Error:
            break;
    }
}

// ─────────────────────────────────────────────
// Scheduling
// ─────────────────────────────────────────────

void IdleController::wake_locked() {
    ++generation_;
    wake_cv_.notify_all();
}

void IdleController::scheduler_loop(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    while (!stop.stop_requested()) {
        for (const auto& name : queue_.pop_due(std::chrono::steady_clock::now())) {
            dispatch_locked(name);
        }

        auto seen = generation_;
        auto woken = [&] { return generation_ != seen; };
        if (auto next = queue_.next_deadline()) {
            wake_cv_.wait_until(lock, stop, *next, woken);
        } else {
            wake_cv_.wait(lock, stop, woken);
        }
    }
}

void IdleController::dispatch_locked(const std::string& name) {
    if (!known_.contains(name)) return;
    if (in_flight_.contains(name)) {
        retrigger_.insert(name);
        return;
    }
    in_flight_.insert(name);
    pool_.submit([this, name] { run_pass(name); });
}

void IdleController::run_pass(const std::string& name) {
    logger_.info("Reconciling workload", {{"resource", name}});

    auto result = reconcile(name, options_.context, status_, cluster_);
    ++passes_;

    std::chrono::seconds delay{0};
    if (result) {
        delay = result->requeue_after;
        if (result->deleted) {
            ++deletes_;
            logger_.info("Deleted idle workload",
                         {{"resource", name},
                          {"workload", workload_of(name)},
                          {"seconds_inactive", std::to_string(result->seconds_inactive)},
                          {"requeue_after_s", std::to_string(delay.count())}});
        } else {
            logger_.debug("Workload still active",
                          {{"resource", name},
                           {"seconds_inactive", std::to_string(result->seconds_inactive)},
                           {"requeue_after_s", std::to_string(delay.count())}});
        }
        if (metrics_) metrics_->record_reconcile(name, *result);
    } else {
        ++errors_;
        delay = error_policy(result.error(), options_.context);
        logger_.warn("Encountered error; retrying",
                     {{"resource", name},
                      {"kind", std::string{to_string(result.error().kind)}},
                      {"detail", result.error().detail},
                      {"backoff_s", std::to_string(delay.count())}});
        if (metrics_) metrics_->record_reconcile_error(name, result.error(), delay);
    }

    std::lock_guard lock(mutex_);
    in_flight_.erase(name);
    auto now = std::chrono::steady_clock::now();
    if (!known_.contains(name)) {
        retrigger_.erase(name);
    } else if (retrigger_.erase(name) > 0) {
        queue_.schedule(name, now);
    } else {
        // A deleted resource stays managed until the watch reports it gone.
        queue_.schedule(name, now + delay);
    }
    wake_locked();
}

}  // namespace spawner
