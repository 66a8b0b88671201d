/**
 * @file fake_cluster.hpp
 * @brief In-memory ClusterApi and WorkloadStatusSource for controller tests.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "collector/cluster_client.hpp"
#include "collector/workload_status.hpp"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace spawner::testing {

class FakeStatusSource : public WorkloadStatusSource {
public:
    void set_idle(const std::string& name, uint32_t seconds) {
        std::lock_guard lock(mutex_);
        idle_[name] = seconds;
        failing_.erase(name);
    }

    void set_failing(const std::string& name) {
        std::lock_guard lock(mutex_);
        failing_.insert(name);
    }

    /// Hold every fetch() until release() is called.
    void hold() {
        std::lock_guard lock(mutex_);
        held_ = true;
    }

    void release() {
        {
            std::lock_guard lock(mutex_);
            held_ = false;
        }
        gate_.notify_all();
    }

    /// Number of fetch() calls currently waiting on hold().
    size_t waiting() {
        std::lock_guard lock(mutex_);
        return waiting_;
    }

    Result<WorkloadIdleState> fetch(const std::string& resource_name,
                                    const std::string& namespace_name,
                                    uint16_t port) override {
        std::unique_lock lock(mutex_);
        ++waiting_;
        gate_.wait(lock, [&] { return !held_; });
        --waiting_;
        calls.push_back(resource_name + "." + namespace_name + ":" + std::to_string(port));
        if (failing_.contains(resource_name)) {
            return Error{ErrorCode::Connection, "connection refused"};
        }
        auto it = idle_.find(resource_name);
        if (it == idle_.end()) return Error{ErrorCode::NotFound, "no such workload"};
        return WorkloadIdleState{it->second};
    }

    size_t call_count() {
        std::lock_guard lock(mutex_);
        return calls.size();
    }

    std::vector<std::string> calls;

private:
    std::mutex mutex_;
    std::condition_variable gate_;
    std::map<std::string, uint32_t> idle_;
    std::set<std::string> failing_;
    bool held_{false};
    size_t waiting_{0};
};

/**
 * @brief Cluster whose watch replays queued events and otherwise blocks
 *        until stopped.
 *
 * A successful delete queues a DELETED watch event, as an API server would,
 * unless announce_deletes is cleared.
 */
class FakeCluster : public ClusterApi {
public:
    explicit FakeCluster(std::vector<std::string> pods = {}) : pods_(std::move(pods)) {}

    Result<WorkloadList> list_workloads(const std::string& /*namespace_name*/) override {
        std::lock_guard lock(mutex_);
        ++list_calls;
        if (fail_list) return Error{ErrorCode::Connection, "cluster unreachable"};
        return WorkloadList{pods_, std::to_string(version_)};
    }

    Result<void> watch_workloads(const std::string& /*namespace_name*/,
                                 const std::string& resource_version,
                                 const WatchCallback& on_event,
                                 std::stop_token stop) override {
        std::unique_lock lock(mutex_);
        ++watch_calls;
        watched_versions.push_back(resource_version);
        while (!stop.stop_requested()) {
            while (!events_.empty()) {
                auto event = events_.front();
                events_.pop_front();
                lock.unlock();
                on_event(event);
                lock.lock();
            }
            if (end_watch_) {
                end_watch_ = false;
                return Result<void>{};
            }
            cv_.wait(lock, stop, [&] { return !events_.empty() || end_watch_; });
        }
        return Result<void>{};
    }

    Result<void> delete_workload(const std::string& name,
                                 const std::string& /*namespace_name*/) override {
        {
            std::lock_guard lock(mutex_);
            deleted.push_back(name);
            if (fail_delete) return Error{ErrorCode::Api, "internal error", 500};
            if (std::erase(pods_, name) == 0) return Error{ErrorCode::NotFound, "not found", 404};
            if (!announce_deletes) return Result<void>{};
            events_.push_back(WatchEvent{WatchEventType::Deleted, name, std::to_string(++version_), 0});
        }
        cv_.notify_all();
        return Result<void>{};
    }

    void push_event(WatchEvent event) {
        {
            std::lock_guard lock(mutex_);
            if (event.type == WatchEventType::Added) pods_.push_back(event.name);
            if (event.type == WatchEventType::Deleted) std::erase(pods_, event.name);
            event.resource_version = std::to_string(++version_);
            events_.push_back(std::move(event));
        }
        cv_.notify_all();
    }

    void end_watch() {
        {
            std::lock_guard lock(mutex_);
            end_watch_ = true;
        }
        cv_.notify_all();
    }

    std::vector<std::string> deleted_names() {
        std::lock_guard lock(mutex_);
        return deleted;
    }

    int list_count() {
        std::lock_guard lock(mutex_);
        return list_calls;
    }

    bool fail_list{false};
    bool fail_delete{false};
    bool announce_deletes{true};
    int list_calls{0};
    int watch_calls{0};
    std::vector<std::string> deleted;
    std::vector<std::string> watched_versions;

private:
    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::vector<std::string> pods_;
    std::deque<WatchEvent> events_;
    uint64_t version_{100};
    bool end_watch_{false};
};

}  // namespace spawner::testing
