/**
 * @file metrics_collector.hpp
 * @brief Structured event collection for telemetry.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "collector/reconciler.hpp"
#include "core/logger.hpp"
#include "runtime/container_event.hpp"
#include "runtime/container_stats.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string_view>

namespace spawner {

/**
 * @brief Collects and logs structured telemetry events as NDJSON.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_container_event(const ContainerEvent& event);
    void record_container_stats(std::string_view name, const ContainerStats& stats);
    void record_reconcile(std::string_view resource, const ReconcileAction& action);
    void record_reconcile_error(std::string_view resource,
                                const ReconcileError& error,
                                std::chrono::seconds backoff);
    void record_custom(std::string_view event, std::string_view json_payload);

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;

    void emit(std::string_view json_line);
};

}  // namespace spawner
