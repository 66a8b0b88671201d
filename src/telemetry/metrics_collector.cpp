/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"

#include <iomanip>
#include <sstream>

namespace spawner {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_container_event(const ContainerEvent& event) {
    std::ostringstream oss;
    oss << R"({"event":"container_event")"
        << R"(,"kind":")" << to_string(event.kind) << "\""
        << R"(,"name":")" << escape_json(event.workload_name) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_container_stats(std::string_view name, const ContainerStats& stats) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << R"({"event":"container_stats")"
        << R"(,"name":")" << escape_json(name) << "\""
        << R"(,"cpu_pct":)" << stats.cpu_percent()
        << R"(,"mem_usage_bytes":)" << stats.memory_usage_bytes
        << R"(,"mem_limit_bytes":)" << stats.memory_limit_bytes
        << R"(,"net_rx_bytes":)" << stats.network_rx_bytes
        << R"(,"net_tx_bytes":)" << stats.network_tx_bytes
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_reconcile(std::string_view resource, const ReconcileAction& action) {
    std::ostringstream oss;
    oss << R"({"event":"reconcile")"
        << R"(,"resource":")" << escape_json(resource) << "\""
        << R"(,"seconds_inactive":)" << action.seconds_inactive
        << R"(,"ttl":)" << action.ttl_seconds
        << R"(,"deleted":)" << (action.deleted ? "true" : "false")
        << R"(,"requeue_after_s":)" << action.requeue_after.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_reconcile_error(std::string_view resource,
                                              const ReconcileError& error,
                                              std::chrono::seconds backoff) {
    std::ostringstream oss;
    oss << R"({"event":"reconcile_error")"
        << R"(,"resource":")" << escape_json(resource) << "\""
        << R"(,"kind":")" << to_string(error.kind) << "\""
        << R"(,"detail":")" << escape_json(error.detail) << "\""
        << R"(,"backoff_s":)" << backoff.count()
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << escape_json(event) << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace spawner
