/**
 * @file reconciler.hpp
 * @brief One idle-reconciliation pass over a single workload resource.
 * @author Dimitris Kafetzis
 *
 * A pass fetches the workload's idle time, deletes the resource once it has
 * been idle for at least cleanup_frequency_seconds, and otherwise asks to be
 * looked at again when it would expire.
 */

#pragma once

#include "collector/cluster_client.hpp"
#include "collector/workload_status.hpp"
#include "core/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace spawner {

/**
 * @brief Settings shared read-only by every pass.
 */
struct ReconciliationContext {
    std::string namespace_name{"default"};
    uint16_t application_port{8080};
    uint32_t cleanup_frequency_seconds{600};
    uint32_t error_backoff_seconds{360};
};

struct ReconcileAction {
    std::chrono::seconds requeue_after{0};
    bool deleted{false};
    uint32_t seconds_inactive{0};
    int64_t ttl_seconds{0};                       ///< before clamping
};

struct ReconcileError {
    enum class Kind : uint8_t { StatusCheckFailed, DeleteFailed };

    Kind kind;
    std::string detail;
};

[[nodiscard]] constexpr std::string_view to_string(ReconcileError::Kind kind) noexcept {
    switch (kind) {
        case ReconcileError::Kind::StatusCheckFailed: return "status_check_failed";
        case ReconcileError::Kind::DeleteFailed:      return "delete_failed";
    }
    return "unknown";
}

/// Seconds left before the workload counts as expired; negative once overdue.
[[nodiscard]] constexpr int64_t compute_ttl(uint32_t cleanup_frequency_seconds,
                                            uint32_t seconds_inactive) noexcept {
    return static_cast<int64_t>(cleanup_frequency_seconds) - static_cast<int64_t>(seconds_inactive);
}

/// Requeue delay for a ttl; never negative.
[[nodiscard]] constexpr std::chrono::seconds requeue_delay(int64_t ttl_seconds) noexcept {
    return std::chrono::seconds{ttl_seconds > 0 ? ttl_seconds : 0};
}

/**
 * @brief Run one pass for `resource_name`.
 *
 * A delete answered with NotFound counts as success.
 */
Result<ReconcileAction, ReconcileError> reconcile(const std::string& resource_name,
                                                  const ReconciliationContext& context,
                                                  WorkloadStatusSource& status,
                                                  ClusterApi& cluster);

/// Fixed backoff after a failed pass.
[[nodiscard]] std::chrono::seconds error_policy(const ReconcileError& error,
                                                const ReconciliationContext& context);

}  // namespace spawner
