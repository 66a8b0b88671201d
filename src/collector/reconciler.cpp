/**
 * @file reconciler.cpp
 * @brief Idle reconciliation pass.
 * @author Dimitris Kafetzis
 */

#include "collector/reconciler.hpp"

namespace spawner {

Result<ReconcileAction, ReconcileError> reconcile(const std::string& resource_name,
                                                  const ReconciliationContext& context,
                                                  WorkloadStatusSource& status,
                                                  ClusterApi& cluster) {
    auto idle = status.fetch(resource_name, context.namespace_name, context.application_port);
    if (!idle) {
        return ReconcileError{ReconcileError::Kind::StatusCheckFailed, idle.error().message};
    }

    ReconcileAction action;
    action.seconds_inactive = idle->seconds_inactive;
    action.ttl_seconds = compute_ttl(context.cleanup_frequency_seconds, idle->seconds_inactive);

    if (action.ttl_seconds <= 0) {
        auto deleted = cluster.delete_workload(resource_name, context.namespace_name);
        if (!deleted && !deleted.error().is_not_found()) {
            return ReconcileError{ReconcileError::Kind::DeleteFailed, deleted.error().message};
        }
        action.deleted = true;
    }

    action.requeue_after = requeue_delay(action.ttl_seconds);
    return action;
}

std::chrono::seconds error_policy(const ReconcileError& /*error*/,
                                  const ReconciliationContext& context) {
    return std::chrono::seconds{context.error_backoff_seconds};
}

}  // namespace spawner
