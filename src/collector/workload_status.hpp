/**
 * @file workload_status.hpp
 * @brief Idle-state query against a workload's status endpoint.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace spawner {

/**
 * @brief How long a workload has gone without activity.
 *
 * Fetched fresh on every reconciliation pass.
 */
struct WorkloadIdleState {
    uint32_t seconds_inactive{0};
};

/**
 * @brief Parse the status endpoint body; only `seconds_inactive` is read.
 */
Result<WorkloadIdleState> parse_idle_state(std::string_view body);

/**
 * @brief Abstract source of WorkloadIdleState.
 */
class WorkloadStatusSource {
public:
    virtual ~WorkloadStatusSource() = default;

    virtual Result<WorkloadIdleState> fetch(const std::string& resource_name,
                                            const std::string& namespace_name,
                                            uint16_t port) = 0;
};

/**
 * @brief Queries http://<resource>.<namespace>:<port><status_path>.
 */
class HttpWorkloadStatus : public WorkloadStatusSource {
public:
    HttpWorkloadStatus(std::string status_path, std::chrono::milliseconds timeout);

    Result<WorkloadIdleState> fetch(const std::string& resource_name,
                                    const std::string& namespace_name,
                                    uint16_t port) override;

private:
    std::string status_path_;
    std::chrono::milliseconds timeout_;
};

}  // namespace spawner
