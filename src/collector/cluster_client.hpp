/**
 * @file cluster_client.hpp
 * @brief Access to the managed workload resources in the cluster API.
 * @author Dimitris Kafetzis
 *
 * ClusterApi is the seam between the idle controller and the cluster: list,
 * watch and delete of the workload pods in one namespace. KubeClusterClient
 * talks to an already-authenticated Kubernetes API endpoint (for example a
 * local `kubectl proxy`).
 */

#pragma once

#include "core/result.hpp"
#include "network/http.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

namespace spawner {

enum class WatchEventType : uint8_t {
    Added,
    Modified,
    Deleted,
    Bookmark,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(WatchEventType type) noexcept {
    switch (type) {
        case WatchEventType::Added:    return "ADDED";
        case WatchEventType::Modified: return "MODIFIED";
        case WatchEventType::Deleted:  return "DELETED";
        case WatchEventType::Bookmark: return "BOOKMARK";
        case WatchEventType::Error:    return "ERROR";
    }
    return "UNKNOWN";
}

struct WatchEvent {
    WatchEventType type{WatchEventType::Added};
    std::string name;                  ///< empty for Error events
    std::string resource_version;
    int error_code{0};                 ///< Status.code of an Error event (410 = expired)
};

struct WorkloadList {
    std::vector<std::string> names;
    std::string resource_version;
};

/// Decode one line of a watch stream; nullopt for unknown event types.
std::optional<WatchEvent> parse_watch_event(const Json::Value& doc);

/// Decode a PodList document.
Result<WorkloadList> parse_workload_list(const Json::Value& doc);

using WatchCallback = std::function<void(const WatchEvent&)>;

/**
 * @brief Abstract cluster API used by the idle controller.
 */
class ClusterApi {
public:
    virtual ~ClusterApi() = default;

    virtual Result<WorkloadList> list_workloads(const std::string& namespace_name) = 0;

    /**
     * @brief Stream changes after `resource_version` until the server ends
     *        the watch, an error occurs, or `stop` is requested.
     */
    virtual Result<void> watch_workloads(const std::string& namespace_name,
                                         const std::string& resource_version,
                                         const WatchCallback& on_event,
                                         std::stop_token stop) = 0;

    /// Returns ErrorCode::NotFound if the resource is already gone.
    virtual Result<void> delete_workload(const std::string& name,
                                         const std::string& namespace_name) = 0;
};

class KubeClusterClient : public ClusterApi {
public:
    KubeClusterClient(Endpoint endpoint,
                      std::string label_selector = {},
                      std::chrono::milliseconds timeout = std::chrono::seconds{30});

    Result<WorkloadList> list_workloads(const std::string& namespace_name) override;

    Result<void> watch_workloads(const std::string& namespace_name,
                                 const std::string& resource_version,
                                 const WatchCallback& on_event,
                                 std::stop_token stop) override;

    Result<void> delete_workload(const std::string& name,
                                 const std::string& namespace_name) override;

private:
    [[nodiscard]] std::string pods_path(const std::string& namespace_name) const;

    HttpClient client_;
    std::string label_selector_;
};

}  // namespace spawner
