/**
 * @file workload_status.cpp
 * @brief HttpWorkloadStatus implementation.
 * @author Dimitris Kafetzis
 */

#include "collector/workload_status.hpp"

#include "network/http.hpp"
#include "network/json_codec.hpp"

namespace spawner {

Result<WorkloadIdleState> parse_idle_state(std::string_view body) {
    auto doc = parse_json(body);
    if (!doc) return doc.error();
    if (!doc->isObject()) {
        return Error{ErrorCode::Parse, "Status body is not a JSON object"};
    }

    const auto& field = (*doc)["seconds_inactive"];
    if (!field.isUInt()) {
        return Error{ErrorCode::Parse, "Status body has no valid seconds_inactive"};
    }
    return WorkloadIdleState{field.asUInt()};
}

HttpWorkloadStatus::HttpWorkloadStatus(std::string status_path, std::chrono::milliseconds timeout)
    : status_path_(std::move(status_path)), timeout_(timeout) {
    if (status_path_.empty() || status_path_.front() != '/') {
        status_path_.insert(status_path_.begin(), '/');
    }
}

Result<WorkloadIdleState> HttpWorkloadStatus::fetch(const std::string& resource_name,
                                                    const std::string& namespace_name,
                                                    uint16_t port) {
    HttpClient client(Endpoint::tcp(resource_name + "." + namespace_name, port), timeout_);

    auto response = client.send(HttpRequest{.method = "GET", .target = status_path_});
    if (!response) return response.error();
    if (!response->ok()) return status_error(*response, "Status of " + resource_name);

    return parse_idle_state(response->body);
}

}  // namespace spawner
