/**
 * @file cluster_client.cpp
 * @brief KubeClusterClient implementation.
 * @author Dimitris Kafetzis
 */

#include "collector/cluster_client.hpp"

#include "network/json_codec.hpp"

namespace spawner {

namespace {

std::optional<WatchEventType> parse_watch_type(const std::string& type) {
    if (type == "ADDED") return WatchEventType::Added;
    if (type == "MODIFIED") return WatchEventType::Modified;
    if (type == "DELETED") return WatchEventType::Deleted;
    if (type == "BOOKMARK") return WatchEventType::Bookmark;
    if (type == "ERROR") return WatchEventType::Error;
    return std::nullopt;
}

std::string metadata_field(const Json::Value& object, const char* key) {
    if (!object.isObject()) return {};
    const auto& metadata = object["metadata"];
    if (!metadata.isObject() || !metadata[key].isString()) return {};
    return metadata[key].asString();
}

}  // anonymous namespace

std::optional<WatchEvent> parse_watch_event(const Json::Value& doc) {
    if (!doc.isObject() || !doc["type"].isString()) return std::nullopt;

    auto type = parse_watch_type(doc["type"].asString());
    if (!type) return std::nullopt;

    WatchEvent event;
    event.type = *type;
    const auto& object = doc["object"];
    if (event.type == WatchEventType::Error) {
        if (object.isObject() && object["code"].isInt()) {
            event.error_code = object["code"].asInt();
        }
        return event;
    }

    event.name = metadata_field(object, "name");
    event.resource_version = metadata_field(object, "resourceVersion");
    return event;
}

Result<WorkloadList> parse_workload_list(const Json::Value& doc) {
    if (!doc.isObject() || !doc["items"].isArray()) {
        return Error{ErrorCode::Parse, "Pod list has no items"};
    }

    WorkloadList list;
    list.resource_version = metadata_field(doc, "resourceVersion");
    for (const auto& item : doc["items"]) {
        auto name = metadata_field(item, "name");
        if (!name.empty()) list.names.push_back(std::move(name));
    }
    return list;
}

// ─────────────────────────────────────────────
// KubeClusterClient
// ─────────────────────────────────────────────

KubeClusterClient::KubeClusterClient(Endpoint endpoint,
                                     std::string label_selector,
                                     std::chrono::milliseconds timeout)
    : client_(std::move(endpoint), timeout)
    , label_selector_(std::move(label_selector)) {}

std::string KubeClusterClient::pods_path(const std::string& namespace_name) const {
    return "/api/v1/namespaces/" + url_encode(namespace_name) + "/pods";
}

Result<WorkloadList> KubeClusterClient::list_workloads(const std::string& namespace_name) {
    auto target = pods_path(namespace_name);
    if (!label_selector_.empty()) target += "?labelSelector=" + url_encode(label_selector_);

    auto response = client_.send(HttpRequest{.method = "GET", .target = target});
    if (!response) return response.error();
    if (!response->ok()) return status_error(*response, "List pods in " + namespace_name);

    auto doc = parse_json(response->body);
    if (!doc) return doc.error();
    return parse_workload_list(*doc);
}

Result<void> KubeClusterClient::watch_workloads(const std::string& namespace_name,
                                                const std::string& resource_version,
                                                const WatchCallback& on_event,
                                                std::stop_token stop) {
    auto target = pods_path(namespace_name) + "?watch=1&allowWatchBookmarks=true";
    if (!resource_version.empty()) target += "&resourceVersion=" + url_encode(resource_version);
    if (!label_selector_.empty()) target += "&labelSelector=" + url_encode(label_selector_);

    LineBuffer lines;
    std::optional<Error> malformed;
    auto result = client_.stream(HttpRequest{.method = "GET", .target = target},
        [&](std::string_view chunk) {
            for (const auto& line : lines.feed(chunk)) {
                auto doc = parse_json(line);
                if (!doc) {
                    malformed = doc.error();
                    return false;
                }
                if (auto event = parse_watch_event(*doc)) on_event(*event);
            }
            return true;
        }, stop);

    if (malformed) return *malformed;
    return result;
}

Result<void> KubeClusterClient::delete_workload(const std::string& name,
                                                const std::string& namespace_name) {
    auto response = client_.send(HttpRequest{
        .method = "DELETE",
        .target = pods_path(namespace_name) + "/" + url_encode(name),
    });
    if (!response) return response.error();
    if (!response->ok()) return status_error(*response, "Delete pod " + name);
    return Result<void>{};
}

}  // namespace spawner
