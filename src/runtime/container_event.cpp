/**
 * @file container_event.cpp
 * @brief Container event vocabulary and classification.
 * @author Dimitris Kafetzis
 */

#include "runtime/container_event.hpp"

#include <array>
#include <utility>

#include <json/json.h>

namespace spawner {

namespace {

using KindName = std::pair<std::string_view, ContainerEventKind>;

// Kept in enum order so to_string() can index directly.
constexpr std::array<KindName, CONTAINER_EVENT_KIND_COUNT> KIND_NAMES{{
    {"attach",        ContainerEventKind::Attach},
    {"commit",        ContainerEventKind::Commit},
    {"copy",          ContainerEventKind::Copy},
    {"create",        ContainerEventKind::Create},
    {"destroy",       ContainerEventKind::Destroy},
    {"detach",        ContainerEventKind::Detach},
    {"die",           ContainerEventKind::Die},
    {"exec_create",   ContainerEventKind::ExecCreate},
    {"exec_detach",   ContainerEventKind::ExecDetach},
    {"exec_die",      ContainerEventKind::ExecDie},
    {"exec_start",    ContainerEventKind::ExecStart},
    {"export",        ContainerEventKind::Export},
    {"health_status", ContainerEventKind::HealthStatus},
    {"kill",          ContainerEventKind::Kill},
    {"oom",           ContainerEventKind::Oom},
    {"pause",         ContainerEventKind::Pause},
    {"rename",        ContainerEventKind::Rename},
    {"resize",        ContainerEventKind::Resize},
    {"restart",       ContainerEventKind::Restart},
    {"start",         ContainerEventKind::Start},
    {"stop",          ContainerEventKind::Stop},
    {"top",           ContainerEventKind::Top},
    {"unpause",       ContainerEventKind::Unpause},
    {"update",        ContainerEventKind::Update},
}};

std::optional<std::string> string_member(const Json::Value& doc, const char* key) {
    if (!doc.isObject()) return std::nullopt;
    const auto& member = doc[key];
    if (!member.isString()) return std::nullopt;
    return member.asString();
}

}  // anonymous namespace

std::string_view to_string(ContainerEventKind kind) noexcept {
    auto index = static_cast<size_t>(kind);
    if (index >= KIND_NAMES.size()) return "unknown";
    return KIND_NAMES[index].first;
}

std::optional<ContainerEventKind> parse_event_kind(std::string_view action) noexcept {
    for (const auto& [name, kind] : KIND_NAMES) {
        if (name == action) return kind;
    }
    return std::nullopt;
}

EventMessage parse_event_message(const Json::Value& doc) {
    EventMessage message;
    message.type = string_member(doc, "Type");
    message.action = string_member(doc, "Action");

    if (doc.isObject() && doc["time"].isIntegral()) {
        message.time = doc["time"].asInt64();
    }

    if (doc.isObject() && doc["Actor"].isObject()) {
        const auto& actor_doc = doc["Actor"];
        EventActor actor;
        actor.id = string_member(actor_doc, "ID").value_or(std::string{});
        if (actor_doc["Attributes"].isObject()) {
            std::map<std::string, std::string> attributes;
            const auto& attrs = actor_doc["Attributes"];
            for (const auto& key : attrs.getMemberNames()) {
                if (attrs[key].isString()) attributes.emplace(key, attrs[key].asString());
            }
            actor.attributes = std::move(attributes);
        }
        message.actor = std::move(actor);
    }
    return message;
}

std::optional<ContainerEvent> classify_event(const EventMessage& message, Logger& logger) {
    if (!message.action) return std::nullopt;
    if (!message.actor) return std::nullopt;
    if (!message.actor->attributes) return std::nullopt;

    auto name = message.actor->attributes->find("name");
    if (name == message.actor->attributes->end()) return std::nullopt;

    auto kind = parse_event_kind(*message.action);
    if (!kind) {
        logger.info("Unhandled container action", {{"action", *message.action}});
        return std::nullopt;
    }

    return ContainerEvent{*kind, name->second};
}

}  // namespace spawner
