/**
 * @file container_event.hpp
 * @brief Typed container lifecycle events and the raw-event classifier.
 * @author Dimitris Kafetzis
 *
 * The runtime reports events as loosely-typed documents. classify_event()
 * maps them onto the closed ContainerEventKind vocabulary; anything it cannot
 * map is dropped (and logged), never surfaced as an error.
 */

#pragma once

#include "core/logger.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace Json {
class Value;
}

namespace spawner {

/**
 * @brief Every container action the runtime can report.
 *
 * Matches the Docker Engine "container" event actions.
 */
enum class ContainerEventKind : uint8_t {
    Attach,
    Commit,
    Copy,
    Create,
    Destroy,
    Detach,
    Die,
    ExecCreate,
    ExecDetach,
    ExecDie,
    ExecStart,
    Export,
    HealthStatus,
    Kill,
    Oom,
    Pause,
    Rename,
    Resize,
    Restart,
    Start,
    Stop,
    Top,
    Unpause,
    Update
};

inline constexpr size_t CONTAINER_EVENT_KIND_COUNT = 24;

/// Wire spelling of a kind ("exec_create", "health_status", ...).
[[nodiscard]] std::string_view to_string(ContainerEventKind kind) noexcept;

/**
 * @brief Exact, case-sensitive lookup of an action string.
 *
 * @return nullopt for anything outside the vocabulary.
 */
[[nodiscard]] std::optional<ContainerEventKind> parse_event_kind(std::string_view action) noexcept;

// ─────────────────────────────────────────────
// Raw runtime event
// ─────────────────────────────────────────────

struct EventActor {
    std::string id;
    std::optional<std::map<std::string, std::string>> attributes;
};

/**
 * @brief Raw event as received from the runtime's event stream.
 *
 * Every field the runtime may omit is optional.
 */
struct EventMessage {
    std::optional<std::string> type;
    std::optional<std::string> action;
    std::optional<EventActor> actor;
    std::optional<int64_t> time;
};

/**
 * @brief Decode one event document ({"Type":..,"Action":..,"Actor":{..}}).
 *
 * Missing or mistyped members are left empty; this never fails.
 */
EventMessage parse_event_message(const Json::Value& doc);

// ─────────────────────────────────────────────
// Classified event
// ─────────────────────────────────────────────

struct ContainerEvent {
    ContainerEventKind kind;
    std::string workload_name;

    bool operator==(const ContainerEvent&) const = default;
};

/**
 * @brief Classify a raw event.
 *
 * Checks, in order: action present, actor present, actor "name" attribute
 * present, action in vocabulary. An unknown action is logged at info level.
 */
std::optional<ContainerEvent> classify_event(const EventMessage& message, Logger& logger);

}  // namespace spawner
