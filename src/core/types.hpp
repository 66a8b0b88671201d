/**
 * @file types.hpp
 * @brief Fundamental types used throughout spawner.
 * @author Dimitris Kafetzis
 *
 * Defines NodeId, WorkloadId and the clock/duration aliases shared by the
 * runtime interface and the idle collector. All types have value semantics.
 */

#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace spawner {

// ─────────────────────────────────────────────
// Clock Aliases
// ─────────────────────────────────────────────

using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using Seconds = std::chrono::seconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

/// Prefix prepended to a workload id to form its cluster resource name.
inline constexpr std::string_view RESOURCE_PREFIX = "spawner-";

/**
 * @brief Opaque identifier of an execution node.
 */
class NodeId {
public:
    constexpr explicit NodeId(uint32_t id) noexcept : id_(id) {}

    [[nodiscard]] constexpr uint32_t id() const noexcept { return id_; }
    [[nodiscard]] constexpr int32_t id_i32() const noexcept { return static_cast<int32_t>(id_); }

    [[nodiscard]] std::string to_string() const { return std::to_string(id_); }

    auto operator<=>(const NodeId&) const = default;

private:
    uint32_t id_;
};

/**
 * @brief Opaque identifier of one running workload (container).
 *
 * The cluster knows a workload by its resource name, which is the id with
 * RESOURCE_PREFIX prepended. to_resource_name() and from_resource_name()
 * are exact inverses.
 */
class WorkloadId {
public:
    explicit WorkloadId(std::string id) : id_(std::move(id)) {}

    [[nodiscard]] const std::string& id() const noexcept { return id_; }

    [[nodiscard]] std::string to_resource_name() const {
        std::string name;
        name.reserve(RESOURCE_PREFIX.size() + id_.size());
        name.append(RESOURCE_PREFIX);
        name.append(id_);
        return name;
    }

    /// Strip RESOURCE_PREFIX; nullopt if the name does not carry it.
    [[nodiscard]] static std::optional<WorkloadId> from_resource_name(std::string_view resource_name) {
        if (!resource_name.starts_with(RESOURCE_PREFIX)) return std::nullopt;
        return WorkloadId{std::string{resource_name.substr(RESOURCE_PREFIX.size())}};
    }

    auto operator<=>(const WorkloadId&) const = default;

private:
    std::string id_;
};

inline std::ostream& operator<<(std::ostream& os, const NodeId& id) {
    return os << id.id();
}

inline std::ostream& operator<<(std::ostream& os, const WorkloadId& id) {
    return os << id.id();
}

}  // namespace spawner

template <>
struct std::hash<spawner::NodeId> {
    size_t operator()(const spawner::NodeId& id) const noexcept {
        return std::hash<uint32_t>{}(id.id());
    }
};

template <>
struct std::hash<spawner::WorkloadId> {
    size_t operator()(const spawner::WorkloadId& id) const noexcept {
        return std::hash<std::string>{}(id.id());
    }
};
