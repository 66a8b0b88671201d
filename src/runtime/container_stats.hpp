/**
 * @file container_stats.hpp
 * @brief Container resource-usage snapshots and emission throttling.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace Json {
class Value;
}

namespace spawner {

/**
 * @brief One resource-usage sample of a container.
 *
 * precpu_* hold the previous sample the runtime measured, so a single
 * snapshot is enough to derive a CPU percentage.
 */
struct ContainerStats {
    std::string read;                       ///< runtime's RFC 3339 sample time
    uint64_t cpu_total_usage{0};            ///< ns
    uint64_t precpu_total_usage{0};
    uint64_t system_cpu_usage{0};           ///< ns
    uint64_t precpu_system_usage{0};
    uint32_t online_cpus{0};
    uint64_t memory_usage_bytes{0};
    uint64_t memory_limit_bytes{0};
    uint64_t network_rx_bytes{0};           ///< summed over interfaces
    uint64_t network_tx_bytes{0};
    uint64_t pids{0};

    /// CPU utilisation across all cores, 100.0 per fully-busy core.
    [[nodiscard]] double cpu_percent() const noexcept;

    [[nodiscard]] double memory_percent() const noexcept {
        if (memory_limit_bytes == 0) return 0.0;
        return 100.0 * static_cast<double>(memory_usage_bytes)
               / static_cast<double>(memory_limit_bytes);
    }
};

/**
 * @brief Decode one stats document from the runtime's stats stream.
 */
Result<ContainerStats> parse_container_stats(const Json::Value& doc);

/**
 * @brief Lets at most one item through per interval.
 *
 * The first item of each window passes; the rest are dropped, so nothing is
 * ever buffered.
 */
class StatsThrottle {
public:
    explicit StatsThrottle(std::chrono::steady_clock::duration interval) : interval_(interval) {}

    /// True if an item arriving at `now` should be emitted.
    bool admit(SteadyTime now) noexcept {
        if (last_emit_ && now - *last_emit_ < interval_) return false;
        last_emit_ = now;
        return true;
    }

    [[nodiscard]] std::chrono::steady_clock::duration interval() const noexcept { return interval_; }

private:
    std::chrono::steady_clock::duration interval_;
    std::optional<SteadyTime> last_emit_;
};

}  // namespace spawner
