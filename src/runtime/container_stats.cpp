/**
 * @file container_stats.cpp
 * @brief Stats document decoding.
 * @author Dimitris Kafetzis
 */

#include "runtime/container_stats.hpp"

#include <json/json.h>

namespace spawner {

namespace {

uint64_t u64_member(const Json::Value& obj, const char* key) {
    if (!obj.isObject()) return 0;
    const auto& v = obj[key];
    if (v.isUInt64()) return v.asUInt64();
    if (v.isDouble() && v.asDouble() > 0) return static_cast<uint64_t>(v.asDouble());
    return 0;
}

}  // anonymous namespace

double ContainerStats::cpu_percent() const noexcept {
    if (cpu_total_usage < precpu_total_usage || system_cpu_usage <= precpu_system_usage) {
        return 0.0;
    }
    auto cpu_delta = static_cast<double>(cpu_total_usage - precpu_total_usage);
    auto system_delta = static_cast<double>(system_cpu_usage - precpu_system_usage);
    auto cpus = online_cpus == 0 ? 1u : online_cpus;
    return cpu_delta / system_delta * static_cast<double>(cpus) * 100.0;
}

Result<ContainerStats> parse_container_stats(const Json::Value& doc) {
    if (!doc.isObject() || !doc["cpu_stats"].isObject()) {
        return Error{ErrorCode::Parse, "Stats document has no cpu_stats"};
    }

    ContainerStats stats;
    if (doc["read"].isString()) stats.read = doc["read"].asString();

    const auto& cpu = doc["cpu_stats"];
    stats.cpu_total_usage = u64_member(cpu["cpu_usage"], "total_usage");
    stats.system_cpu_usage = u64_member(cpu, "system_cpu_usage");
    stats.online_cpus = static_cast<uint32_t>(u64_member(cpu, "online_cpus"));
    if (stats.online_cpus == 0 && cpu["cpu_usage"].isObject()
        && cpu["cpu_usage"]["percpu_usage"].isArray()) {
        stats.online_cpus = cpu["cpu_usage"]["percpu_usage"].size();
    }

    const auto& precpu = doc["precpu_stats"];
    if (precpu.isObject()) {
        stats.precpu_total_usage = u64_member(precpu["cpu_usage"], "total_usage");
        stats.precpu_system_usage = u64_member(precpu, "system_cpu_usage");
    }

    const auto& memory = doc["memory_stats"];
    stats.memory_usage_bytes = u64_member(memory, "usage");
    stats.memory_limit_bytes = u64_member(memory, "limit");

    const auto& networks = doc["networks"];
    if (networks.isObject()) {
        for (const auto& name : networks.getMemberNames()) {
            stats.network_rx_bytes += u64_member(networks[name], "rx_bytes");
            stats.network_tx_bytes += u64_member(networks[name], "tx_bytes");
        }
    }

    stats.pids = u64_member(doc["pids_stats"], "current");
    return stats;
}

}  // namespace spawner
