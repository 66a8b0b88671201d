/**
 * @file requeue_queue.hpp
 * @brief Deadline queue of resources waiting for their next pass.
 * @author Dimitris Kafetzis
 *
 * At most one pending deadline per resource name; scheduling a resource that
 * is already pending keeps whichever deadline is earlier. Not thread-safe.
 */

#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace spawner {

class RequeueQueue {
public:
    /// @return true if `name` now fires at `deadline`.
    bool schedule(const std::string& name, SteadyTime deadline);

    /// @return true if a pending deadline was dropped.
    bool remove(const std::string& name);

    /// Remove and return every resource whose deadline is at or before `now`, earliest first.
    std::vector<std::string> pop_due(SteadyTime now);

    [[nodiscard]] std::optional<SteadyTime> next_deadline() const;
    [[nodiscard]] std::optional<SteadyTime> deadline_of(const std::string& name) const;

    [[nodiscard]] bool contains(const std::string& name) const { return deadlines_.contains(name); }
    [[nodiscard]] size_t size() const noexcept { return deadlines_.size(); }
    [[nodiscard]] bool empty() const noexcept { return deadlines_.empty(); }

    void clear();

private:
    std::map<std::string, SteadyTime> deadlines_;
    std::set<std::pair<SteadyTime, std::string>> ordered_;
};

}  // namespace spawner
