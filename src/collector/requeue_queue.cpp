/**
 * @file requeue_queue.cpp
 * @brief RequeueQueue implementation.
 * @author Dimitris Kafetzis
 */

#include "collector/requeue_queue.hpp"

namespace spawner {

bool RequeueQueue::schedule(const std::string& name, SteadyTime deadline) {
    auto it = deadlines_.find(name);
    if (it != deadlines_.end()) {
        if (it->second <= deadline) return false;
        ordered_.erase({it->second, name});
        it->second = deadline;
    } else {
        deadlines_.emplace(name, deadline);
    }
    ordered_.emplace(deadline, name);
    return true;
}

bool RequeueQueue::remove(const std::string& name) {
    auto it = deadlines_.find(name);
    if (it == deadlines_.end()) return false;
    ordered_.erase({it->second, name});
    deadlines_.erase(it);
    return true;
}

std::vector<std::string> RequeueQueue::pop_due(SteadyTime now) {
    std::vector<std::string> due;
    while (!ordered_.empty() && ordered_.begin()->first <= now) {
        auto node = ordered_.extract(ordered_.begin());
        deadlines_.erase(node.value().second);
        due.push_back(std::move(node.value().second));
    }
    return due;
}

std::optional<SteadyTime> RequeueQueue::next_deadline() const {
    if (ordered_.empty()) return std::nullopt;
    return ordered_.begin()->first;
}

std::optional<SteadyTime> RequeueQueue::deadline_of(const std::string& name) const {
    auto it = deadlines_.find(name);
    if (it == deadlines_.end()) return std::nullopt;
    return it->second;
}

void RequeueQueue::clear() {
    deadlines_.clear();
    ordered_.clear();
}

}  // namespace spawner
