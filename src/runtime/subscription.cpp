/**
 * @file subscription.cpp
 * @brief Subscription lifetime management.
 * @author Dimitris Kafetzis
 */

#include "runtime/subscription.hpp"

namespace spawner {

Subscription& Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        cancel();
        worker_ = std::move(other.worker_);
        active_ = std::move(other.active_);
    }
    return *this;
}

Subscription::~Subscription() {
    cancel();
}

void Subscription::cancel() {
    if (!worker_.joinable()) return;
    worker_.request_stop();
    if (worker_.get_id() == std::this_thread::get_id()) {
        worker_.detach();
        return;
    }
    worker_.join();
}

bool Subscription::active() const noexcept {
    return active_ && active_->load();
}

}  // namespace spawner
