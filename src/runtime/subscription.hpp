/**
 * @file subscription.hpp
 * @brief Handle to a live runtime stream (events, logs, stats).
 * @author Dimitris Kafetzis
 *
 * Each stream runs on its own std::jthread that owns the HTTP connection.
 * Cancelling or destroying the Subscription stops that thread, which closes
 * the connection; other streams are unaffected.
 */

#pragma once

#include "core/result.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <stop_token>
#include <thread>
#include <utility>

namespace spawner {

/// Called once when a stream ends: success for a clean close or cancellation.
using StreamClosedCallback = std::function<void(const Result<void>&)>;

class Subscription {
public:
    Subscription() = default;

    /**
     * @brief Run `body(stop_token)` on a dedicated thread.
     */
    template <typename Body>
    static Subscription spawn(Body body) {
        auto active = std::make_shared<std::atomic<bool>>(true);
        std::jthread worker([active, body = std::move(body)](std::stop_token stop) mutable {
            body(stop);
            active->store(false);
        });
        return Subscription{std::move(worker), std::move(active)};
    }

    Subscription(Subscription&&) noexcept = default;
    Subscription& operator=(Subscription&& other) noexcept;
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    ~Subscription();

    /// Stop the stream and wait for its thread (unless called from that thread).
    void cancel();

    /// False once the stream has ended or been cancelled.
    [[nodiscard]] bool active() const noexcept;

private:
    Subscription(std::jthread worker, std::shared_ptr<std::atomic<bool>> active)
        : worker_(std::move(worker)), active_(std::move(active)) {}

    std::jthread worker_;
    std::shared_ptr<std::atomic<bool>> active_;
};

}  // namespace spawner
