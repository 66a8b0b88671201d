/**
 * @file test_controller.cpp
 * @brief Unit tests for IdleController against in-memory fakes.
 * @author Dimitris Kafetzis
 */

#include "collector/controller.hpp"
#include "support/capture_sink.hpp"
#include "support/fake_cluster.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <functional>
#include <thread>

using namespace spawner;
using spawner::testing::CapturedLogger;
using spawner::testing::CaptureSink;
using spawner::testing::FakeCluster;
using spawner::testing::FakeStatusSource;
using namespace std::chrono_literals;

namespace {

bool wait_until(const std::function<bool()>& condition, std::chrono::milliseconds timeout = 5s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return condition();
}

ControllerOptions test_options() {
    ControllerOptions options;
    options.context = ReconciliationContext{"sessions", 8080, 600, 360};
    options.worker_threads = 2;
    options.watch_retry = 0s;
    return options;
}

/// Seconds from now until `when`, rounded.
int64_t seconds_until(SteadyTime when) {
    return std::chrono::round<std::chrono::seconds>(when - std::chrono::steady_clock::now()).count();
}

}  // namespace

class IdleControllerTest : public ::testing::Test {
protected:
    CapturedLogger log_;
    FakeStatusSource status_;
};

TEST_F(IdleControllerTest, StartFailsWhenInitialListFails) {
    FakeCluster cluster;
    cluster.fail_list = true;

    IdleController controller(test_options(), cluster, status_, log_.logger);
    auto started = controller.start();
    ASSERT_FALSE(started.has_value());
    EXPECT_EQ(started.error().code, ErrorCode::Connection);
    EXPECT_FALSE(controller.running());
}

TEST_F(IdleControllerTest, DeletesExpiredAndRequeuesActive) {
    FakeCluster cluster({"spawner-old", "spawner-busy"});
    status_.set_idle("spawner-old", 700);
    status_.set_idle("spawner-busy", 550);

    IdleController controller(test_options(), cluster, status_, log_.logger);
    ASSERT_TRUE(controller.start().has_value());

    ASSERT_TRUE(wait_until([&] { return controller.stats().passes >= 2; }));
    ASSERT_TRUE(wait_until([&] { return controller.scheduled_at("spawner-busy").has_value(); }));
    // The cluster reports the delete on the watch, which drops the resource.
    ASSERT_TRUE(wait_until([&] { return !controller.is_managed("spawner-old"); }));

    auto deleted = cluster.deleted_names();
    ASSERT_FALSE(deleted.empty());
    for (const auto& name : deleted) EXPECT_EQ(name, "spawner-old");
    EXPECT_GE(controller.stats().deletes, 1u);
    EXPECT_EQ(controller.stats().errors, 0u);
    EXPECT_FALSE(controller.scheduled_at("spawner-old").has_value());
    EXPECT_TRUE(log_.contains(R"("workload":"old")"));

    auto in = seconds_until(*controller.scheduled_at("spawner-busy"));
    EXPECT_GE(in, 48);
    EXPECT_LE(in, 50);

    controller.stop();
    EXPECT_FALSE(controller.running());
}

TEST_F(IdleControllerTest, StatusFailureBacksOffWithoutDelete) {
    FakeCluster cluster({"spawner-flaky"});
    status_.set_failing("spawner-flaky");

    IdleController controller(test_options(), cluster, status_, log_.logger);
    ASSERT_TRUE(controller.start().has_value());

    ASSERT_TRUE(wait_until([&] { return controller.stats().errors == 1; }));
    ASSERT_TRUE(wait_until([&] { return controller.scheduled_at("spawner-flaky").has_value(); }));

    auto in = seconds_until(*controller.scheduled_at("spawner-flaky"));
    EXPECT_GE(in, 358);
    EXPECT_LE(in, 360);
    EXPECT_TRUE(cluster.deleted_names().empty());
    EXPECT_TRUE(log_.contains("status_check_failed"));
}

TEST_F(IdleControllerTest, AddedWorkloadIsReconciled) {
    FakeCluster cluster;
    status_.set_idle("spawner-new", 10);

    IdleController controller(test_options(), cluster, status_, log_.logger);
    ASSERT_TRUE(controller.start().has_value());

    cluster.push_event(WatchEvent{WatchEventType::Added, "spawner-new", "", 0});

    ASSERT_TRUE(wait_until([&] { return controller.stats().passes == 1; }));
    ASSERT_TRUE(wait_until([&] { return controller.scheduled_at("spawner-new").has_value(); }));
    EXPECT_TRUE(controller.is_managed("spawner-new"));
    EXPECT_GE(seconds_until(*controller.scheduled_at("spawner-new")), 588);
}

TEST_F(IdleControllerTest, DeletedWorkloadDropsTimer) {
    FakeCluster cluster({"spawner-b"});
    status_.set_idle("spawner-b", 100);

    IdleController controller(test_options(), cluster, status_, log_.logger);
    ASSERT_TRUE(controller.start().has_value());
    ASSERT_TRUE(wait_until([&] { return controller.scheduled_at("spawner-b").has_value(); }));

    cluster.push_event(WatchEvent{WatchEventType::Deleted, "spawner-b", "", 0});

    ASSERT_TRUE(wait_until([&] { return !controller.is_managed("spawner-b"); }));
    EXPECT_FALSE(controller.scheduled_at("spawner-b").has_value());
    EXPECT_EQ(controller.stats().passes, 1u);
}

TEST_F(IdleControllerTest, TriggerRunsAnotherPass) {
    FakeCluster cluster({"spawner-b"});
    status_.set_idle("spawner-b", 100);

    IdleController controller(test_options(), cluster, status_, log_.logger);
    ASSERT_TRUE(controller.start().has_value());
    ASSERT_TRUE(wait_until([&] { return controller.scheduled_at("spawner-b").has_value(); }));

    status_.set_idle("spawner-b", 650);
    controller.trigger("spawner-b");

    ASSERT_TRUE(wait_until([&] { return controller.stats().deletes >= 1; }));
    ASSERT_TRUE(wait_until([&] { return !controller.is_managed("spawner-b"); }));
    auto passes = controller.stats().passes;
    EXPECT_GE(passes, 2u);

    controller.trigger("spawner-unknown");
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(controller.stats().passes, passes);
}

TEST_F(IdleControllerTest, DeletedResourceIsRequeuedImmediately) {
    FakeCluster cluster({"spawner-old"});
    cluster.announce_deletes = false;
    status_.set_idle("spawner-old", 610);

    IdleController controller(test_options(), cluster, status_, log_.logger);
    ASSERT_TRUE(controller.start().has_value());

    // 610s idle against a 600s limit: delete, then requeue at the 0s floor.
    ASSERT_TRUE(wait_until([&] { return controller.stats().passes >= 2; }));
    EXPECT_TRUE(controller.is_managed("spawner-old"));
    EXPECT_GE(controller.stats().deletes, 1u);
    EXPECT_EQ(cluster.deleted_names().at(0), "spawner-old");
    EXPECT_TRUE(log_.contains(R"("requeue_after_s":"0")"));

    // Until the watch reports it gone, the resource keeps being checked.
    status_.set_failing("spawner-old");
    ASSERT_TRUE(wait_until([&] { return controller.stats().errors >= 1; }));
    ASSERT_TRUE(wait_until([&] { return controller.scheduled_at("spawner-old").has_value(); }));
    EXPECT_GE(seconds_until(*controller.scheduled_at("spawner-old")), 300);

    controller.stop();
}

TEST_F(IdleControllerTest, StopLetsInFlightPassFinish) {
    FakeCluster cluster({"spawner-x"});
    status_.set_idle("spawner-x", 900);
    status_.hold();

    IdleController controller(test_options(), cluster, status_, log_.logger);
    ASSERT_TRUE(controller.start().has_value());
    ASSERT_TRUE(wait_until([&] { return status_.waiting() == 1; }));

    std::jthread stopper([&] { controller.stop(); });
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(controller.stats().passes, 0u);

    status_.release();
    stopper.join();

    EXPECT_FALSE(controller.running());
    EXPECT_EQ(cluster.deleted_names(), (std::vector<std::string>{"spawner-x"}));
    EXPECT_EQ(controller.stats().passes, 1u);
    EXPECT_EQ(controller.stats().deletes, 1u);
}

TEST_F(IdleControllerTest, EndedWatchRelists) {
    FakeCluster cluster({"spawner-b"});
    status_.set_idle("spawner-b", 100);

    IdleController controller(test_options(), cluster, status_, log_.logger);
    ASSERT_TRUE(controller.start().has_value());
    ASSERT_TRUE(wait_until([&] { return controller.scheduled_at("spawner-b").has_value(); }));

    cluster.end_watch();

    ASSERT_TRUE(wait_until([&] { return cluster.list_count() >= 2; }));
    // The re-list schedules an immediate pass for every listed workload.
    ASSERT_TRUE(wait_until([&] { return controller.stats().passes >= 2; }));
}

TEST_F(IdleControllerTest, PassesAreRecordedAsTelemetry) {
    auto metrics_lines = std::make_shared<CaptureSink::Lines>();
    MetricsCollector metrics(std::make_unique<CaptureSink>(metrics_lines));

    FakeCluster cluster({"spawner-a", "spawner-b"});
    status_.set_idle("spawner-a", 30);
    status_.set_failing("spawner-b");

    IdleController controller(test_options(), cluster, status_, log_.logger, &metrics);
    ASSERT_TRUE(controller.start().has_value());
    ASSERT_TRUE(wait_until([&] { return controller.stats().passes >= 2; }));
    controller.stop();

    std::lock_guard lock(metrics_lines->mutex);
    ASSERT_EQ(metrics_lines->lines.size(), 2u);
    bool saw_reconcile = false;
    bool saw_error = false;
    for (const auto& line : metrics_lines->lines) {
        if (line.find(R"("event":"reconcile")") != std::string::npos) {
            saw_reconcile = true;
            EXPECT_NE(line.find(R"("ttl":570)"), std::string::npos) << line;
        }
        if (line.find(R"("event":"reconcile_error")") != std::string::npos) {
            saw_error = true;
            EXPECT_NE(line.find(R"("backoff_s":360)"), std::string::npos) << line;
        }
    }
    EXPECT_TRUE(saw_reconcile);
    EXPECT_TRUE(saw_error);
}

TEST_F(IdleControllerTest, StatusUsesNamespaceAndPort) {
    FakeCluster cluster({"spawner-a"});
    status_.set_idle("spawner-a", 1);

    IdleController controller(test_options(), cluster, status_, log_.logger);
    ASSERT_TRUE(controller.start().has_value());
    ASSERT_TRUE(wait_until([&] { return status_.call_count() >= 1; }));
    controller.stop();

    EXPECT_EQ(status_.calls.at(0), "spawner-a.sessions:8080");
}
