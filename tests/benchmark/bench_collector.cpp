/**
 * @file bench_collector.cpp
 * @brief Micro-benchmarks for the hot paths of the runtime client and idle collector.
 * @author Dimitris Kafetzis
 *
 * Measures event classification, stream decoding, requeue bookkeeping and
 * reconcile pass overhead with in-memory cluster and status backends.
 *
 * Usage: ./bench_spawner [--csv]
 */

#include "collector/cluster_client.hpp"
#include "collector/reconciler.hpp"
#include "collector/requeue_queue.hpp"
#include "collector/workload_status.hpp"
#include "core/logger.hpp"
#include "executor/thread_pool.hpp"
#include "network/http.hpp"
#include "network/json_codec.hpp"
#include "runtime/container_event.hpp"
#include "runtime/log_output.hpp"
#include "telemetry/json_sink.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <future>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <thread>
#include <vector>

using namespace spawner;
using Clock = std::chrono::high_resolution_clock;

// ─────────────────────────────────────────────
// Benchmark Harness
// ─────────────────────────────────────────────

struct BenchResult {
    std::string name;
    std::string category;
    double mean_us;
    double stddev_us;
    double min_us;
    double max_us;
    double p99_us;
    size_t iterations;
    std::string extra;
};

template <typename Fn>
BenchResult run_bench(const std::string& name,
                      const std::string& category,
                      size_t iterations,
                      Fn&& fn,
                      const std::string& extra = "") {
    std::vector<double> timings;
    timings.reserve(iterations);

    // Warmup
    for (size_t i = 0; i < std::min(iterations / 10, size_t{5}); ++i) fn();

    for (size_t i = 0; i < iterations; ++i) {
        auto start = Clock::now();
        fn();
        auto end = Clock::now();
        timings.push_back(std::chrono::duration<double, std::micro>(end - start).count());
    }

    std::sort(timings.begin(), timings.end());

    double sum = std::accumulate(timings.begin(), timings.end(), 0.0);
    double mean = sum / static_cast<double>(iterations);
    double sq_sum = std::accumulate(timings.begin(), timings.end(), 0.0,
        [mean](double acc, double v) { return acc + (v - mean) * (v - mean); });
    double stddev = std::sqrt(sq_sum / static_cast<double>(iterations));

    size_t p99_idx = std::min(static_cast<size_t>(0.99 * static_cast<double>(iterations)),
                              iterations - 1);

    return BenchResult{
        .name = name, .category = category,
        .mean_us = mean, .stddev_us = stddev,
        .min_us = timings.front(), .max_us = timings.back(),
        .p99_us = timings[p99_idx], .iterations = iterations, .extra = extra
    };
}

void print_results(const std::vector<BenchResult>& results, bool csv) {
    if (csv) {
        std::cout << "category,name,mean_us,stddev_us,min_us,max_us,p99_us,iterations,extra\n";
        for (const auto& r : results) {
            std::cout << r.category << "," << r.name << ","
                      << std::fixed << std::setprecision(2)
                      << r.mean_us << "," << r.stddev_us << ","
                      << r.min_us << "," << r.max_us << "," << r.p99_us << ","
                      << r.iterations << "," << r.extra << "\n";
        }
        return;
    }

    std::string current_cat;
    for (const auto& r : results) {
        if (r.category != current_cat) {
            current_cat = r.category;
            std::cout << "\n══ " << current_cat << " ══\n";
            std::cout << std::left << std::setw(42) << "Benchmark"
                      << std::right << std::setw(11) << "Mean(us)"
                      << std::setw(11) << "Stddev"
                      << std::setw(11) << "P99(us)"
                      << std::setw(11) << "Min(us)"
                      << "  Info\n"
                      << std::string(98, '-') << "\n";
        }
        std::cout << std::left << std::setw(42) << r.name
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(11) << r.mean_us
                  << std::setw(11) << r.stddev_us
                  << std::setw(11) << r.p99_us
                  << std::setw(11) << r.min_us
                  << "  " << r.extra << "\n";
    }
}

// ─────────────────────────────────────────────
// In-memory backends
// ─────────────────────────────────────────────

class StaticStatus : public WorkloadStatusSource {
public:
    explicit StaticStatus(uint32_t seconds_inactive) : idle_{seconds_inactive} {}

    Result<WorkloadIdleState> fetch(const std::string&, const std::string&, uint16_t) override {
        return idle_;
    }

private:
    WorkloadIdleState idle_;
};

class CountingCluster : public ClusterApi {
public:
    Result<WorkloadList> list_workloads(const std::string&) override { return WorkloadList{}; }

    Result<void> watch_workloads(const std::string&, const std::string&,
                                 const WatchCallback&, std::stop_token) override {
        return Result<void>{};
    }

    Result<void> delete_workload(const std::string&, const std::string&) override {
        ++deletes;
        return Result<void>{};
    }

    size_t deletes{0};
};

std::string log_frame(uint8_t stream, std::string_view payload) {
    std::string out(8, '\0');
    out[0] = static_cast<char>(stream);
    auto size = static_cast<uint32_t>(payload.size());
    out[4] = static_cast<char>((size >> 24) & 0xFF);
    out[5] = static_cast<char>((size >> 16) & 0xFF);
    out[6] = static_cast<char>((size >> 8) & 0xFF);
    out[7] = static_cast<char>(size & 0xFF);
    out.append(payload);
    return out;
}

// ─────────────────────────────────────────────
// Suites
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_events() {
    std::vector<BenchResult> R;
    constexpr size_t N = 2000;
    Logger quiet(std::make_unique<NullSink>(), LogLevel::Error);

    const std::string start_event =
        R"({"Type":"container","Action":"start","Actor":{"ID":"abc","Attributes":{"name":"web-1","image":"nginx"}},"time":1700000000})";
    const std::string health_event =
        R"({"Type":"container","Action":"health_status: healthy","Actor":{"ID":"abc","Attributes":{"name":"web-1"}}})";

    R.push_back(run_bench("parse_json(event)", "Events", N,
        [&]{ auto d = parse_json(start_event); (void)d; }, std::to_string(start_event.size()) + " B"));

    auto start_doc = *parse_json(start_event);
    auto health_doc = *parse_json(health_event);
    R.push_back(run_bench("classify(start)", "Events", N,
        [&]{ auto e = classify_event(parse_event_message(start_doc), quiet); (void)e; }));
    R.push_back(run_bench("classify(health_status)", "Events", N,
        [&]{ auto e = classify_event(parse_event_message(health_doc), quiet); (void)e; }));

    const std::string watch =
        R"({"type":"MODIFIED","object":{"kind":"Pod","metadata":{"name":"web-1","resourceVersion":"4711"}}})";
    auto watch_doc = *parse_json(watch);
    R.push_back(run_bench("parse_watch_event", "Events", N,
        [&]{ auto e = parse_watch_event(watch_doc); (void)e; }));

    return R;
}

std::vector<BenchResult> bench_streams() {
    std::vector<BenchResult> R;
    constexpr size_t N = 1000;

    std::string frames;
    for (int i = 0; i < 100; ++i) {
        frames += log_frame(i % 2 ? 2 : 1, "2024-01-01T00:00:00.000000000Z request served in 3ms\n");
    }
    R.push_back(run_bench("log_frames(100)", "Streams", N,
        [&]{ LogFrameDecoder d; auto out = d.feed(frames); (void)out; },
        std::to_string(frames.size()) + " B"));

    std::string ndjson;
    for (int i = 0; i < 100; ++i) ndjson += R"({"status":"Downloading","id":"a1"})" "\n";
    R.push_back(run_bench("line_buffer(100)", "Streams", N,
        [&]{ LineBuffer b; auto out = b.feed(ndjson); (void)out; }));

    return R;
}

std::vector<BenchResult> bench_collector() {
    std::vector<BenchResult> R;
    constexpr size_t N = 500;

    for (size_t n : {100, 1000, 10000}) {
        std::vector<std::string> names;
        for (size_t i = 0; i < n; ++i) names.push_back("workload-" + std::to_string(i));
        auto label = std::to_string(n) + " workloads";

        R.push_back(run_bench("requeue_fill(" + std::to_string(n) + ")", "Collector", n >= 10000 ? 50 : N,
            [&]{
                RequeueQueue q;
                auto now = std::chrono::steady_clock::now();
                for (size_t i = 0; i < names.size(); ++i) {
                    q.schedule(names[i], now + std::chrono::seconds{static_cast<int64_t>(i % 600)});
                }
            }, label));

        R.push_back(run_bench("requeue_drain(" + std::to_string(n) + ")", "Collector", n >= 10000 ? 50 : N,
            [&]{
                RequeueQueue q;
                auto now = std::chrono::steady_clock::now();
                for (const auto& name : names) q.schedule(name, now);
                auto due = q.pop_due(now);
                (void)due;
            }, label));
    }

    ReconciliationContext ctx;
    CountingCluster cluster;
    StaticStatus active(30);
    StaticStatus idle(ctx.cleanup_frequency_seconds + 1);
    R.push_back(run_bench("reconcile(requeue)", "Collector", 5000,
        [&]{ auto r = reconcile("web-1", ctx, active, cluster); (void)r; }));
    R.push_back(run_bench("reconcile(delete)", "Collector", 5000,
        [&]{ auto r = reconcile("web-1", ctx, idle, cluster); (void)r; }));

    ThreadPool pool(4);
    R.push_back(run_bench("threadpool_submit", "Collector", N, [&]{
        std::promise<void> p; auto f = p.get_future();
        pool.submit([&p]{ p.set_value(); }); f.wait();
    }));

    return R;
}

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  spawner Micro-benchmarks\n"
                  << "  " << std::string(40, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_events());
    append(bench_streams());
    append(bench_collector());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
