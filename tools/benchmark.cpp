// Throughput benchmark: compares request/reply round trips with pipelining.
//
// Spins up a tkv::network::Server on an ephemeral port in a background thread,
// then runs N SET+GET cycles (1) one command per round trip and (2) in
// pipelined batches, over the RESP client library.
//
// Prints: total ops, elapsed time, ops/sec, and latency percentiles (p50,
// p90, p99, p999) for each mode. In pipelined mode the latency of a batch is
// spread evenly over its commands.

#include "client/client.hpp"
#include "common/clock.hpp"
#include "common/server_config.hpp"
#include "network/server.hpp"
#include "storage/database.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <numeric>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using clock = std::chrono::high_resolution_clock;
using ns    = std::chrono::nanoseconds;

constexpr const char* kHost = "127.0.0.1";
constexpr std::size_t kBatchSize = 64;

// ── Stats helpers ────────────────────────────────────────────────────────────

struct BenchResult {
    std::size_t total_ops{};
    double elapsed_sec{};
    double ops_per_sec{};
    double p50_us{};
    double p90_us{};
    double p99_us{};
    double p999_us{};
    double avg_us{};
};

BenchResult compute_stats(std::vector<int64_t>& latencies_ns) {
    BenchResult r;
    r.total_ops = latencies_ns.size();

    if (latencies_ns.empty()) return r;

    std::sort(latencies_ns.begin(), latencies_ns.end());

    auto total_ns = std::accumulate(latencies_ns.begin(), latencies_ns.end(), int64_t{0});
    r.elapsed_sec = static_cast<double>(total_ns) / 1e9;
    r.ops_per_sec = static_cast<double>(r.total_ops) / r.elapsed_sec;
    r.avg_us      = static_cast<double>(total_ns) / static_cast<double>(r.total_ops) / 1000.0;

    auto percentile = [&](double p) -> double {
        auto idx = static_cast<std::size_t>(p * static_cast<double>(latencies_ns.size() - 1));
        return static_cast<double>(latencies_ns[idx]) / 1000.0; // ns → µs
    };

    r.p50_us  = percentile(0.50);
    r.p90_us  = percentile(0.90);
    r.p99_us  = percentile(0.99);
    r.p999_us = percentile(0.999);

    return r;
}

void print_result(const char* label, const BenchResult& r) {
    fprintf(stdout,
        "\n── %s ──\n"
        "  Total ops:    %zu\n"
        "  Elapsed:      %.3f s\n"
        "  Throughput:   %.0f ops/sec\n"
        "  Avg latency:  %.1f µs\n"
        "  p50:          %.1f µs\n"
        "  p90:          %.1f µs\n"
        "  p99:          %.1f µs\n"
        "  p99.9:        %.1f µs\n",
        label, r.total_ops, r.elapsed_sec, r.ops_per_sec,
        r.avg_us, r.p50_us, r.p90_us, r.p99_us, r.p999_us);
}

void expect_ok(const tkv::RespValue& reply) {
    if (reply.is_error()) {
        throw std::runtime_error("server replied: " + reply.str);
    }
}

// ── Benchmark runners ────────────────────────────────────────────────────────

BenchResult bench_round_trip(uint16_t port, std::size_t num_cycles) {
    tkv::client::Connection client{kHost, port};
    std::vector<int64_t> latencies;
    latencies.reserve(num_cycles * 2); // SET + GET per cycle

    for (std::size_t i = 0; i < num_cycles; ++i) {
        std::string key = "key" + std::to_string(i);
        std::string val = "val" + std::to_string(i);

        // SET
        {
            auto t0 = clock::now();
            expect_ok(client.command({"SET", key, val}));
            auto t1 = clock::now();
            latencies.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
        }

        // GET
        {
            auto t0 = clock::now();
            expect_ok(client.command({"GET", key}));
            auto t1 = clock::now();
            latencies.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
        }
    }

    return compute_stats(latencies);
}

BenchResult bench_pipelined(uint16_t port, std::size_t num_cycles) {
    tkv::client::Connection client{kHost, port};
    std::vector<int64_t> latencies;
    latencies.reserve(num_cycles * 2);

    for (std::size_t first = 0; first < num_cycles; first += kBatchSize) {
        const std::size_t last = std::min(num_cycles, first + kBatchSize);

        std::vector<std::vector<std::string>> batch;
        batch.reserve((last - first) * 2);
        for (std::size_t i = first; i < last; ++i) {
            std::string key = "pkey" + std::to_string(i);
            batch.push_back({"SET", key, "pval" + std::to_string(i)});
            batch.push_back({"GET", std::move(key)});
        }

        auto t0 = clock::now();
        const auto replies = client.pipeline(batch);
        auto t1 = clock::now();

        for (const auto& reply : replies) expect_ok(reply);
        const auto per_op = std::chrono::duration_cast<ns>(t1 - t0).count() /
                            static_cast<int64_t>(batch.size());
        latencies.insert(latencies.end(), batch.size(), per_op);
    }

    return compute_stats(latencies);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    // Suppress server logs during benchmark.
    spdlog::set_level(spdlog::level::warn);

    std::size_t num_cycles = 10'000;
    if (argc > 1) {
        num_cycles = static_cast<std::size_t>(std::atol(argv[1]));
        if (num_cycles == 0) num_cycles = 10'000;
    }

    // Start server.
    tkv::ServerConfig cfg;
    cfg.host = kHost;
    cfg.port = 0;
    cfg.expiry_sweep_interval_ms = 0;

    tkv::SystemClock system_clock;
    tkv::storage::Database db{system_clock};
    tkv::network::Server server{cfg, db};
    std::thread server_thread{[&] { server.run(); }};

    fprintf(stdout,
        "tkv Benchmark\n"
        "=============\n"
        "Cycles:   %zu (each cycle = 1 SET + 1 GET = 2 ops)\n"
        "Batch:    %zu cycles per pipeline\n"
        "Server:   %s:%u\n",
        num_cycles, kBatchSize, kHost, static_cast<unsigned>(server.port()));

    int status = 0;
    try {
        // Warm up (small batch to prime TCP paths / allocator).
        {
            tkv::client::Connection warmup{kHost, server.port()};
            for (int i = 0; i < 100; ++i) {
                expect_ok(warmup.command({"SET", "warmup" + std::to_string(i), "x"}));
            }
        }

        auto round_trip = bench_round_trip(server.port(), num_cycles);
        auto pipelined  = bench_pipelined(server.port(), num_cycles);

        print_result("Request / reply", round_trip);
        print_result("Pipelined", pipelined);

        // Comparison.
        if (round_trip.ops_per_sec > 0 && pipelined.ops_per_sec > 0) {
            fprintf(stdout,
                "\n── Comparison ──\n"
                "  Pipelined / round-trip throughput ratio: %.2fx\n",
                pipelined.ops_per_sec / round_trip.ops_per_sec);
        }
        fprintf(stdout, "\n");
    } catch (const std::exception& e) {
        fprintf(stderr, "benchmark failed: %s\n", e.what());
        status = 1;
    }

    server.stop();
    if (server_thread.joinable()) {
        server_thread.join();
    }

    return status;
}
