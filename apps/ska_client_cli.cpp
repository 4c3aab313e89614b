/*
 * Part of the SharedKey Auth (SKA) project.
 *
 * SPDX-FileCopyrightText: 2025 SKA contributors
 * SPDX-License-Identifier: Apache-2.0
 *
 * This file is part of SharedKey Auth (SKA). See LICENSE for details.
 */

#include "ska/client.hpp"
#include "ska/http_response.hpp"

#include <iostream>
#include <string>
#include <vector>
#include <thread>
#include <mutex>
#include <atomic>
#include <chrono>
#include <algorithm>
#include <numeric>
#include <iomanip>
#include <stdexcept>

static void usage(const char* argv0){
    std::cerr <<
      "Usage:\n"
      "  " << argv0 << " --host 127.0.0.1 --port 8080 "
      "--account device-001 --key HEX [--method GET|POST] [--path /echo] "
      "[--query k=v]... [--data STRING]\n"
      "  [--scheme SharedKey] [--ts_header X-SKA-Date] [--content_type application/json]\n"
      "\n"
      "Timeouts:\n"
      "  --connect_timeout <sec>   TCP connect timeout in seconds (default 2)\n"
      "  --io_timeout <sec>        per-op I/O timeout in seconds (default 2)\n"
      "\n"
      "Benchmark mode (continuous requests for a fixed duration):\n"
      "  " << argv0 << " ... --bench 1 --duration 3 --concurrency 1\n"
      "    --bench         0|1   enable benchmark mode (default 0)\n"
      "    --duration      int   duration in seconds (default 3)\n"
      "    --concurrency   int   number of worker threads (default 1)\n";
}

struct BenchStats {
    std::atomic<uint64_t> sent{0};
    std::atomic<uint64_t> success{0};
    std::atomic<uint64_t> failed{0};
    std::mutex mtx;
    std::vector<double> lat_ms; // per-request latency in milliseconds

    void add_latency(double ms) {
        std::lock_guard<std::mutex> lk(mtx);
        lat_ms.push_back(ms);
    }
};

// Percentile from a sorted vector (0..100), linear interpolation.
static double percentile_sorted(const std::vector<double>& v, double p) {
    if (v.empty()) return 0.0;
    if (p <= 0.0) return v.front();
    if (p >= 100.0) return v.back();
    const double idx = (p/100.0) * (static_cast<double>(v.size() - 1));
    const size_t i = static_cast<size_t>(idx);
    const double frac = idx - static_cast<double>(i);
    if (i + 1 < v.size()) return v[i] + (v[i+1] - v[i]) * frac;
    return v[i];
}

int main(int argc, char** argv){
    ska::ClientConfig cfg;
    cfg.account = "device-001";
    cfg.connect_timeout_sec = 2;
    cfg.io_timeout_sec      = 2;
    cfg.log_file.clear();

    std::string method = "POST";
    std::string path = "/echo";
    std::string data = "hello";
    ska::internal::QueryParams query;

    bool bench = false;
    int duration_sec = 3;
    int concurrency = 1;

    try {
        for(int i=1;i<argc;++i){
            std::string a=argv[i];
            if(a=="--host" && i+1<argc) cfg.host = argv[++i];
            else if(a=="--port" && i+1<argc) cfg.port = (uint16_t)std::stoi(argv[++i]);
            else if(a=="--account" && i+1<argc) cfg.account = argv[++i];
            else if(a=="--key" && i+1<argc) cfg.secret_hex = argv[++i];
            else if(a=="--scheme" && i+1<argc) cfg.scheme = argv[++i];
            else if(a=="--ts_header" && i+1<argc) cfg.timestamp_header = argv[++i];
            else if(a=="--content_type" && i+1<argc) cfg.content_type = argv[++i];
            else if(a=="--log_file" && i+1<argc) cfg.log_file = argv[++i];
            else if(a=="--method" && i+1<argc) method = argv[++i];
            else if(a=="--path" && i+1<argc) path = argv[++i];
            else if(a=="--data" && i+1<argc) data = argv[++i];
            else if(a=="--query" && i+1<argc) {
                const std::string kv = argv[++i];
                const std::size_t eq = kv.find('=');
                if (eq == std::string::npos) query.emplace_back(kv, "");
                else query.emplace_back(kv.substr(0, eq), kv.substr(eq + 1));
            }
            else if(a=="--bench" && i+1<argc) bench = (std::stoi(argv[++i])!=0);
            else if(a=="--duration" && i+1<argc) duration_sec = std::max(1, std::stoi(argv[++i]));
            else if(a=="--concurrency" && i+1<argc) concurrency = std::max(1, std::stoi(argv[++i]));
            else if(a=="--connect_timeout" && i+1<argc) cfg.connect_timeout_sec = std::max(1, std::stoi(argv[++i]));
            else if(a=="--io_timeout" && i+1<argc)      cfg.io_timeout_sec      = std::max(1, std::stoi(argv[++i]));
            else { usage(argv[0]); return 2; }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Bad numeric flag value: " << e.what() << "\n";
        usage(argv[0]);
        return 2;
    }

    if (method != "GET" && method != "POST") { usage(argv[0]); return 2; }
    if (method == "GET") data.clear();

    if (!bench) {
        try {
            ska::Client cli(cfg);
            ska::HttpResponse resp;
            if(!cli.request(method, path, query, data, resp)){
                std::cerr<<"request() failed\n";
                return 1;
            }
            std::cout<<"HTTP "<<resp.status_code<<" "<<resp.status_text<<"\n";
            for (auto& kv: resp.headers){
                std::cout<<kv.first<<": "<<kv.second<<"\n";
            }
            std::cout<<"\n"<<resp.body<<"\n";
            return resp.status_code == 200 ? 0 : 1;
        } catch (const std::invalid_argument& e) {
            std::cerr<<"Bad credentials: "<<e.what()<<"\n";
            return 2;
        }
    }

    // === Benchmark mode ===
    // Each worker thread holds its own ska::Client instance.
    try {
        ska::Client probe(cfg);
    } catch (const std::invalid_argument& e) {
        std::cerr<<"Bad credentials: "<<e.what()<<"\n";
        return 2;
    }

    BenchStats stats;
    std::atomic<bool> stop{false};

    const auto t_start_wall = std::chrono::steady_clock::now();
    const auto t_end_wall   = t_start_wall + std::chrono::seconds(duration_sec);

    auto worker = [&](){
        ska::Client cli(cfg);
        for (;;) {
            // check deadline BEFORE starting another request
            if (stop.load(std::memory_order_relaxed)) break;
            const auto t0 = std::chrono::steady_clock::now();
            if (t0 >= t_end_wall) break;

            ska::HttpResponse resp;
            const bool ok = cli.request(method, path, query, data, resp);
            const auto t1 = std::chrono::steady_clock::now();

            stats.sent.fetch_add(1, std::memory_order_relaxed);
            if (ok && resp.status_code == 200) {
                stats.success.fetch_add(1, std::memory_order_relaxed);
                const double ms = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count() / 1000.0;
                stats.add_latency(ms);
            } else {
                stats.failed.fetch_add(1, std::memory_order_relaxed);
            }
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(static_cast<size_t>(concurrency));
    for (int i = 0; i < concurrency; ++i) {
        threads.emplace_back(worker);
    }

    std::this_thread::sleep_until(t_end_wall);
    stop.store(true, std::memory_order_relaxed);
    for (auto& th : threads) th.join();

    const auto t_stop_wall = std::chrono::steady_clock::now();
    const double wall_sec = std::chrono::duration_cast<std::chrono::microseconds>(t_stop_wall - t_start_wall).count() / 1e6;

    std::vector<double> v;
    {
        std::lock_guard<std::mutex> lk(stats.mtx);
        v = std::move(stats.lat_ms);
    }
    std::sort(v.begin(), v.end());

    const uint64_t sent    = stats.sent.load(std::memory_order_relaxed);
    const uint64_t success = stats.success.load(std::memory_order_relaxed);
    const uint64_t failed  = stats.failed.load(std::memory_order_relaxed);
    const double rps = (wall_sec > 0.0) ? (static_cast<double>(success) / wall_sec) : 0.0;

    double mn = 0.0, mx = 0.0, avg = 0.0;
    if (!v.empty()) {
        mn = v.front();
        mx = v.back();
        avg = std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
    }

    std::cout << "=== SKA benchmark results ===\n";
    std::cout << "duration: " << std::fixed << std::setprecision(3) << wall_sec << " s\n";
    std::cout << "concurrency: " << concurrency << "\n";
    std::cout << "sent:     " << sent    << "\n";
    std::cout << "success:  " << success << "\n";
    std::cout << "errors:   " << failed  << "\n";
    std::cout << "RPS:      " << std::fixed << std::setprecision(2) << rps << " req/s\n";
    std::cout << "latency (ms):\n";
    std::cout << "  min: " << std::fixed << std::setprecision(3) << mn
              << "  avg: " << avg
              << "  p50: " << percentile_sorted(v, 50.0)
              << "  p90: " << percentile_sorted(v, 90.0)
              << "  p99: " << percentile_sorted(v, 99.0)
              << "  max: " << mx << "\n";
    return 0;
}
