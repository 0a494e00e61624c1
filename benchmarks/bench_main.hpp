#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace pml::benchmarks {

struct BenchmarkResult {
    std::string name;
    std::size_t output_bytes; // 单次迭代产生的文本字节数
    int iterations;
    double avg_ms;
    double best_ms;
    double throughput_mbps;
};

class BenchmarkTimer {
public:
    void start() { start_ = std::chrono::steady_clock::now(); }

    void stop() { end_ = std::chrono::steady_clock::now(); }

    [[nodiscard]] double elapsed_ms() const {
        auto duration =
            std::chrono::duration_cast<std::chrono::nanoseconds>(end_ - start_);
        return static_cast<double>(duration.count()) / 1'000'000.0;
    }

private:
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point end_;
};

inline std::vector<BenchmarkResult> &results() {
    static std::vector<BenchmarkResult> results_;
    return results_;
}

template <typename Func>
inline void run_benchmark(std::string_view name,
                          std::size_t output_bytes,
                          int iterations,
                          Func &&func) {
    // 预热一次（首次渲染会初始化组件目录、schema 等静态对象）
    func();

    std::vector<double> timings;
    timings.reserve(static_cast<std::size_t>(iterations));
    for (int i = 0; i < iterations; ++i) {
        BenchmarkTimer timer;
        timer.start();
        func();
        timer.stop();
        timings.push_back(timer.elapsed_ms());
    }

    double total_ms = 0.0;
    for (double t : timings) {
        total_ms += t;
    }
    const double avg_ms = iterations > 0 ? total_ms / iterations : 0.0;
    const double best_ms =
        timings.empty() ? 0.0 : *std::min_element(timings.begin(), timings.end());

    double throughput_mbps = 0.0;
    if (avg_ms > 0.0) {
        double seconds = avg_ms / 1000.0;
        double mb = static_cast<double>(output_bytes) / (1024.0 * 1024.0);
        throughput_mbps = mb / seconds;
    }

    results().push_back(
        {std::string(name), output_bytes, iterations, avg_ms, best_ms, throughput_mbps});
}

inline std::string format_bytes(std::size_t bytes) {
    if (bytes >= 1024 * 1024) {
        return std::to_string(bytes / (1024 * 1024)) + " MB";
    }
    if (bytes >= 1024) {
        return std::to_string(bytes / 1024) + " KB";
    }
    return std::to_string(bytes) + " B";
}

inline void print_results() {
    std::cout << "\n";
    std::cout << std::string(110, '=') << "\n";
    std::cout << "PML RENDER BENCHMARKS\n";
    std::cout << std::string(110, '=') << "\n";
    std::cout << std::left << std::setw(45) << "Benchmark" << std::setw(12)
              << "Output" << std::setw(8) << "Runs" << std::setw(15)
              << "Avg (ms)" << std::setw(15) << "Best (ms)"
              << "Throughput (MB/s)\n";
    std::cout << std::string(110, '-') << "\n";

    for (const auto &result : results()) {
        std::cout << std::left << std::setw(45) << result.name << std::setw(12)
                  << format_bytes(result.output_bytes) << std::setw(8)
                  << result.iterations << std::fixed << std::setprecision(3)
                  << std::setw(15) << result.avg_ms << std::setw(15)
                  << result.best_ms;

        if (result.throughput_mbps > 0.0) {
            std::cout << result.throughput_mbps;
        } else {
            std::cout << "N/A";
        }
        std::cout << "\n";
    }

    std::cout << std::string(110, '=') << "\n\n";
}

} // namespace pml::benchmarks

#define BENCH_RUN(name, bytes, iterations, code)                               \
    ::pml::benchmarks::run_benchmark(name, bytes, iterations, [&]() { code; })
