/**
 * @file bench_run_executor.cpp
 * @brief Overhead benchmarks for the run pipeline and its hot helpers.
 *
 * Measures what the executor adds on top of the measured command: spawn and
 * reap latency, a full execute_run of /bin/true, limiter sampling and
 * result/log rendering.
 *
 * Usage: ./runexec_bench [--csv]
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/process_controller.hpp"
#include "executor/run_executor.hpp"
#include "limiter/limiter.hpp"
#include "limiter/procfs.hpp"
#include "telemetry/log_sinks.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <unistd.h>

using namespace runexec;
using Clock = std::chrono::steady_clock;

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
// Benchmarks
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_rendering() {
    std::vector<BenchResult> results;

    RunResult result;
    result.exit_code = 9;
    result.wall_time = 1.234567;
    result.cpu_time = 1.0;
    result.memory = 123456789;
    result.termination_reason = TerminationReason::CpuTime;

    results.push_back(run_bench("RunResult::to_json", "Rendering", 10000, [&] {
        auto json = result.to_json();
        if (json.empty()) std::abort();
    }));

    const std::string message = "Child 1234 wrote \"quoted\"\ttext\nacross lines";
    results.push_back(run_bench("json_escape (42 chars)", "Rendering", 10000, [&] {
        auto escaped = json_escape(message);
        if (escaped.empty()) std::abort();
    }));

    Logger logger(std::make_unique<NullSink>(), LogLevel::Debug);
    results.push_back(run_bench("Logger::info -> NullSink", "Rendering", 10000, [&] {
        logger.info(message);
    }));

    return results;
}

std::vector<BenchResult> bench_limiter() {
    std::vector<BenchResult> results;
    const pid_t self = ::getpid();

    results.push_back(run_bench("procfs::process_cpu_time(self)", "Limiter", 2000, [&] {
        if (!procfs::process_cpu_time(self)) std::abort();
    }, "CPU timer poll cost"));

    results.push_back(run_bench("procfs::process_peak_rss(self)", "Limiter", 2000, [&] {
        if (!procfs::process_peak_rss(self)) std::abort();
    }));

    return results;
}

std::vector<BenchResult> bench_process() {
    std::vector<BenchResult> results;

    int devnull = ::open("/dev/null", O_WRONLY | O_CLOEXEC);
    if (devnull < 0) {
        std::cerr << "cannot open /dev/null: " << std::strerror(errno) << "\n";
        return results;
    }

    results.push_back(run_bench("spawn + wait /bin/true", "Process", 200, [&] {
        auto controller = ProcessController::spawn({"/bin/true"}, devnull, nullptr,
                                                   std::chrono::milliseconds{1000});
        if (!controller || !(*controller)->wait()) std::abort();
    }));
    ::close(devnull);

    auto output = std::filesystem::temp_directory_path()
                  / ("runexec_bench_" + std::to_string(::getpid()) + ".log");
    RunExecutor executor(RunExecutor::Options{
        .config = default_config(),
        .log_sink = std::make_unique<NullSink>(),
        .log_level = LogLevel::Error,
        .limiter = std::make_unique<ProcfsLimiter>(),
    });
    results.push_back(run_bench("execute_run /bin/true (procfs)", "Process", 100, [&] {
        if (!executor.execute_run({"/bin/true"}, output.string())) std::abort();
    }, "includes output file + drain"));

    std::error_code ec;
    std::filesystem::remove(output, ec);
    return results;
}

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  runexec Overhead Benchmarks\n"
                  << "  " << std::string(40, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_rendering());
    append(bench_limiter());
    append(bench_process());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
