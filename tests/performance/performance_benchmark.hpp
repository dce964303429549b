#pragma once

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

// Timing and reporting helpers for the logguard benchmarks
class PerformanceBenchmark {
public:
    struct BenchmarkResult {
        std::string name;
        size_t operations;
        size_t bytes;
        std::chrono::milliseconds duration;
        double throughput; // operations per second
        double megabytesPerSecond;
        size_t memoryUsage; // bytes
        std::string notes;

        std::string toString() const {
            std::stringstream ss;
            ss << std::left << std::setw(36) << name
               << std::right << std::setw(10) << operations
               << std::setw(8) << duration.count() << "ms"
               << std::setw(12) << std::fixed << std::setprecision(0) << throughput << " ops/sec"
               << std::setw(10) << std::fixed << std::setprecision(2) << megabytesPerSecond << " MB/s"
               << std::setw(10) << (memoryUsage / 1024) << "KB";
            if (!notes.empty()) {
                ss << " (" << notes << ")";
            }
            return ss.str();
        }
    };

    static size_t residentMemory() {
        std::ifstream statm("/proc/self/statm");
        size_t pages = 0;
        size_t resident = 0;
        if (statm >> pages >> resident) {
            return resident * 4096; // Assume 4KB page size
        }
        return 0;
    }

    static void printHeader() {
        std::cout << std::string(100, '=') << "\n";
        std::cout << "logguard Performance Benchmark Suite\n";
        std::cout << std::string(100, '=') << "\n\n";

        std::cout << std::left << std::setw(36) << "Benchmark"
                  << std::right << std::setw(10) << "Operations"
                  << std::setw(10) << "Time"
                  << std::setw(20) << "Throughput"
                  << std::setw(14) << "Bytes"
                  << std::setw(12) << "Memory" << "\n";
        std::cout << std::string(100, '-') << "\n";
    }

    static void printSummary(const std::vector<BenchmarkResult>& results) {
        std::cout << "\n" << std::string(100, '=') << "\n";
        std::cout << "PERFORMANCE SUMMARY\n";
        std::cout << std::string(100, '=') << "\n";

        if (results.empty()) return;

        double minMegabytes = results.front().megabytesPerSecond;
        size_t maxMemory = 0;
        for (const auto& result : results) {
            minMegabytes = std::min(minMegabytes, result.megabytesPerSecond);
            maxMemory = std::max(maxMemory, result.memoryUsage);
        }

        std::cout << "Slowest Throughput: " << std::fixed << std::setprecision(2) << minMegabytes << " MB/s\n";
        std::cout << "Peak Memory Usage: " << (maxMemory / 1024) << " KB\n";

        std::cout << "\nRECOMMENDATIONS:\n";
        if (minMegabytes < 1.0) {
            std::cout << "- Some workloads sanitize below 1 MB/s, profile the pattern rules\n";
        }
        if (maxMemory > 512 * 1024 * 1024) { // 512MB
            std::cout << "- High memory usage detected, check history and quarantine growth\n";
        }
    }
};

// Base class for all performance benchmarks
class BenchmarkBase {
protected:
    std::string name_;
    std::vector<PerformanceBenchmark::BenchmarkResult> results_;

public:
    BenchmarkBase(const std::string& name) : name_(name) {}
    virtual ~BenchmarkBase() = default;

    virtual void run() = 0;
    virtual void printResults() {
        for (const auto& result : results_) {
            std::cout << result.toString() << "\n";
        }
    }

    const std::vector<PerformanceBenchmark::BenchmarkResult>& getResults() const {
        return results_;
    }

    const std::string& getName() const { return name_; }

protected:
    void addResult(const PerformanceBenchmark::BenchmarkResult& result) {
        results_.push_back(result);
    }

    PerformanceBenchmark::BenchmarkResult createResult(
        const std::string& subName,
        size_t operations,
        size_t bytes,
        std::chrono::milliseconds duration,
        const std::string& notes = ""
    ) {
        const double millis = static_cast<double>(std::max<long long>(duration.count(), 1));

        PerformanceBenchmark::BenchmarkResult result;
        result.name = name_ + " - " + subName;
        result.operations = operations;
        result.bytes = bytes;
        result.duration = duration;
        result.throughput = operations * 1000.0 / millis;
        result.megabytesPerSecond = (bytes / (1024.0 * 1024.0)) * 1000.0 / millis;
        result.memoryUsage = PerformanceBenchmark::residentMemory();
        result.notes = notes;
        return result;
    }
};
