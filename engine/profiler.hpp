/**
 * @file profiler.hpp
 * @brief Timing and counting instrumentation for render statistics
 *
 * Thread-safe timers and counters used by the renderer to report where
 * time goes. Scope macros are compiled in with LUMEN_ENABLE_PROFILING.
 */

#pragma once

#include <chrono>
#include <string>
#include <map>
#include <atomic>
#include <mutex>
#include <iostream>
#include <iomanip>
#include <vector>
#include <algorithm>
#include <cstdint>

namespace lumen {

/**
 * @brief Per-category timer and counter registry
 *
 * Usage:
 *   Profiler::instance().record("Render Pass", duration);
 *   Profiler::instance().count("Camera Rays", n);
 *
 * Or use RAII:
 *   { ProfileScope scope("category"); ... }
 */
class Profiler {
public:
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::duration<double, std::milli>;

    struct Stats {
        std::atomic<uint64_t> total_ns{0};
        std::atomic<uint64_t> call_count{0};
    };

    static Profiler& instance() {
        static Profiler inst;
        return inst;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        timers_.clear();
        counters_.clear();
    }

    void set_enabled(bool enabled) { enabled_.store(enabled, std::memory_order_relaxed); }
    bool is_enabled() const { return enabled_.load(std::memory_order_relaxed); }

    /**
     * @brief Record a timing manually (thread-safe)
     */
    void record(const std::string& category, Duration duration) {
        if (!is_enabled()) return;

        auto ns = static_cast<uint64_t>(duration.count() * 1e6);
        Stats& stats = timer(category);
        stats.total_ns.fetch_add(ns, std::memory_order_relaxed);
        stats.call_count.fetch_add(1, std::memory_order_relaxed);
    }

    /**
     * @brief Add to a named event counter (thread-safe)
     */
    void count(const std::string& category, uint64_t n = 1) {
        if (!is_enabled()) return;
        counter(category).fetch_add(n, std::memory_order_relaxed);
    }

    uint64_t counter_value(const std::string& category) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counters_.find(category);
        return it == counters_.end() ? 0 : it->second.load();
    }

    double total_ms(const std::string& category) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = timers_.find(category);
        return it == timers_.end() ? 0.0 : it->second.total_ns.load() / 1e6;
    }

    /**
     * @brief Print timers sorted by total time, then counters
     */
    void report() const {
        std::lock_guard<std::mutex> lock(mutex_);

        if (timers_.empty() && counters_.empty()) {
            std::cout << "Profiler: No data collected.\n";
            return;
        }

        std::vector<std::pair<std::string, const Stats*>> sorted;
        for (const auto& [name, stats] : timers_) {
            sorted.emplace_back(name, &stats);
        }
        std::sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
            return a.second->total_ns.load() > b.second->total_ns.load();
        });

        uint64_t grand_total_ns = 0;
        for (const auto& [name, stats] : sorted) {
            grand_total_ns += stats->total_ns.load();
        }

        std::cout << "\n===== RENDER PROFILE =====\n";
        std::cout << std::left << std::setw(25) << "Category"
                  << std::right << std::setw(12) << "Total (ms)"
                  << std::setw(10) << "Calls"
                  << std::setw(12) << "Avg (us)"
                  << std::setw(8) << "%" << "\n";
        std::cout << std::string(67, '-') << "\n";

        for (const auto& [name, stats] : sorted) {
            uint64_t total_ns = stats->total_ns.load();
            uint64_t calls = stats->call_count.load();
            double avg_us = calls > 0 ? (total_ns / 1e3) / calls : 0.0;
            double pct = grand_total_ns > 0 ? (100.0 * total_ns / grand_total_ns) : 0.0;

            std::cout << std::left << std::setw(25) << name
                      << std::right << std::fixed << std::setprecision(1)
                      << std::setw(12) << total_ns / 1e6
                      << std::setw(10) << calls
                      << std::setprecision(2) << std::setw(12) << avg_us
                      << std::setprecision(1) << std::setw(7) << pct << "%\n";
        }

        if (!counters_.empty()) {
            std::cout << std::string(67, '-') << "\n";
            for (const auto& [name, value] : counters_) {
                std::cout << std::left << std::setw(25) << name
                          << std::right << std::setw(22) << value.load() << "\n";
            }
        }

        std::cout << std::string(67, '-') << "\n";
        std::cout << "Grand total: " << std::fixed << std::setprecision(1)
                  << (grand_total_ns / 1e6) << " ms\n";
        std::cout << "==========================\n\n";
    }

private:
    Profiler() = default;
    Profiler(const Profiler&) = delete;
    Profiler& operator=(const Profiler&) = delete;

    // std::map nodes are stable, so references survive later insertions
    Stats& timer(const std::string& category) {
        std::lock_guard<std::mutex> lock(mutex_);
        return timers_[category];
    }

    std::atomic<uint64_t>& counter(const std::string& category) {
        std::lock_guard<std::mutex> lock(mutex_);
        return counters_[category];
    }

    mutable std::mutex mutex_;
    std::map<std::string, Stats> timers_;
    std::map<std::string, std::atomic<uint64_t>> counters_;
    std::atomic<bool> enabled_{true};
};

/**
 * @brief RAII scope timer
 */
class ProfileScope {
public:
    explicit ProfileScope(const std::string& category)
        : category_(category), start_(Profiler::Clock::now()) {}

    ~ProfileScope() {
        Profiler::Duration duration = Profiler::Clock::now() - start_;
        Profiler::instance().record(category_, duration);
    }

private:
    std::string category_;
    Profiler::Clock::time_point start_;
};

/**
 * @brief Simple one-shot timer for larger sections
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;

    Timer() : start_(Clock::now()) {}

    void reset() { start_ = Clock::now(); }

    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

    double elapsed_sec() const {
        return elapsed_ms() / 1000.0;
    }

private:
    Clock::time_point start_;
};

#define LUMEN_PROFILE_CONCAT_INNER(a, b) a##b
#define LUMEN_PROFILE_CONCAT(a, b) LUMEN_PROFILE_CONCAT_INNER(a, b)

#ifdef LUMEN_ENABLE_PROFILING
    #define LUMEN_PROFILE_SCOPE(name) lumen::ProfileScope LUMEN_PROFILE_CONCAT(_profile_, __LINE__)(name)
    #define LUMEN_PROFILE_FUNCTION() lumen::ProfileScope _profile_func_(__func__)
#else
    #define LUMEN_PROFILE_SCOPE(name) ((void)0)
    #define LUMEN_PROFILE_FUNCTION() ((void)0)
#endif

} // namespace lumen
