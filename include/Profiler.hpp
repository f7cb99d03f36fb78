#ifndef PROFILER_HPP
#define PROFILER_HPP

// ============================================================================
// Profiling Configuration
// ============================================================================
// Define CONNECT4_ENABLE_PROFILING to enable profiling. Defaults to disabled.
// Enable via: cmake -DCONNECT4_ENABLE_PROFILING=ON

#ifdef CONNECT4_ENABLE_PROFILING

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

// ============================================================================
// Profiler - per-section call counts and accumulated time
// ============================================================================
// The engine is single-threaded, so sections are recorded without locking.

class Profiler {
public:
    struct SectionStats {
        uint64_t callCount = 0;
        double totalTimeNs = 0.0;
    };

    static Profiler& instance() {
        static Profiler profiler;
        return profiler;
    }

    void record(const char* section, double durationNs) {
        auto& stats = sections_[section];
        stats.callCount++;
        stats.totalTimeNs += durationNs;
    }

    // Sections sorted by accumulated time. Sections nest (a search contains
    // its evaluations), so times are not summed.
    void printReport() const {
        std::cout << "\n--- Profile (" << sections_.size() << " sections) ---\n";
        if (sections_.empty()) {
            std::cout << "(nothing recorded)\n";
            return;
        }

        std::vector<std::pair<std::string, SectionStats>> rows(sections_.begin(), sections_.end());
        std::sort(rows.begin(), rows.end(), [](const auto& lhs, const auto& rhs) {
            return lhs.second.totalTimeNs > rhs.second.totalTimeNs;
        });

        std::cout << std::left << std::setw(28) << "section" << std::right
                  << std::setw(12) << "ms" << std::setw(12) << "calls"
                  << std::setw(14) << "us/call" << "\n";
        for (const auto& row : rows) {
            const SectionStats& stats = row.second;
            double perCallUs = stats.callCount ? stats.totalTimeNs / stats.callCount / 1e3 : 0.0;
            std::cout << std::left << std::setw(28) << row.first << std::right << std::fixed
                      << std::setw(12) << std::setprecision(2) << stats.totalTimeNs / 1e6
                      << std::setw(12) << stats.callCount
                      << std::setw(14) << std::setprecision(3) << perCallUs << "\n";
        }
        std::cout << std::endl;
    }

private:
    Profiler() = default;
    Profiler(const Profiler&) = delete;
    Profiler& operator=(const Profiler&) = delete;

    std::unordered_map<std::string, SectionStats> sections_;
};

// ============================================================================
// ScopedTimer - RAII helper that records timing when it goes out of scope
// ============================================================================

class ScopedTimer {
public:
    explicit ScopedTimer(const char* section)
        : section_(section)
        , start_(std::chrono::steady_clock::now()) {
    }

    ~ScopedTimer() {
        auto end = std::chrono::steady_clock::now();
        auto durationNs = std::chrono::duration<double, std::nano>(end - start_).count();
        Profiler::instance().record(section_, durationNs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    const char* section_;
    std::chrono::steady_clock::time_point start_;
};

#define PROFILE_CONCAT_INNER(a, b) a##b
#define PROFILE_CONCAT(a, b) PROFILE_CONCAT_INNER(a, b)
#define PROFILE_SCOPE(name) ScopedTimer PROFILE_CONCAT(profilerTimer_, __LINE__)(name)

#else // CONNECT4_ENABLE_PROFILING not defined

// ============================================================================
// Stub Profiler - No-op when profiling disabled
// ============================================================================

class Profiler {
public:
    static Profiler& instance() {
        static Profiler profiler;
        return profiler;
    }
    void printReport() const {}  // No-op
};

#define PROFILE_SCOPE(name) ((void)0)

#endif // CONNECT4_ENABLE_PROFILING

#endif // PROFILER_HPP
