#pragma once

#include <string>
#include <atomic>
#include <chrono>
#include <exception>
#include <limits>
#include <unordered_map>
#include <mutex>

namespace graphstore {
namespace server {

/**
 * Profiler - mesure et agrège les temps d'exécution par opération
 * (node.create, graph.stats, ...). Thread-safe.
 */
class Profiler {
public:
    struct Stats {
        size_t count = 0;
        size_t failures = 0;             // calls that ended with an exception
        double totalMs = 0.0;
        double minMs = std::numeric_limits<double>::max();
        double maxMs = 0.0;

        double avgMs() const { return count > 0 ? totalMs / count : 0.0; }
    };

    static Profiler& instance();

    // Enable/disable profiling
    void setEnabled(bool enabled) { m_enabled = enabled; }
    bool isEnabled() const { return m_enabled; }

    // Start a timer, returns a timer ID (0 when disabled)
    size_t start(const std::string& name);

    // Stop a timer and record the duration
    void stop(size_t timerId, bool failed);

    Stats getStats(const std::string& name) const;

    void reset();

    // Table sorted by total time, printed at shutdown
    std::string formatStats() const;

private:
    Profiler() = default;
    Profiler(const Profiler&) = delete;
    Profiler& operator=(const Profiler&) = delete;

    struct Timer {
        std::string name;
        std::chrono::steady_clock::time_point start;
    };

    std::atomic<bool> m_enabled{true};
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Stats> m_stats;
    std::unordered_map<size_t, Timer> m_activeTimers;
    size_t m_nextTimerId = 0;
};

/**
 * RAII Scoped timer - automatically stops when destroyed. A scope left by
 * an exception is counted as a failure.
 */
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& name)
        : m_timerId(Profiler::instance().start(name))
        , m_uncaught(std::uncaught_exceptions())
    {}

    ~ScopedTimer() {
        Profiler::instance().stop(m_timerId, std::uncaught_exceptions() > m_uncaught);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    size_t m_timerId;
    int m_uncaught;
};

// Convenience macros
#define PROFILE_CONCAT_INNER(a, b) a##b
#define PROFILE_CONCAT(a, b) PROFILE_CONCAT_INNER(a, b)
#define PROFILE_SCOPE(name) graphstore::server::ScopedTimer PROFILE_CONCAT(_profiler_, __LINE__)(name)

} // namespace server
} // namespace graphstore
