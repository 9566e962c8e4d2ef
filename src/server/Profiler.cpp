#include "server/Profiler.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <vector>

namespace graphstore {
namespace server {

Profiler& Profiler::instance() {
    static Profiler instance;
    return instance;
}

size_t Profiler::start(const std::string& name) {
    if (!m_enabled) return 0;

    std::lock_guard<std::mutex> lock(m_mutex);
    size_t id = ++m_nextTimerId;
    m_activeTimers[id] = Timer{name, std::chrono::steady_clock::now()};
    return id;
}

void Profiler::stop(size_t timerId, bool failed) {
    if (!m_enabled || timerId == 0) return;

    auto endTime = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_activeTimers.find(timerId);
    if (it == m_activeTimers.end()) {
        return;
    }

    const Timer& timer = it->second;
    double durationMs = std::chrono::duration<double, std::milli>(
        endTime - timer.start).count();

    // Update stats
    Stats& stats = m_stats[timer.name];
    stats.count++;
    if (failed) stats.failures++;
    stats.totalMs += durationMs;
    if (durationMs < stats.minMs) stats.minMs = durationMs;
    if (durationMs > stats.maxMs) stats.maxMs = durationMs;

    m_activeTimers.erase(it);
}

Profiler::Stats Profiler::getStats(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_stats.find(name);
    if (it != m_stats.end()) {
        return it->second;
    }
    return Stats{};
}

void Profiler::reset() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stats.clear();
    m_activeTimers.clear();
}

std::string Profiler::formatStats() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_stats.empty()) {
        return "No profiling data available.";
    }

    std::ostringstream oss;
    oss << "\n========== PROFILER STATS ==========\n";
    oss << std::left << std::setw(24) << "Operation"
        << std::right << std::setw(10) << "Count"
        << std::setw(10) << "Failed"
        << std::setw(12) << "Total(ms)"
        << std::setw(12) << "Avg(ms)"
        << std::setw(12) << "Min(ms)"
        << std::setw(12) << "Max(ms)"
        << "\n";
    oss << std::string(92, '-') << "\n";

    // Sort by total time (descending)
    std::vector<std::pair<std::string, Stats>> sorted(m_stats.begin(), m_stats.end());
    std::sort(sorted.begin(), sorted.end(),
        [](const auto& a, const auto& b) { return a.second.totalMs > b.second.totalMs; });

    for (const auto& [name, stats] : sorted) {
        oss << std::left << std::setw(24) << name
            << std::right << std::setw(10) << stats.count
            << std::setw(10) << stats.failures
            << std::setw(12) << std::fixed << std::setprecision(2) << stats.totalMs
            << std::setw(12) << stats.avgMs()
            << std::setw(12) << (stats.count > 0 ? stats.minMs : 0.0)
            << std::setw(12) << stats.maxMs
            << "\n";
    }
    oss << std::string(92, '=') << "\n";

    return oss.str();
}

} // namespace server
} // namespace graphstore
