#include "graph/Identifiers.hpp"
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace graph {

namespace {

std::mt19937_64& generator() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    return gen;
}

} // anonymous namespace

std::string generateUuid() {
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t hi = dist(generator());
    uint64_t lo = dist(generator());

    // Version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << (hi >> 32) << '-'
        << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-'
        << std::setw(4) << (hi & 0xFFFF) << '-'
        << std::setw(4) << (lo >> 48) << '-'
        << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return oss.str();
}

std::string currentTimestamp() {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return formatTimestamp(micros / 1000000, (micros % 1000000) * 1000);
}

std::string formatTimestamp(int64_t seconds, int64_t nanoseconds) {
    seconds += nanoseconds / 1000000000;
    nanoseconds %= 1000000000;
    if (nanoseconds < 0) {
        nanoseconds += 1000000000;
        --seconds;
    }

    auto time = static_cast<std::time_t>(seconds);
    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(6) << (nanoseconds / 1000);
    return oss.str();
}

} // namespace graph
