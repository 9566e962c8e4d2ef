#include <catch2/catch_test_macros.hpp>
#include "graph/Identifiers.hpp"
#include <regex>
#include <set>
#include <thread>
#include <vector>
#include <mutex>

using namespace graph;

TEST_CASE("generateUuid produces canonical version 4 uuids", "[Identifiers]") {
    static const std::regex pattern(
        "^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");

    for (int i = 0; i < 200; ++i) {
        std::string uuid = generateUuid();
        INFO(uuid);
        CHECK(uuid.size() == 36);
        CHECK(std::regex_match(uuid, pattern));
    }
}

TEST_CASE("generateUuid is unique across threads", "[Identifiers]") {
    std::set<std::string> seen;
    std::mutex mutex;

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            std::vector<std::string> local;
            for (int i = 0; i < 500; ++i) {
                local.push_back(generateUuid());
            }
            std::lock_guard<std::mutex> lock(mutex);
            seen.insert(local.begin(), local.end());
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    CHECK(seen.size() == 2000);
}

TEST_CASE("currentTimestamp format", "[Identifiers]") {
    static const std::regex pattern(
        "^\\d{4}-\\d{2}-\\d{2}T\\d{2}:\\d{2}:\\d{2}\\.\\d{6}$");

    std::string ts = currentTimestamp();
    INFO(ts);
    CHECK(std::regex_match(ts, pattern));
    // No timezone suffix
    CHECK(ts.find('Z') == std::string::npos);
    CHECK(ts.find('+') == std::string::npos);
}

TEST_CASE("currentTimestamp sorts chronologically", "[Identifiers]") {
    std::string first = currentTimestamp();
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    std::string second = currentTimestamp();

    CHECK(first < second);
}

TEST_CASE("formatTimestamp renders UTC instants", "[Identifiers]") {
    CHECK(formatTimestamp(0, 0) == "1970-01-01T00:00:00.000000");
    CHECK(formatTimestamp(1714557600, 123456789) == "2024-05-01T10:00:00.123456");
    // Nanoseconds beyond one second carry into the seconds
    CHECK(formatTimestamp(1714557599, 1500000000) == "2024-05-01T10:00:00.500000");
    CHECK(formatTimestamp(-1, 0) == "1969-12-31T23:59:59.000000");
    CHECK(formatTimestamp(0, -1000) == "1969-12-31T23:59:59.999999");
}
