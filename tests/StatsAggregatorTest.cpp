#include <catch2/catch_test_macros.hpp>
#include "graph/StatsAggregator.hpp"
#include "graph/GraphErrors.hpp"
#include "support/FakeQueryRunner.hpp"
#include <set>
#include <vector>

using namespace graph;
using testsupport::FakeQueryRunner;
using testsupport::makeRecord;

namespace {

bolt::Value labelList(std::initializer_list<const char*> labels) {
    bolt::Value::List out;
    for (const char* label : labels) {
        out.push_back(bolt::Value(label));
    }
    return bolt::Value(std::move(out));
}

} // anonymous namespace

TEST_CASE("collect aggregates the three counts", "[StatsAggregator]") {
    FakeQueryRunner runner;
    StatsAggregator stats(runner);

    runner.respond(makeRecord({
        {"total_nodes", bolt::Value(5)},
        {"node_labels", bolt::Value(bolt::Value::List{
            labelList({"Entity", "Person"}),
            labelList({"Entity", "Place"}),
            labelList({"Episode"})
        })}
    }));
    runner.respond(makeRecord({
        {"total_relationships", bolt::Value(3)},
        {"relationship_types", labelList({"KNOWS", "LIVES_IN"})}
    }));
    runner.respond(makeRecord({{"total_episodes", bolt::Value(1)}}));

    GraphStats result = stats.collect();

    CHECK(result.totalNodes == 5);
    CHECK(result.totalRelationships == 3);
    CHECK(result.totalEpisodes == 1);
    CHECK(result.nodeTypes == std::set<std::string>{"Episode", "Person", "Place"});
    CHECK(result.relationshipTypes == std::set<std::string>{"KNOWS", "LIVES_IN"});
    REQUIRE(runner.queries.size() == 3);
    CHECK(runner.queries[2].text.find(":`Episode`") != std::string::npos);
}

TEST_CASE("collect after adding three Person and two Place nodes", "[StatsAggregator]") {
    // Stored nodes as label lists, answered the way the engine aggregates them
    std::vector<std::vector<std::string>> stored;
    int64_t relationshipCount = 2;

    auto nodeStats = [&stored](const Query&) -> std::optional<bolt::Record> {
        bolt::Value::List distinct;
        std::set<std::vector<std::string>> seen;
        for (const auto& labels : stored) {
            if (seen.insert(labels).second) {
                bolt::Value::List values;
                for (const auto& label : labels) {
                    values.push_back(bolt::Value(label));
                }
                distinct.push_back(bolt::Value(std::move(values)));
            }
        }
        return makeRecord({
            {"total_nodes", bolt::Value(static_cast<int64_t>(stored.size()))},
            {"node_labels", bolt::Value(std::move(distinct))}
        });
    };
    auto relationshipStats = [&relationshipCount](const Query&) -> std::optional<bolt::Record> {
        return makeRecord({
            {"total_relationships", bolt::Value(relationshipCount)},
            {"relationship_types", labelList({"KNOWS"})}
        });
    };

    FakeQueryRunner runner;
    StatsAggregator stats(runner);

    runner.respondWith(nodeStats);
    runner.respondWith(relationshipStats);
    runner.respondEmpty();
    GraphStats before = stats.collect();
    CHECK(before.totalNodes == 0);
    CHECK(before.nodeTypes.empty());

    for (int i = 0; i < 3; ++i) {
        stored.push_back({"Entity", "Person"});
    }
    for (int i = 0; i < 2; ++i) {
        stored.push_back({"Entity", "Place"});
    }

    runner.respondWith(nodeStats);
    runner.respondWith(relationshipStats);
    runner.respondEmpty();
    GraphStats after = stats.collect();

    CHECK(after.totalNodes == 5);
    CHECK(after.nodeTypes == std::set<std::string>{"Person", "Place"});
    CHECK(after.totalRelationships == before.totalRelationships);
    CHECK(after.relationshipTypes == before.relationshipTypes);
    CHECK(after.totalEpisodes == 0);
    CHECK(runner.pending() == 0);
}

TEST_CASE("collect on an empty graph", "[StatsAggregator]") {
    FakeQueryRunner runner;
    StatsAggregator stats(runner);

    runner.respond(makeRecord({
        {"total_nodes", bolt::Value(0)},
        {"node_labels", bolt::Value(bolt::Value::List{})}
    }));
    runner.respondEmpty();
    runner.respondEmpty();

    GraphStats result = stats.collect();
    CHECK(result.totalNodes == 0);
    CHECK(result.totalRelationships == 0);
    CHECK(result.totalEpisodes == 0);
    CHECK(result.nodeTypes.empty());
    CHECK(result.relationshipTypes.empty());
}

TEST_CASE("collect uses the configured episode label", "[StatsAggregator]") {
    FakeQueryRunner runner;
    StatsAggregator stats(runner, "Conversation");
    CHECK(stats.episodeLabel().str() == "Conversation");

    stats.collect();
    REQUIRE(runner.queries.size() == 3);
    CHECK(runner.queries[2].text.find(":`Conversation`") != std::string::npos);
}

TEST_CASE("An unsafe episode label is refused at construction", "[StatsAggregator]") {
    FakeQueryRunner runner;
    CHECK_THROWS_AS(StatsAggregator(runner, "Ep`isode"), InvalidLabelError);
    CHECK_THROWS_AS(StatsAggregator(runner, ""), InvalidLabelError);
}

TEST_CASE("collect propagates engine errors", "[StatsAggregator]") {
    FakeQueryRunner runner;
    StatsAggregator stats(runner);
    runner.fail(EngineQueryError("bad"));

    CHECK_THROWS_AS(stats.collect(), EngineQueryError);
}
