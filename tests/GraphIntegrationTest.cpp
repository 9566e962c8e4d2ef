#include <catch2/catch_test_macros.hpp>
#include "graph/GraphErrors.hpp"
#include "graph/NodeRepository.hpp"
#include "graph/RelationshipRepository.hpp"
#include "graph/SessionGateway.hpp"
#include "graph/StatsAggregator.hpp"
#include <cstdlib>
#include <optional>
#include <vector>

using namespace graph;

// Note: ces tests nécessitent un moteur de graphe accessible en Bolt.
// Pour les exécuter, configurer GRAPHSTORE_TEST_URI, GRAPHSTORE_TEST_USER et
// GRAPHSTORE_TEST_PASSWORD (ex: bolt://localhost:7687 neo4j secret).
// Les noeuds créés sont supprimés en fin de test.

static std::optional<bolt::BoltConfig> testConfig() {
    const char* uri = std::getenv("GRAPHSTORE_TEST_URI");
    const char* password = std::getenv("GRAPHSTORE_TEST_PASSWORD");
    if (!uri || !password) {
        return std::nullopt;
    }
    bolt::BoltConfig config;
    config.uri = uri;
    config.password = password;
    if (const char* user = std::getenv("GRAPHSTORE_TEST_USER")) {
        config.user = user;
    }
    config.maxPoolSize = 4;
    return config;
}

TEST_CASE("Graph lifecycle against a live engine", "[integration]") {
    auto config = testConfig();
    if (!config) {
        WARN("GRAPHSTORE_TEST_URI / GRAPHSTORE_TEST_PASSWORD not set, skipping");
        return;
    }

    bolt::BoltPool pool(*config);
    pool.verifyConnectivity();

    SessionGateway gateway(pool);
    NodeRepository nodes(gateway);
    RelationshipRepository relationships(gateway);
    StatsAggregator stats(gateway);

    GraphStats before = stats.collect();

    Node alice = nodes.createNode("Alice", "Person", std::string("Integration test"),
                                  std::string("graphstore-it"));
    Node paris = nodes.createNode("Paris", "Place");

    // Node round trip
    auto fetched = nodes.getNode(alice.uuid);
    REQUIRE(fetched);
    CHECK(*fetched == alice);
    CHECK(fetched->type == "Person");

    // Relationship between existing nodes
    Relationship livesIn = relationships.createRelationship(alice.uuid, paris.uuid, "lives in");
    CHECK(livesIn.type == "lives in");
    CHECK_THROWS_AS(relationships.createRelationship(alice.uuid, "no-such-node", "KNOWS"),
                    EndpointNotFoundError);

    GraphStats during = stats.collect();
    CHECK(during.totalNodes == before.totalNodes + 2);
    CHECK(during.totalRelationships == before.totalRelationships + 1);
    CHECK(during.nodeTypes.count("Person") == 1);
    CHECK(during.nodeTypes.count("Entity") == 0);
    CHECK(during.relationshipTypes.count("LIVES_IN") == 1);

    // Partial update keeps the other fields
    Node renamed = nodes.updateNode(alice.uuid, std::string("Alicia"), std::nullopt);
    CHECK(renamed.name == "Alicia");
    CHECK(renamed.summary == alice.summary);
    CHECK(renamed.createdAt == alice.createdAt);
    CHECK_THROWS_AS(nodes.updateNode("no-such-node", std::string("x"), std::nullopt), NotFoundError);

    // Injection attempts never reach the engine
    int64_t nodesBeforeInjection = stats.collect().totalNodes;
    CHECK_THROWS_AS(nodes.createNode("x", "Person`) DETACH DELETE n //"), InvalidLabelError);
    CHECK_THROWS_AS(relationships.createRelationship(alice.uuid, paris.uuid, "R`]->() DELETE n //"),
                    InvalidLabelError);
    CHECK(stats.collect().totalNodes == nodesBeforeInjection);

    // Detach delete removes the relationship too
    Query degree{"MATCH (b {uuid: $uuid})-[r]-() RETURN count(r) AS degree",
                 {{"uuid", bolt::Value(paris.uuid)}},
                 {"degree"}};
    auto parisBefore = gateway.single(degree);
    REQUIRE(parisBefore);
    CHECK(parisBefore->get("degree").asInt() == 1);

    CHECK(nodes.deleteNode(alice.uuid));
    CHECK_FALSE(nodes.deleteNode(alice.uuid));
    CHECK_FALSE(nodes.getNode(alice.uuid).has_value());

    auto parisAfter = gateway.single(degree);
    REQUIRE(parisAfter);
    CHECK(parisAfter->get("degree").asInt() == 0);
    CHECK(nodes.getNode(paris.uuid).has_value());
    CHECK(nodes.deleteNode(paris.uuid));

    GraphStats after = stats.collect();
    CHECK(after.totalNodes == before.totalNodes);
    CHECK(after.totalRelationships == before.totalRelationships);

    pool.close();
}

TEST_CASE("Graph stats count new nodes by type against a live engine", "[integration]") {
    auto config = testConfig();
    if (!config) {
        WARN("GRAPHSTORE_TEST_URI / GRAPHSTORE_TEST_PASSWORD not set, skipping");
        return;
    }

    bolt::BoltPool pool(*config);
    SessionGateway gateway(pool);
    NodeRepository nodes(gateway);
    StatsAggregator stats(gateway);

    GraphStats before = stats.collect();

    std::vector<Node> created;
    for (const char* name : {"Ada", "Grace", "Linus"}) {
        created.push_back(nodes.createNode(name, "Person"));
    }
    for (const char* name : {"Lyon", "Oslo"}) {
        created.push_back(nodes.createNode(name, "Place"));
    }

    GraphStats after = stats.collect();
    CHECK(after.totalNodes == before.totalNodes + 5);
    CHECK(after.totalRelationships == before.totalRelationships);
    CHECK(after.nodeTypes.count("Person") == 1);
    CHECK(after.nodeTypes.count("Place") == 1);
    CHECK(after.nodeTypes.count("Entity") == 0);

    for (const auto& node : created) {
        CHECK(nodes.deleteNode(node.uuid));
    }
    CHECK(stats.collect().totalNodes == before.totalNodes);

    pool.close();
}
