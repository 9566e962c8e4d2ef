#include "graph/QueryBuilder.hpp"

namespace graph {

using bolt::Value;

namespace {

const char* kReturnNode = " RETURN n, labels(n) AS labels";
const std::vector<std::string> kNodeColumns = {"n", "labels"};

} // anonymous namespace

Query QueryBuilder::createNode(const SafeLabel& type, const Node& node) {
    Query query;
    query.text = std::string("CREATE (n:`") + kEntityLabel + "`:" + type.quoted() +
                 " {uuid: $uuid, name: $name, summary: $summary,"
                 " group_id: $group_id, created_at: $created_at})" + kReturnNode;
    query.params = {
        {"uuid", Value(node.uuid)},
        {"name", Value(node.name)},
        {"summary", Value::fromOptional(node.summary)},
        {"group_id", Value::fromOptional(node.groupId)},
        {"created_at", Value(node.createdAt)}
    };
    query.columns = kNodeColumns;
    return query;
}

Query QueryBuilder::createRelationship(const SafeLabel& type, const Relationship& relationship) {
    Query query;
    query.text = "MATCH (source {uuid: $source_uuid}) "
                 "MATCH (target {uuid: $target_uuid}) "
                 "CREATE (source)-[r:" + type.quoted() +
                 " {uuid: $uuid, summary: $summary, group_id: $group_id,"
                 " created_at: $created_at}]->(target) "
                 "RETURN r.uuid AS uuid";
    query.params = {
        {"source_uuid", Value(relationship.sourceUuid)},
        {"target_uuid", Value(relationship.targetUuid)},
        {"uuid", Value(relationship.uuid)},
        {"summary", Value::fromOptional(relationship.summary)},
        {"group_id", Value::fromOptional(relationship.groupId)},
        {"created_at", Value(relationship.createdAt)}
    };
    query.columns = {"uuid"};
    return query;
}

Query QueryBuilder::getNode(const std::string& uuid) {
    return Query{std::string("MATCH (n {uuid: $uuid})") + kReturnNode,
                 {{"uuid", Value(uuid)}},
                 kNodeColumns};
}

std::optional<Query> QueryBuilder::updateNode(const std::string& uuid,
                                              const std::optional<std::string>& name,
                                              const std::optional<std::string>& summary) {
    if (!name && !summary) {
        return std::nullopt;
    }

    Query query;
    query.params["uuid"] = Value(uuid);

    std::string assignments;
    if (name) {
        assignments += "n.name = $name";
        query.params["name"] = Value(*name);
    }
    if (summary) {
        if (!assignments.empty()) assignments += ", ";
        assignments += "n.summary = $summary";
        query.params["summary"] = Value(*summary);
    }

    query.text = "MATCH (n {uuid: $uuid}) SET " + assignments + kReturnNode;
    query.columns = kNodeColumns;
    return query;
}

Query QueryBuilder::deleteNode(const std::string& uuid) {
    return Query{"MATCH (n {uuid: $uuid}) DETACH DELETE n RETURN count(n) AS deleted_count",
                 {{"uuid", Value(uuid)}},
                 {"deleted_count"}};
}

Query QueryBuilder::nodeStats() {
    return Query{"MATCH (n) RETURN count(n) AS total_nodes,"
                 " collect(DISTINCT labels(n)) AS node_labels", {},
                 {"total_nodes", "node_labels"}};
}

Query QueryBuilder::relationshipStats() {
    return Query{"MATCH ()-[r]->() RETURN count(r) AS total_relationships,"
                 " collect(DISTINCT type(r)) AS relationship_types", {},
                 {"total_relationships", "relationship_types"}};
}

Query QueryBuilder::episodeCount(const SafeLabel& episodeLabel) {
    return Query{"MATCH (e:" + episodeLabel.quoted() + ") RETURN count(e) AS total_episodes", {},
                 {"total_episodes"}};
}

Query QueryBuilder::ping() {
    return Query{"RETURN 1 AS ok", {}, {"ok"}};
}

} // namespace graph
