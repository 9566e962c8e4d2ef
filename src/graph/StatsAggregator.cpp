#include "graph/StatsAggregator.hpp"
#include "graph/QueryBuilder.hpp"
#include "server/Profiler.hpp"

namespace graph {

namespace {

int64_t countField(const std::optional<bolt::Record>& record, const std::string& field) {
    if (!record || !record->has(field) || record->get(field).isNull()) {
        return 0;
    }
    return record->get(field).asInt();
}

} // anonymous namespace

StatsAggregator::StatsAggregator(QueryRunner& runner, const std::string& episodeLabel)
    : m_runner(runner)
    , m_episodeLabel(LabelSanitizer::sanitize(episodeLabel))
{
}

GraphStats StatsAggregator::collect() {
    PROFILE_SCOPE("graph.stats");

    GraphStats stats;

    auto nodes = m_runner.single(QueryBuilder::nodeStats());
    stats.totalNodes = countField(nodes, "total_nodes");
    if (nodes && nodes->has("node_labels") && nodes->get("node_labels").isList()) {
        // One entry per distinct label combination
        for (const auto& labels : nodes->get("node_labels").asList()) {
            for (const auto& label : labels.asList()) {
                if (label.asString() != kEntityLabel) {
                    stats.nodeTypes.insert(label.asString());
                }
            }
        }
    }

    auto relationships = m_runner.single(QueryBuilder::relationshipStats());
    stats.totalRelationships = countField(relationships, "total_relationships");
    if (relationships && relationships->has("relationship_types") &&
        relationships->get("relationship_types").isList()) {
        for (const auto& type : relationships->get("relationship_types").asList()) {
            stats.relationshipTypes.insert(type.asString());
        }
    }

    auto episodes = m_runner.single(QueryBuilder::episodeCount(m_episodeLabel));
    stats.totalEpisodes = countField(episodes, "total_episodes");

    return stats;
}

} // namespace graph
