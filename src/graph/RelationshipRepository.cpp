#include "graph/RelationshipRepository.hpp"
#include "graph/GraphErrors.hpp"
#include "graph/Identifiers.hpp"
#include "graph/LabelSanitizer.hpp"
#include "graph/QueryBuilder.hpp"
#include "server/Logger.hpp"
#include "server/Profiler.hpp"

namespace graph {

RelationshipRepository::RelationshipRepository(QueryRunner& runner)
    : m_runner(runner)
{
}

Relationship RelationshipRepository::createRelationship(const std::string& sourceUuid,
                                                        const std::string& targetUuid,
                                                        const std::string& type,
                                                        const std::optional<std::string>& summary,
                                                        const std::optional<std::string>& groupId) {
    PROFILE_SCOPE("relationship.create");

    SafeLabel label = LabelSanitizer::sanitizeRelationshipType(type);

    Relationship relationship;
    relationship.uuid = generateUuid();
    relationship.sourceUuid = sourceUuid;
    relationship.targetUuid = targetUuid;
    relationship.type = type;
    relationship.summary = summary;
    relationship.groupId = groupId;
    relationship.createdAt = currentTimestamp();

    auto record = m_runner.single(QueryBuilder::createRelationship(label, relationship));
    if (!record) {
        throw EndpointNotFoundError(sourceUuid, targetUuid);
    }

    const auto& stored = record->get("uuid");
    if (stored.isString() && stored.asString() != relationship.uuid) {
        throw CreateFailedError("Relationship stored with unexpected uuid " + stored.asString());
    }

    LOG_INFO("Relationship created: " + sourceUuid + " -[" + label.str() + "]-> " + targetUuid);
    return relationship;
}

} // namespace graph
