#pragma once

#include "graph/GraphTypes.hpp"
#include "graph/SessionGateway.hpp"
#include <optional>
#include <string>

namespace graph {

class RelationshipRepository {
public:
    explicit RelationshipRepository(QueryRunner& runner);

    /**
     * @brief Crée une relation source -> target
     *
     * Le type est normalisé puis validé; la relation renvoyée conserve le
     * type tel que fourni. Les deux extrémités sont résolues dans la même
     * requête que la création.
     *
     * @throws InvalidLabelError
     * @throws EndpointNotFoundError si la source et/ou la cible n'existe pas
     */
    Relationship createRelationship(const std::string& sourceUuid,
                                    const std::string& targetUuid,
                                    const std::string& type,
                                    const std::optional<std::string>& summary = std::nullopt,
                                    const std::optional<std::string>& groupId = std::nullopt);

private:
    QueryRunner& m_runner;
};

} // namespace graph
