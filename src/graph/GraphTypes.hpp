#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace graph {

/**
 * @brief Entité du graphe
 *
 * `type` est le label spécifique porté à côté du label marqueur.
 */
struct Node {
    std::string uuid;
    std::string name;
    std::string type;
    std::optional<std::string> summary;
    std::optional<std::string> groupId;
    std::string createdAt;

    bool operator==(const Node& other) const = default;
};

/**
 * @brief Relation orientée entre deux noeuds existants
 *
 * `type` contient la chaîne fournie par l'appelant; la forme normalisée
 * n'existe que côté moteur, comme type de la relation.
 */
struct Relationship {
    std::string uuid;
    std::string sourceUuid;
    std::string targetUuid;
    std::string type;
    std::optional<std::string> summary;
    std::optional<std::string> groupId;
    std::string createdAt;

    bool operator==(const Relationship& other) const = default;
};

struct GraphStats {
    int64_t totalNodes = 0;
    int64_t totalRelationships = 0;
    int64_t totalEpisodes = 0;
    std::set<std::string> nodeTypes;
    std::set<std::string> relationshipTypes;
};

} // namespace graph
