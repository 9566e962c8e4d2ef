#pragma once

#include "bolt/Value.hpp"
#include "graph/GraphTypes.hpp"
#include "graph/LabelSanitizer.hpp"
#include <optional>
#include <string>
#include <vector>

namespace graph {

/**
 * Texte Cypher + paramètres liés + noms des colonnes du RETURN, dans l'ordre
 * (le client Bolt ne transmet pas les noms de champs)
 */
struct Query {
    std::string text;
    bolt::Value::Map params;
    std::vector<std::string> columns;
};

/**
 * @brief Construction des requêtes, sans I/O
 *
 * Seuls les labels déjà validés (SafeLabel) sont insérés dans le texte;
 * toutes les autres valeurs passent par les paramètres.
 */
class QueryBuilder {
public:
    /**
     * @brief CREATE d'un noeud :Entity:<type>
     * Les champs de `node` (hors type) deviennent des paramètres.
     */
    static Query createNode(const SafeLabel& type, const Node& node);

    /**
     * @brief MATCH des deux extrémités puis CREATE de la relation,
     * en une seule requête
     */
    static Query createRelationship(const SafeLabel& type, const Relationship& relationship);

    static Query getNode(const std::string& uuid);

    /**
     * @brief SET dynamique: seuls les champs fournis sont modifiés
     * @return std::nullopt si aucun champ n'est fourni (no-op)
     */
    static std::optional<Query> updateNode(const std::string& uuid,
                                           const std::optional<std::string>& name,
                                           const std::optional<std::string>& summary);

    // DETACH DELETE, returns deleted_count
    static Query deleteNode(const std::string& uuid);

    static Query nodeStats();
    static Query relationshipStats();
    static Query episodeCount(const SafeLabel& episodeLabel);

    static Query ping();
};

} // namespace graph
