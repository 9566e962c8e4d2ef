#pragma once

#include "graph/GraphTypes.hpp"
#include "graph/NodeRepository.hpp"
#include "graph/RelationshipRepository.hpp"
#include "graph/SessionGateway.hpp"
#include "graph/StatsAggregator.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace graphstore {
namespace server {

using json = nlohmann::json;

/// Route handler result: {HTTP status code, JSON body}
using RouteResult = std::pair<unsigned, json>;

/**
 * Corps de requête invalide (champ manquant ou mal typé)
 */
class BadRequestError : public std::invalid_argument {
public:
    explicit BadRequestError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * @brief Gestionnaire de requêtes - routage et traduction HTTP <-> graphe
 *
 * Les repositories sont fournis par l'appelant et doivent survivre au
 * handler. Aucun état mutable: les appels concurrents sont sûrs tant que
 * le QueryRunner l'est.
 */
class RequestHandler {
public:
    RequestHandler(graph::NodeRepository& nodes,
                   graph::RelationshipRepository& relationships,
                   graph::StatsAggregator& stats,
                   graph::QueryRunner& runner);

    /**
     * @brief Route une requête et convertit les erreurs en codes HTTP
     *
     * 400: JSON invalide, champ manquant, label refusé
     * 404: noeud ou extrémité introuvable, route inconnue
     * 503: moteur injoignable
     * 500: toute autre erreur
     */
    RouteResult dispatch(const std::string& method,
                         const std::string& target,
                         const std::string& body);

    // Handlers par endpoint
    RouteResult handleRoot();
    RouteResult handleHealth();
    RouteResult handleAddNode(const json& request);
    RouteResult handleGetNode(const std::string& uuid);
    RouteResult handleUpdateNode(const json& request);
    RouteResult handleDeleteNode(const json& request);
    RouteResult handleAddRelationship(const json& request);
    RouteResult handleGraphStats();

    /**
     * @brief Sérialise un corps de réponse
     *
     * Les octets UTF-8 invalides (ex: repris d'une URL) sont remplacés
     * par U+FFFD au lieu de faire échouer la sérialisation.
     */
    static std::string serialize(const json& body);

    // JSON representations
    static json nodeToJson(const graph::Node& node);
    static json relationshipToJson(const graph::Relationship& relationship);
    static json statsToJson(const graph::GraphStats& stats);

private:
    RequestHandler(const RequestHandler&) = delete;
    RequestHandler& operator=(const RequestHandler&) = delete;

    std::optional<RouteResult> route(const std::string& method,
                                     const std::string& path,
                                     const std::string& body);

    graph::NodeRepository& m_nodes;
    graph::RelationshipRepository& m_relationships;
    graph::StatsAggregator& m_stats;
    graph::QueryRunner& m_runner;
};

} // namespace server
} // namespace graphstore
