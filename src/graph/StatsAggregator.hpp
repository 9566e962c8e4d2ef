#pragma once

#include "graph/GraphTypes.hpp"
#include "graph/LabelSanitizer.hpp"
#include "graph/SessionGateway.hpp"
#include <string>

namespace graph {

/**
 * @brief Statistiques globales du graphe (noeuds, relations, épisodes)
 *
 * Trois requêtes indépendantes; une requête sans résultat compte pour
 * zéro. Le label marqueur n'apparaît pas dans nodeTypes.
 */
class StatsAggregator {
public:
    /**
     * @throws InvalidLabelError si episodeLabel est refusé
     */
    explicit StatsAggregator(QueryRunner& runner, const std::string& episodeLabel = kEpisodeLabel);

    GraphStats collect();

    const SafeLabel& episodeLabel() const { return m_episodeLabel; }

private:
    QueryRunner& m_runner;
    SafeLabel m_episodeLabel;
};

} // namespace graph
