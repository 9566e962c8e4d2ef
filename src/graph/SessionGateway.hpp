#pragma once

#include "bolt/BoltPool.hpp"
#include "graph/QueryBuilder.hpp"
#include <optional>

namespace graph {

/**
 * @brief Exécution d'une requête unique
 *
 * Point d'injection des repositories: la production passe par
 * SessionGateway, les tests par un runner scripté.
 */
class QueryRunner {
public:
    virtual ~QueryRunner() = default;

    /**
     * @brief Exécute la requête et retourne le premier enregistrement
     * @return std::nullopt si la requête ne produit aucun enregistrement
     * @throws ConnectionError, EngineQueryError
     */
    virtual std::optional<bolt::Record> single(const Query& query) = 0;
};

/**
 * @brief Une session du pool par requête
 *
 * La session est rendue au pool sur tous les chemins de sortie (RAII);
 * les erreurs Bolt sont traduites en erreurs du graphe.
 */
class SessionGateway : public QueryRunner {
public:
    explicit SessionGateway(bolt::BoltPool& pool);

    std::optional<bolt::Record> single(const Query& query) override;

private:
    bolt::BoltPool& m_pool;
};

} // namespace graph
