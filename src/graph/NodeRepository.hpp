#pragma once

#include "graph/GraphTypes.hpp"
#include "graph/SessionGateway.hpp"
#include <optional>
#include <string>

namespace graph {

/**
 * @brief CRUD des noeuds
 *
 * Chaque noeud porte le label marqueur et le label de son type. Le type
 * public est dérivé du premier label différent du marqueur.
 */
class NodeRepository {
public:
    explicit NodeRepository(QueryRunner& runner);

    /**
     * @brief Crée un noeud (uuid et created_at générés ici)
     * @throws InvalidLabelError si le type est refusé
     * @throws CreateFailedError si le moteur ne renvoie aucun enregistrement
     */
    Node createNode(const std::string& name,
                    const std::string& type,
                    const std::optional<std::string>& summary = std::nullopt,
                    const std::optional<std::string>& groupId = std::nullopt);

    // Lookup by uuid, whatever the labels
    std::optional<Node> getNode(const std::string& uuid);

    /**
     * @brief Met à jour name et/ou summary
     *
     * Sans aucun champ, retourne le noeud courant sans l'écrire.
     * @throws NotFoundError
     */
    Node updateNode(const std::string& uuid,
                    const std::optional<std::string>& name,
                    const std::optional<std::string>& summary);

    /**
     * @brief Supprime le noeud et ses relations
     * @return false si aucun noeud ne correspond
     */
    bool deleteNode(const std::string& uuid);

    /**
     * @brief Conversion d'un enregistrement (n, labels) en Node
     * @throws std::runtime_error si l'enregistrement n'a pas la forme attendue
     */
    static Node fromRecord(const bolt::Record& record);

    // First label that is not the marker, "Unknown" otherwise
    static std::string typeFromLabels(const std::vector<std::string>& labels);

private:
    QueryRunner& m_runner;
};

} // namespace graph
