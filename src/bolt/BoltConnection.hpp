#pragma once

#include "bolt/Value.hpp"
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace mg {
class Client;
}

namespace bolt {

/**
 * Engine unreachable, authentication refused, or a connection used after it
 * broke. The connection that raised it must not be reused.
 */
class BoltConnectionError : public std::runtime_error {
public:
    explicit BoltConnectionError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * The engine rejected or failed a query
 */
class BoltQueryError : public std::runtime_error {
public:
    explicit BoltQueryError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Résultat complet d'une requête
 */
struct QueryResult {
    std::vector<Record> records;
};

/**
 * @brief Connexion Bolt unique, portée par un mg::Client (non thread-safe)
 *
 * Toute erreur en cours de requête marque la connexion comme cassée: le
 * flux de résultats peut encore contenir des lignes non lues, la
 * connexion ne doit plus être réutilisée.
 */
class BoltConnection {
public:
    struct Options {
        std::string userAgent = "graphstore/1.0";
    };

    BoltConnection(std::string host, unsigned short port, Options options);
    ~BoltConnection();

    BoltConnection(const BoltConnection&) = delete;
    BoltConnection& operator=(const BoltConnection&) = delete;

    /**
     * @brief Connexion TCP + handshake + authentification basique
     * @throws BoltConnectionError
     */
    void open(const std::string& user, const std::string& password);

    /**
     * @brief Exécute une requête en auto-commit
     * @param columns noms des colonnes du RETURN, dans l'ordre
     * @param limit nombre maximal d'enregistrements conservés (-1: tous).
     *        Le reste du flux est lu et ignoré.
     * @throws BoltQueryError si le moteur rejette la requête
     * @throws BoltConnectionError si la connexion n'est pas utilisable
     */
    QueryResult run(const std::string& query,
                    const Value::Map& params,
                    const std::vector<std::string>& columns,
                    int64_t limit = -1);

    void close();

    bool isOpen() const { return m_client != nullptr; }
    bool isBroken() const { return m_broken; }
    std::string endpoint() const { return m_host + ":" + std::to_string(m_port); }

private:
    std::string m_host;
    unsigned short m_port;
    Options m_options;

    std::unique_ptr<mg::Client> m_client;
    bool m_broken = false;
};

} // namespace bolt
