#pragma once

#include "bolt/BoltConnection.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace bolt {

/**
 * @brief Configuration d'accès au moteur de graphe
 */
struct BoltConfig {
    std::string uri = "bolt://localhost:7687";
    std::string user = "neo4j";
    std::string password;
    size_t maxPoolSize = 16;
    std::chrono::milliseconds acquireTimeout{60000};
    std::string userAgent = "graphstore/1.0";
};

struct BoltAddress {
    std::string scheme;
    std::string host;
    unsigned short port = 7687;
};

/**
 * Parse bolt://host[:port] or neo4j://host[:port] (routing is not supported,
 * neo4j:// is treated as a direct connection). IPv6 hosts go in brackets.
 * @throws std::invalid_argument for malformed URIs and TLS schemes
 */
BoltAddress parseBoltUri(const std::string& uri);

/**
 * @brief Pool de connexions Bolt
 *
 * Objet possédé explicitement (créé au démarrage, fermé à l'arrêt) et
 * partagé par référence. Chaque opération emprunte une Session et la rend
 * à la destruction de celle-ci. Thread-safe.
 */
class BoltPool {
public:
    /**
     * @brief Connexion empruntée au pool (RAII)
     *
     * Rendue au pool à la destruction; jetée si elle est cassée.
     */
    class Session {
    public:
        Session(Session&& other) noexcept;
        Session& operator=(Session&& other) noexcept;
        ~Session();

        Session(const Session&) = delete;
        Session& operator=(const Session&) = delete;

        /**
         * @throws BoltQueryError, BoltConnectionError
         */
        QueryResult run(const std::string& query,
                        const Value::Map& params,
                        const std::vector<std::string>& columns,
                        int64_t limit = -1);

        BoltConnection& connection() { return *m_connection; }

    private:
        friend class BoltPool;
        Session(BoltPool* pool, std::unique_ptr<BoltConnection> connection);
        void release();

        BoltPool* m_pool = nullptr;
        std::unique_ptr<BoltConnection> m_connection;
    };

    /**
     * Initialise la bibliothèque cliente au premier pool créé.
     * @throws std::invalid_argument si l'URI est invalide
     */
    explicit BoltPool(BoltConfig config);
    ~BoltPool();

    BoltPool(const BoltPool&) = delete;
    BoltPool& operator=(const BoltPool&) = delete;

    /**
     * @brief Emprunte une connexion (réutilisée ou nouvellement ouverte)
     *
     * Attend au plus acquireTimeout quand maxPoolSize connexions sont déjà
     * empruntées.
     * @throws BoltConnectionError si le moteur est injoignable, si le pool
     *         est fermé ou si l'attente expire
     */
    Session acquire();

    /**
     * @brief Vérifie que le moteur répond (RETURN 1)
     * @throws BoltConnectionError, BoltQueryError
     */
    void verifyConnectivity();

    /**
     * @brief Ferme les connexions inactives et refuse les emprunts suivants
     */
    void close();

    bool isClosed() const;
    size_t idleCount() const;
    size_t activeCount() const;

    const BoltConfig& config() const { return m_config; }
    const BoltAddress& address() const { return m_address; }

private:
    std::unique_ptr<BoltConnection> openConnection();
    void release(std::unique_ptr<BoltConnection> connection);

    BoltConfig m_config;
    BoltAddress m_address;

    std::vector<std::unique_ptr<BoltConnection>> m_idle;
    size_t m_active = 0;
    bool m_closed = false;
    mutable std::mutex m_mutex;
    std::condition_variable m_available;
};

} // namespace bolt
