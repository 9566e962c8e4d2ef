#pragma once

#include "bolt/BoltPool.hpp"
#include "server/Logger.hpp"
#include <map>
#include <string>
#include <vector>

namespace graphstore {
namespace server {

/**
 * @brief Configuration du serveur
 *
 * Priorité: valeurs par défaut < environnement < fichier (--config @file)
 * < arguments de la ligne de commande.
 */
struct ServerConfig {
    std::string address = "0.0.0.0";
    unsigned short port = 8000;
    unsigned threads = 4;

    bolt::BoltConfig bolt;
    std::string episodeLabel = "Episode";

    LogLevel logLevel = LogLevel::INFO;
    std::string logFile;
    bool enableProfiler = true;
    bool showHelp = false;

    /**
     * @brief Charge la configuration complète
     * @param env variables d'environnement (NEO4J_URI, NEO4J_USER, NEO4J_PASSWORD)
     * @throws std::invalid_argument sur une option ou une valeur invalide
     * @throws std::runtime_error si le fichier de configuration est illisible
     */
    static ServerConfig load(const std::vector<std::string>& args,
                             const std::map<std::string, std::string>& env);

    // Snapshot of the NEO4J_* variables of the current process
    static std::map<std::string, std::string> readEnvironment();

    /**
     * @brief Applique une clé (nom de l'option sans "--")
     * @throws std::invalid_argument
     */
    void set(const std::string& key, const std::string& value);

    // key=value lines, '#' comments, optional leading '@' on the path
    void applyFile(const std::string& path);

    void applyEnvironment(const std::map<std::string, std::string>& env);

    /**
     * @throws std::invalid_argument si la configuration est inutilisable
     */
    void validate() const;

    static std::string usage(const std::string& program);
};

} // namespace server
} // namespace graphstore
