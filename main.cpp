#include "server/HttpServer.hpp"
#include "server/RequestHandler.hpp"
#include "server/ServerConfig.hpp"
#include "server/Logger.hpp"
#include "server/Profiler.hpp"
#include "bolt/BoltPool.hpp"
#include "graph/NodeRepository.hpp"
#include "graph/RelationshipRepository.hpp"
#include "graph/SessionGateway.hpp"
#include "graph/StatsAggregator.hpp"
#include <mgclient.hpp>
#include <iostream>
#include <csignal>
#include <functional>
#include <thread>
#include <vector>

using namespace graphstore::server;

namespace {
    std::function<void()> shutdown_handler;
    void signal_handler(int) {
        if (shutdown_handler) shutdown_handler();
    }
}

int main(int argc, char* argv[]) {
    int status = 0;
    try {
        ServerConfig config = ServerConfig::load(
            std::vector<std::string>(argv + 1, argv + argc),
            ServerConfig::readEnvironment());

        if (config.showHelp) {
            std::cout << ServerConfig::usage(argv[0]);
            return 0;
        }
        config.validate();

        // Configure Logger
        Logger::instance().setLevel(config.logLevel);
        if (!config.logFile.empty()) {
            Logger::instance().enableFileLogging(config.logFile);
        }

        // Configure Profiler
        Profiler::instance().setEnabled(config.enableProfiler);

        LOG_INFO("=== GraphStore ===");

        // Pool de connexions: ouvert ici, fermé à l'arrêt
        bolt::BoltPool pool(config.bolt);
        pool.verifyConnectivity();

        graph::SessionGateway gateway(pool);
        graph::NodeRepository nodes(gateway);
        graph::RelationshipRepository relationships(gateway);
        graph::StatsAggregator stats(gateway, config.episodeLabel);
        RequestHandler handler(nodes, relationships, stats, gateway);

        // Créer le contexte IO
        net::io_context ioc{static_cast<int>(config.threads)};

        // Créer et démarrer le serveur
        HttpServer server(ioc, config.address, config.port, handler);
        server.run();

        // Gérer le signal d'arrêt
        shutdown_handler = [&]() {
            server.stop();
            ioc.stop();
        };
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        LOG_INFO("Endpoints:");
        LOG_INFO("  GET    /                   - Service description");
        LOG_INFO("  GET    /health             - Health check");
        LOG_INFO("  POST   /nodes/add          - Create a node");
        LOG_INFO("  GET    /nodes/{uuid}       - Get a node");
        LOG_INFO("  PUT    /nodes/update       - Update a node");
        LOG_INFO("  DELETE /nodes/delete       - Delete a node and its relationships");
        LOG_INFO("  POST   /relationships/add  - Create a relationship");
        LOG_INFO("  GET    /graph/stats        - Graph statistics");

        // Lancer la boucle d'événements sur N threads
        std::vector<std::thread> workers;
        workers.reserve(config.threads - 1);
        for (unsigned i = 1; i < config.threads; ++i) {
            workers.emplace_back([&ioc]() { ioc.run(); });
        }
        ioc.run();
        for (auto& worker : workers) {
            worker.join();
        }

        LOG_INFO("Shutting down...");
        pool.close();

        // Afficher les stats du profiler
        if (Profiler::instance().isEnabled()) {
            std::cout << Profiler::instance().formatStats() << std::endl;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        status = 1;
    }

    // Every connection is gone with the pool
    mg::Client::Finalize();
    return status;
}
