#include <catch2/catch_test_macros.hpp>
#include "server/ServerConfig.hpp"
#include <filesystem>
#include <fstream>

using namespace graphstore::server;

namespace {

// Config file removed at scope exit
class TempConfigFile {
public:
    explicit TempConfigFile(const std::string& content)
        : m_path(std::filesystem::temp_directory_path() /
                 ("graphstore_config_" + std::to_string(++s_counter) + ".conf"))
    {
        std::ofstream out(m_path);
        out << content;
    }

    ~TempConfigFile() {
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
    }

    std::string path() const { return m_path.string(); }

private:
    static inline int s_counter = 0;
    std::filesystem::path m_path;
};

} // anonymous namespace

TEST_CASE("ServerConfig defaults", "[ServerConfig]") {
    ServerConfig config = ServerConfig::load({}, {});

    CHECK(config.address == "0.0.0.0");
    CHECK(config.port == 8000);
    CHECK(config.threads == 4);
    CHECK(config.bolt.uri == "bolt://localhost:7687");
    CHECK(config.bolt.user == "neo4j");
    CHECK(config.bolt.password.empty());
    CHECK(config.episodeLabel == "Episode");
    CHECK(config.logLevel == LogLevel::INFO);
    CHECK(config.enableProfiler);
    CHECK_FALSE(config.showHelp);
}

TEST_CASE("ServerConfig reads the environment", "[ServerConfig]") {
    ServerConfig config = ServerConfig::load({}, {
        {"NEO4J_URI", "bolt://graph.internal:7688"},
        {"NEO4J_USER", "svc"},
        {"NEO4J_PASSWORD", "pw"}
    });

    CHECK(config.bolt.uri == "bolt://graph.internal:7688");
    CHECK(config.bolt.user == "svc");
    CHECK(config.bolt.password == "pw");
    CHECK_NOTHROW(config.validate());
}

TEST_CASE("ServerConfig precedence: env < file < flags", "[ServerConfig]") {
    TempConfigFile file(
        "# graph access\n"
        "uri = bolt://from-file:7687\n"
        "user=file-user\n"
        "\n"
        "port=9000\n"
        "episode-label = Conversation\n");

    ServerConfig config = ServerConfig::load(
        {"--port", "9100", "--config", "@" + file.path()},
        {{"NEO4J_URI", "bolt://from-env:7687"}, {"NEO4J_USER", "env-user"}, {"NEO4J_PASSWORD", "pw"}});

    CHECK(config.bolt.uri == "bolt://from-file:7687");
    CHECK(config.bolt.user == "file-user");
    CHECK(config.bolt.password == "pw");
    CHECK(config.port == 9100);
    CHECK(config.episodeLabel == "Conversation");
}

TEST_CASE("ServerConfig command line flags", "[ServerConfig]") {
    ServerConfig config = ServerConfig::load({
        "-p", "8080", "-a", "127.0.0.1", "-t", "8", "-l", "debug",
        "--uri", "neo4j://db:7687", "--user", "admin", "--password", "s3cret",
        "--max-pool-size", "4",
        "--log-file", "/tmp/graphstore.log", "--no-profiler"
    }, {});

    CHECK(config.port == 8080);
    CHECK(config.address == "127.0.0.1");
    CHECK(config.threads == 8);
    CHECK(config.logLevel == LogLevel::DEBUG);
    CHECK(config.bolt.uri == "neo4j://db:7687");
    CHECK(config.bolt.user == "admin");
    CHECK(config.bolt.password == "s3cret");
    CHECK(config.bolt.maxPoolSize == 4);
    CHECK(config.logFile == "/tmp/graphstore.log");
    CHECK_FALSE(config.enableProfiler);
    CHECK_NOTHROW(config.validate());
}

TEST_CASE("ServerConfig help flag", "[ServerConfig]") {
    CHECK(ServerConfig::load({"--help"}, {}).showHelp);
    CHECK(ServerConfig::load({"-h"}, {}).showHelp);

    std::string usage = ServerConfig::usage("graphstore_server");
    CHECK(usage.find("Usage: graphstore_server") != std::string::npos);
    CHECK(usage.find("--episode-label") != std::string::npos);
}

TEST_CASE("ServerConfig rejects invalid values", "[ServerConfig]") {
    CHECK_THROWS_AS(ServerConfig::load({"--port", "0"}, {}), std::invalid_argument);
    CHECK_THROWS_AS(ServerConfig::load({"--port", "70000"}, {}), std::invalid_argument);
    CHECK_THROWS_AS(ServerConfig::load({"--port", "80x"}, {}), std::invalid_argument);
    CHECK_THROWS_AS(ServerConfig::load({"--threads", "-2"}, {}), std::invalid_argument);
    CHECK_THROWS_AS(ServerConfig::load({"--log-level", "verbose"}, {}), std::invalid_argument);
    CHECK_THROWS_AS(ServerConfig::load({"--unknown", "x"}, {}), std::invalid_argument);
    CHECK_THROWS_AS(ServerConfig::load({"stray"}, {}), std::invalid_argument);
    CHECK_THROWS_AS(ServerConfig::load({"--port"}, {}), std::invalid_argument);
    CHECK_THROWS_AS(ServerConfig::load({"--config"}, {}), std::invalid_argument);

    ServerConfig config;
    CHECK_THROWS_AS(config.set("profiler", "maybe"), std::invalid_argument);
    config.set("profiler", "off");
    CHECK_FALSE(config.enableProfiler);
}

TEST_CASE("ServerConfig reports file errors with their line", "[ServerConfig]") {
    TempConfigFile file("port=8000\nnot a pair\n");
    try {
        ServerConfig::load({"--config", file.path()}, {});
        FAIL("expected std::invalid_argument");
    } catch (const std::invalid_argument& e) {
        CHECK(std::string(e.what()).find(":2:") != std::string::npos);
    }

    CHECK_THROWS_AS(ServerConfig::load({"--config", "/nonexistent/graphstore.conf"}, {}),
                    std::runtime_error);
}

TEST_CASE("ServerConfig validation", "[ServerConfig]") {
    ServerConfig config;
    CHECK_THROWS_AS(config.validate(), std::invalid_argument);  // no password

    config.bolt.password = "pw";
    CHECK_NOTHROW(config.validate());

    config.bolt.uri = "bolt+s://secure:7687";
    CHECK_THROWS_AS(config.validate(), std::invalid_argument);

    config.bolt.uri = "http://localhost:7474";
    CHECK_THROWS_AS(config.validate(), std::invalid_argument);

    config.bolt.uri = "bolt://localhost:7687";
    config.bolt.user = "";
    CHECK_THROWS_AS(config.validate(), std::invalid_argument);
}
