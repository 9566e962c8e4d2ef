#include "server/ServerConfig.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace graphstore {
namespace server {

namespace {

std::string trim(std::string s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) s.pop_back();
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.erase(s.begin());
    return s;
}

unsigned long parseNumber(const std::string& key, const std::string& value,
                          unsigned long min, unsigned long max) {
    unsigned long number = 0;
    size_t pos = 0;
    try {
        number = std::stoul(value, &pos);
    } catch (const std::logic_error&) {
        pos = 0;
    }
    if (pos == 0 || pos != value.size() || value[0] == '-' || number < min || number > max) {
        throw std::invalid_argument("Invalid value for " + key + ": '" + value + "' (expected " +
                                    std::to_string(min) + "-" + std::to_string(max) + ")");
    }
    return number;
}

bool parseBool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "on" || value == "1" || value == "yes") return true;
    if (value == "false" || value == "off" || value == "0" || value == "no") return false;
    throw std::invalid_argument("Invalid boolean for " + key + ": '" + value + "'");
}

// Short flag aliases
std::string canonicalFlag(const std::string& arg) {
    if (arg == "-p") return "port";
    if (arg == "-a") return "address";
    if (arg == "-t") return "threads";
    if (arg == "-l") return "log-level";
    if (arg.rfind("--", 0) == 0) return arg.substr(2);
    return "";
}

} // anonymous namespace

void ServerConfig::set(const std::string& key, const std::string& value) {
    if (key == "port") {
        port = static_cast<unsigned short>(parseNumber(key, value, 1, 65535));
    } else if (key == "address") {
        address = value;
    } else if (key == "threads") {
        threads = static_cast<unsigned>(parseNumber(key, value, 1, 256));
    } else if (key == "uri") {
        bolt.uri = value;
    } else if (key == "user") {
        bolt.user = value;
    } else if (key == "password") {
        bolt.password = value;
    } else if (key == "max-pool-size") {
        bolt.maxPoolSize = parseNumber(key, value, 1, 1024);
    } else if (key == "episode-label") {
        episodeLabel = value;
    } else if (key == "log-level") {
        auto level = Logger::parseLevel(value);
        if (!level) {
            throw std::invalid_argument("Invalid log level: '" + value + "' (debug, info, warn, error)");
        }
        logLevel = *level;
    } else if (key == "log-file") {
        logFile = value;
    } else if (key == "profiler") {
        enableProfiler = parseBool(key, value);
    } else {
        throw std::invalid_argument("Unknown option: " + key);
    }
}

void ServerConfig::applyEnvironment(const std::map<std::string, std::string>& env) {
    auto it = env.find("NEO4J_URI");
    if (it != env.end() && !it->second.empty()) bolt.uri = it->second;
    it = env.find("NEO4J_USER");
    if (it != env.end() && !it->second.empty()) bolt.user = it->second;
    it = env.find("NEO4J_PASSWORD");
    if (it != env.end()) bolt.password = it->second;
}

void ServerConfig::applyFile(const std::string& path) {
    std::string filePath = (!path.empty() && path[0] == '@') ? path.substr(1) : path;
    std::ifstream file(filePath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filePath);
    }

    std::string line;
    int lineNumber = 0;
    while (std::getline(file, line)) {
        ++lineNumber;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument(filePath + ":" + std::to_string(lineNumber) +
                                        ": expected key=value");
        }
        try {
            set(trim(line.substr(0, eq)), trim(line.substr(eq + 1)));
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument(filePath + ":" + std::to_string(lineNumber) + ": " + e.what());
        }
    }
}

std::map<std::string, std::string> ServerConfig::readEnvironment() {
    std::map<std::string, std::string> env;
    for (const char* name : {"NEO4J_URI", "NEO4J_USER", "NEO4J_PASSWORD"}) {
        if (const char* value = std::getenv(name)) {
            env[name] = value;
        }
    }
    return env;
}

ServerConfig ServerConfig::load(const std::vector<std::string>& args,
                                const std::map<std::string, std::string>& env) {
    ServerConfig config;
    config.applyEnvironment(env);

    // First pass: configuration file, overridden by every other flag
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("Missing value for --config");
            }
            config.applyFile(args[++i]);
        }
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            config.showHelp = true;
        } else if (arg == "--no-profiler") {
            config.enableProfiler = false;
        } else if (arg == "--config") {
            ++i;
        } else {
            std::string key = canonicalFlag(arg);
            if (key.empty()) {
                throw std::invalid_argument("Unexpected argument: " + arg);
            }
            if (i + 1 >= args.size()) {
                throw std::invalid_argument("Missing value for " + arg);
            }
            config.set(key, args[++i]);
        }
    }

    return config;
}

void ServerConfig::validate() const {
    if (bolt.password.empty()) {
        throw std::invalid_argument("NEO4J_PASSWORD environment variable (or --password) is required");
    }
    if (bolt.user.empty()) {
        throw std::invalid_argument("Database user must not be empty");
    }
    // Throws on an unsupported scheme or a malformed URI
    bolt::parseBoltUri(bolt.uri);
}

std::string ServerConfig::usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options]\n"
        << "Options:\n"
        << "  -p, --port PORT          Port to listen on (default: 8000)\n"
        << "  -a, --address ADDR       Address to bind to (default: 0.0.0.0)\n"
        << "  -t, --threads N          HTTP worker threads (default: 4)\n"
        << "  --uri URI                Graph database URI (default: $NEO4J_URI or bolt://localhost:7687)\n"
        << "  --user USER              Database user (default: $NEO4J_USER or neo4j)\n"
        << "  --password PASSWORD      Database password (default: $NEO4J_PASSWORD, required)\n"
        << "  --max-pool-size N        Maximum database connections (default: 16)\n"
        << "  --episode-label LABEL    Label counted as episodes in stats (default: Episode)\n"
        << "  --config FILE            Options file (key=value lines, @file syntax)\n"
        << "  -l, --log-level LVL      Log level: debug, info, warn, error (default: info)\n"
        << "  --log-file PATH          Append logs to PATH instead of stdout\n"
        << "  --no-profiler            Disable profiler\n"
        << "  -h, --help               Show this help\n";
    return oss.str();
}

} // namespace server
} // namespace graphstore
