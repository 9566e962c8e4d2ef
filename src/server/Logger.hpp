#pragma once

#include <string>
#include <iostream>
#include <cstdint>
#include <fstream>
#include <mutex>
#include <chrono>
#include <optional>
#include <atomic>
#include <unordered_map>

namespace graphstore {
namespace server {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Logger singleton - gestion centralisée des logs (serveur HTTP, client Bolt)
 */
class Logger {
public:
    static Logger& instance();

    // Configuration
    void setLevel(LogLevel level) { m_level = level; }
    bool isEnabled(LogLevel level) const { return level >= m_level; }

    /**
     * @brief Redirige les logs vers un fichier (ajout en fin de fichier)
     * @throws std::runtime_error si le fichier ne peut pas être ouvert
     */
    void enableFileLogging(const std::string& filepath);

    // Logging methods
    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);

    // Request/Response logging with request ID correlation
    uint64_t logRequest(const std::string& method, const std::string& target, const std::string& body = "");
    void logResponse(uint64_t requestId, int statusCode, const std::string& body, size_t bodySize = 0);

    // "debug", "info", "warn", "error"
    static std::optional<LogLevel> parseLevel(const std::string& name);

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& message);
    static std::string timestamp();
    static const char* levelTag(LogLevel level);
    static std::string truncate(const std::string& str, size_t maxLen = 500);

    std::atomic<LogLevel> m_level{LogLevel::INFO};
    std::ostream* m_output = &std::cout;
    std::ofstream m_fileStream;
    std::mutex m_mutex;

    // Request ID generation and timing
    std::atomic<uint64_t> m_requestIdCounter{0};
    std::unordered_map<uint64_t, std::chrono::steady_clock::time_point> m_requestStartTimes;
};

// Convenience macros
#define LOG_DEBUG(msg) graphstore::server::Logger::instance().debug(msg)
#define LOG_INFO(msg) graphstore::server::Logger::instance().info(msg)
#define LOG_WARN(msg) graphstore::server::Logger::instance().warn(msg)
#define LOG_ERROR(msg) graphstore::server::Logger::instance().error(msg)

} // namespace server
} // namespace graphstore
