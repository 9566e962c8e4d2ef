#include "bolt/BoltPool.hpp"
#include "server/Logger.hpp"
#include <mgclient.hpp>
#include <mutex>
#include <stdexcept>

#define BOLT_LOG_INFO(msg) LOG_INFO(std::string("[BOLT] ") + (msg))
#define BOLT_LOG_DEBUG(msg) LOG_DEBUG(std::string("[BOLT] ") + (msg))
#define BOLT_LOG_WARN(msg) LOG_WARN(std::string("[BOLT] ") + (msg))

namespace bolt {

BoltAddress parseBoltUri(const std::string& uri) {
    auto sep = uri.find("://");
    if (sep == std::string::npos || sep == 0) {
        throw std::invalid_argument("Invalid Bolt URI (expected scheme://host[:port]): " + uri);
    }

    BoltAddress address;
    address.scheme = uri.substr(0, sep);
    if (address.scheme == "bolt+s" || address.scheme == "bolt+ssc" ||
        address.scheme == "neo4j+s" || address.scheme == "neo4j+ssc") {
        throw std::invalid_argument("TLS connections are not supported: " + uri);
    }
    if (address.scheme != "bolt" && address.scheme != "neo4j") {
        throw std::invalid_argument("Unsupported URI scheme '" + address.scheme + "': " + uri);
    }

    // Drop path and routing context
    std::string authority = uri.substr(sep + 3);
    auto end = authority.find_first_of("/?");
    if (end != std::string::npos) {
        authority = authority.substr(0, end);
    }

    std::string portPart;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            throw std::invalid_argument("Unterminated IPv6 address in URI: " + uri);
        }
        address.host = authority.substr(1, close - 1);
        std::string rest = authority.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') {
                throw std::invalid_argument("Invalid Bolt URI: " + uri);
            }
            portPart = rest.substr(1);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string::npos) {
            address.host = authority.substr(0, colon);
            portPart = authority.substr(colon + 1);
        } else {
            address.host = authority;
        }
    }

    if (address.host.empty()) {
        throw std::invalid_argument("Missing host in Bolt URI: " + uri);
    }

    if (!portPart.empty()) {
        int port = 0;
        try {
            size_t pos = 0;
            port = std::stoi(portPart, &pos);
            if (pos != portPart.size()) {
                port = 0;
            }
        } catch (const std::logic_error&) {
            port = 0;
        }
        if (port <= 0 || port > 65535) {
            throw std::invalid_argument("Invalid port in Bolt URI: " + uri);
        }
        address.port = static_cast<unsigned short>(port);
    }

    return address;
}

// =============================================================================
// Session
// =============================================================================

BoltPool::Session::Session(BoltPool* pool, std::unique_ptr<BoltConnection> connection)
    : m_pool(pool)
    , m_connection(std::move(connection))
{
}

BoltPool::Session::Session(Session&& other) noexcept
    : m_pool(other.m_pool)
    , m_connection(std::move(other.m_connection))
{
    other.m_pool = nullptr;
}

BoltPool::Session& BoltPool::Session::operator=(Session&& other) noexcept {
    if (this != &other) {
        release();
        m_pool = other.m_pool;
        m_connection = std::move(other.m_connection);
        other.m_pool = nullptr;
    }
    return *this;
}

BoltPool::Session::~Session() {
    release();
}

void BoltPool::Session::release() {
    if (m_pool && m_connection) {
        m_pool->release(std::move(m_connection));
    }
    m_pool = nullptr;
}

QueryResult BoltPool::Session::run(const std::string& query,
                                   const Value::Map& params,
                                   const std::vector<std::string>& columns,
                                   int64_t limit) {
    if (!m_connection) {
        throw BoltConnectionError("Session has been released");
    }
    return m_connection->run(query, params, columns, limit);
}

// =============================================================================
// BoltPool
// =============================================================================

namespace {
std::once_flag g_clientInit;
}

BoltPool::BoltPool(BoltConfig config)
    : m_config(std::move(config))
    , m_address(parseBoltUri(m_config.uri))
{
    if (m_config.maxPoolSize == 0) {
        throw std::invalid_argument("Bolt pool size must be at least 1");
    }
    std::call_once(g_clientInit, [] {
        if (mg::Client::Init() != 0) {
            throw BoltConnectionError("Cannot initialize the Bolt client library");
        }
    });
    BOLT_LOG_INFO("BoltPool configured for " + m_address.host + ":" +
                  std::to_string(m_address.port) + " (max " +
                  std::to_string(m_config.maxPoolSize) + " connections)");
}

BoltPool::~BoltPool() {
    close();
}

std::unique_ptr<BoltConnection> BoltPool::openConnection() {
    BoltConnection::Options options;
    options.userAgent = m_config.userAgent;

    auto connection = std::make_unique<BoltConnection>(m_address.host, m_address.port, options);
    connection->open(m_config.user, m_config.password);
    return connection;
}

BoltPool::Session BoltPool::acquire() {
    std::unique_lock<std::mutex> lock(m_mutex);
    auto deadline = std::chrono::steady_clock::now() + m_config.acquireTimeout;

    for (;;) {
        if (m_closed) {
            throw BoltConnectionError("Bolt connection pool is closed");
        }

        if (!m_idle.empty()) {
            auto connection = std::move(m_idle.back());
            m_idle.pop_back();
            ++m_active;
            return Session(this, std::move(connection));
        }

        if (m_active < m_config.maxPoolSize) {
            ++m_active;
            lock.unlock();
            auto giveBack = [this] {
                {
                    std::lock_guard<std::mutex> relock(m_mutex);
                    --m_active;
                }
                m_available.notify_one();
            };
            try {
                return Session(this, openConnection());
            } catch (const std::exception& e) {
                BOLT_LOG_WARN(std::string("Connection failed: ") + e.what());
                giveBack();
                throw;
            } catch (...) {
                giveBack();
                throw;
            }
        }

        if (m_available.wait_until(lock, deadline) == std::cv_status::timeout &&
            m_idle.empty() && m_active >= m_config.maxPoolSize) {
            throw BoltConnectionError("Timed out waiting for a Bolt connection (" +
                                      std::to_string(m_config.maxPoolSize) + " in use)");
        }
    }
}

void BoltPool::release(std::unique_ptr<BoltConnection> connection) {
    std::unique_ptr<BoltConnection> discarded;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        --m_active;
        if (connection->isBroken() || !connection->isOpen() || m_closed) {
            discarded = std::move(connection);
        } else {
            m_idle.push_back(std::move(connection));
        }
    }
    m_available.notify_one();

    // Close outside the lock
    if (discarded) {
        if (discarded->isBroken()) {
            BOLT_LOG_DEBUG("Discarding broken connection to " + discarded->endpoint());
        }
        discarded->close();
    }
}

void BoltPool::verifyConnectivity() {
    auto session = acquire();
    auto result = session.run("RETURN 1 AS ok", {}, {"ok"}, 1);
    if (result.records.empty()) {
        throw BoltConnectionError("Connectivity check returned no record");
    }
    BOLT_LOG_INFO("Engine reachable at " + session.connection().endpoint());
}

void BoltPool::close() {
    std::vector<std::unique_ptr<BoltConnection>> idle;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return;
        }
        m_closed = true;
        idle.swap(m_idle);
    }
    m_available.notify_all();

    for (auto& connection : idle) {
        connection->close();
    }
    BOLT_LOG_INFO("BoltPool closed (" + std::to_string(idle.size()) + " idle connections)");
}

bool BoltPool::isClosed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

size_t BoltPool::idleCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_idle.size();
}

size_t BoltPool::activeCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_active;
}

} // namespace bolt
