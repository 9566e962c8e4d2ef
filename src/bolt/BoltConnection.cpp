#include "bolt/BoltConnection.hpp"
#include "bolt/MgValue.hpp"
#include "server/Logger.hpp"
#include <mgclient.hpp>

#define BOLT_LOG_DEBUG(msg) LOG_DEBUG(std::string("[BOLT] ") + (msg))

namespace bolt {

BoltConnection::BoltConnection(std::string host, unsigned short port, Options options)
    : m_host(std::move(host))
    , m_port(port)
    , m_options(std::move(options))
{
}

BoltConnection::~BoltConnection() {
    close();
}

void BoltConnection::open(const std::string& user, const std::string& password) {
    if (m_client) {
        return;
    }

    BOLT_LOG_DEBUG("Opening connection to " + endpoint());

    mg::Client::Params params;
    params.host = m_host;
    params.port = m_port;
    params.username = user;
    params.password = password;
    params.use_ssl = false;
    params.user_agent = m_options.userAgent;

    m_client = mg::Client::Connect(params);
    if (!m_client) {
        m_broken = true;
        throw BoltConnectionError("Cannot connect to " + endpoint() +
                                  " (engine unreachable or authentication refused)");
    }
    m_broken = false;

    BOLT_LOG_DEBUG("Connected to " + endpoint());
}

QueryResult BoltConnection::run(const std::string& query,
                                const Value::Map& params,
                                const std::vector<std::string>& columns,
                                int64_t limit) {
    if (!m_client || m_broken) {
        throw BoltConnectionError("Connection to " + endpoint() + " is not open");
    }

    try {
        mg::Map bound = toMgMap(params);
        if (!m_client->Execute(query, bound.AsConstMap())) {
            m_broken = true;
            throw BoltQueryError("Query rejected by " + endpoint());
        }

        QueryResult result;
        auto fields = std::make_shared<const std::vector<std::string>>(columns);

        // The whole stream must be consumed before the next query
        while (auto row = m_client->FetchOne()) {
            if (limit >= 0 && static_cast<int64_t>(result.records.size()) >= limit) {
                continue;
            }
            std::vector<Value> values;
            values.reserve(row->size());
            for (const auto& item : *row) {
                values.push_back(fromMgValue(item.AsConstValue()));
            }
            result.records.emplace_back(fields, std::move(values));
        }
        return result;
    } catch (const BoltQueryError&) {
        throw;
    } catch (const std::exception& e) {
        m_broken = true;
        throw BoltQueryError("Query failed on " + endpoint() + ": " + e.what());
    } catch (...) {
        m_broken = true;
        throw;
    }
}

void BoltConnection::close() {
    if (m_client) {
        BOLT_LOG_DEBUG("Closing connection to " + endpoint());
        m_client.reset();
    }
}

} // namespace bolt
