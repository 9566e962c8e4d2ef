#include "graph/SessionGateway.hpp"
#include "graph/GraphErrors.hpp"
#include "server/Logger.hpp"

namespace graph {

SessionGateway::SessionGateway(bolt::BoltPool& pool)
    : m_pool(pool)
{
}

std::optional<bolt::Record> SessionGateway::single(const Query& query) {
    try {
        auto session = m_pool.acquire();
        // Only the first record is needed, the rest of the stream is discarded
        auto result = session.run(query.text, query.params, query.columns, 1);
        if (result.records.empty()) {
            return std::nullopt;
        }
        return std::move(result.records.front());
    } catch (const bolt::BoltConnectionError& e) {
        throw ConnectionError(std::string("Graph database unavailable: ") + e.what());
    } catch (const bolt::BoltQueryError& e) {
        LOG_DEBUG("Query failed: " + query.text);
        throw EngineQueryError(e.what());
    }
}

} // namespace graph
