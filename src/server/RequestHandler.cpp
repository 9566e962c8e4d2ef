#include "server/RequestHandler.hpp"
#include "graph/GraphErrors.hpp"
#include "graph/QueryBuilder.hpp"
#include "server/Logger.hpp"

namespace graphstore {
namespace server {

namespace {

const std::string kNodesPrefix = "/nodes/";

json errorBody(const std::string& message) {
    return json{{"status", "error"}, {"message", message}};
}

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// %XX escapes of one path segment ('+' is literal in a path)
std::string decodePathSegment(const std::string& segment) {
    std::string decoded;
    decoded.reserve(segment.size());
    for (size_t i = 0; i < segment.size(); ++i) {
        if (segment[i] != '%') {
            decoded += segment[i];
            continue;
        }
        int hi = i + 2 < segment.size() ? hexDigit(segment[i + 1]) : -1;
        int lo = hi >= 0 ? hexDigit(segment[i + 2]) : -1;
        if (lo < 0) {
            throw BadRequestError("Invalid percent-encoding in path: " + segment);
        }
        decoded += static_cast<char>(hi * 16 + lo);
        i += 2;
    }
    return decoded;
}

json parseBody(const std::string& body) {
    json request;
    try {
        request = json::parse(body);
    } catch (const json::parse_error& e) {
        throw BadRequestError("Invalid JSON: " + std::string(e.what()));
    }
    if (!request.is_object()) {
        throw BadRequestError("Request body must be a JSON object");
    }
    return request;
}

std::string requireString(const json& request, const std::string& key) {
    auto it = request.find(key);
    if (it == request.end() || it->is_null()) {
        throw BadRequestError("Missing required field: " + key);
    }
    if (!it->is_string()) {
        throw BadRequestError("Field '" + key + "' must be a string");
    }
    return it->get<std::string>();
}

std::optional<std::string> optionalString(const json& request, const std::string& key) {
    auto it = request.find(key);
    if (it == request.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw BadRequestError("Field '" + key + "' must be a string or null");
    }
    return it->get<std::string>();
}

json optionalToJson(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

} // anonymous namespace

RequestHandler::RequestHandler(graph::NodeRepository& nodes,
                               graph::RelationshipRepository& relationships,
                               graph::StatsAggregator& stats,
                               graph::QueryRunner& runner)
    : m_nodes(nodes)
    , m_relationships(relationships)
    , m_stats(stats)
    , m_runner(runner)
{
}

// =============================================================================
// JSON representations
// =============================================================================

std::string RequestHandler::serialize(const json& body) {
    return body.dump(-1, ' ', false, json::error_handler_t::replace);
}

json RequestHandler::nodeToJson(const graph::Node& node) {
    return json{
        {"uuid", node.uuid},
        {"name", node.name},
        {"summary", optionalToJson(node.summary)},
        {"group_id", optionalToJson(node.groupId)},
        {"created_at", node.createdAt},
        {"type", node.type}
    };
}

json RequestHandler::relationshipToJson(const graph::Relationship& relationship) {
    return json{
        {"uuid", relationship.uuid},
        {"source_uuid", relationship.sourceUuid},
        {"target_uuid", relationship.targetUuid},
        {"type", relationship.type},
        {"summary", optionalToJson(relationship.summary)},
        {"group_id", optionalToJson(relationship.groupId)},
        {"created_at", relationship.createdAt}
    };
}

json RequestHandler::statsToJson(const graph::GraphStats& stats) {
    json nodeTypes = json::array();
    for (const auto& type : stats.nodeTypes) {
        nodeTypes.push_back(type);
    }
    json relationshipTypes = json::array();
    for (const auto& type : stats.relationshipTypes) {
        relationshipTypes.push_back(type);
    }

    return json{
        {"total_nodes", stats.totalNodes},
        {"total_relationships", stats.totalRelationships},
        {"total_episodes", stats.totalEpisodes},
        {"node_types", nodeTypes},
        {"relationship_types", relationshipTypes}
    };
}

// =============================================================================
// Handlers
// =============================================================================

RouteResult RequestHandler::handleRoot() {
    return {200, json{
        {"name", "GraphStore"},
        {"version", "1.0.0"},
        {"description", "Dynamic property graph store"},
        {"endpoints", {
            {"health", "GET /health"},
            {"nodes", {
                {"add", "POST /nodes/add"},
                {"get", "GET /nodes/{uuid}"},
                {"update", "PUT /nodes/update"},
                {"delete", "DELETE /nodes/delete"}
            }},
            {"relationships", {
                {"add", "POST /relationships/add"}
            }},
            {"graph", {
                {"stats", "GET /graph/stats"}
            }}
        }}
    }};
}

RouteResult RequestHandler::handleHealth() {
    try {
        m_runner.single(graph::QueryBuilder::ping());
    } catch (const graph::GraphError& e) {
        LOG_WARN(std::string("Health check failed: ") + e.what());
        return {503, json{
            {"status", "unhealthy"},
            {"database", "disconnected"},
            {"message", e.what()}
        }};
    }
    return {200, json{{"status", "healthy"}, {"database", "connected"}}};
}

RouteResult RequestHandler::handleAddNode(const json& request) {
    auto node = m_nodes.createNode(
        requireString(request, "name"),
        requireString(request, "node_type"),
        optionalString(request, "summary"),
        optionalString(request, "group_id"));

    return {200, json{
        {"status", "ok"},
        {"message", "Node created successfully"},
        {"node", nodeToJson(node)}
    }};
}

RouteResult RequestHandler::handleGetNode(const std::string& uuid) {
    auto node = m_nodes.getNode(uuid);
    if (!node) {
        return {404, errorBody("Node not found: " + uuid)};
    }
    return {200, json{{"status", "ok"}, {"node", nodeToJson(*node)}}};
}

RouteResult RequestHandler::handleUpdateNode(const json& request) {
    auto node = m_nodes.updateNode(
        requireString(request, "uuid"),
        optionalString(request, "name"),
        optionalString(request, "summary"));

    return {200, json{
        {"status", "ok"},
        {"message", "Node updated successfully"},
        {"node", nodeToJson(node)}
    }};
}

RouteResult RequestHandler::handleDeleteNode(const json& request) {
    std::string uuid = requireString(request, "uuid");
    if (!m_nodes.deleteNode(uuid)) {
        return {404, errorBody("Node not found: " + uuid)};
    }
    return {200, json{
        {"status", "ok"},
        {"message", "Node deleted successfully"},
        {"deleted_uuid", uuid}
    }};
}

RouteResult RequestHandler::handleAddRelationship(const json& request) {
    auto relationship = m_relationships.createRelationship(
        requireString(request, "source_node_uuid"),
        requireString(request, "target_node_uuid"),
        requireString(request, "relationship_type"),
        optionalString(request, "summary"),
        optionalString(request, "group_id"));

    return {200, json{
        {"status", "ok"},
        {"message", "Relationship created successfully"},
        {"relationship", relationshipToJson(relationship)}
    }};
}

RouteResult RequestHandler::handleGraphStats() {
    return {200, json{{"status", "ok"}, {"stats", statsToJson(m_stats.collect())}}};
}

// =============================================================================
// Routing
// =============================================================================

std::optional<RouteResult> RequestHandler::route(const std::string& method,
                                                 const std::string& path,
                                                 const std::string& body) {
    if (method == "GET" && path == "/") {
        return handleRoot();
    }
    if (method == "GET" && path == "/health") {
        return handleHealth();
    }
    if (method == "POST" && path == "/nodes/add") {
        return handleAddNode(parseBody(body));
    }
    if (method == "PUT" && path == "/nodes/update") {
        return handleUpdateNode(parseBody(body));
    }
    if (method == "DELETE" && path == "/nodes/delete") {
        return handleDeleteNode(parseBody(body));
    }
    if (method == "POST" && path == "/relationships/add") {
        return handleAddRelationship(parseBody(body));
    }
    if (method == "GET" && path == "/graph/stats") {
        return handleGraphStats();
    }

    // GET /nodes/{uuid}
    if (method == "GET" && path.rfind(kNodesPrefix, 0) == 0) {
        std::string segment = path.substr(kNodesPrefix.size());
        if (!segment.empty() && segment.find('/') == std::string::npos) {
            std::string uuid = decodePathSegment(segment);
            if (!uuid.empty()) {
                return handleGetNode(uuid);
            }
        }
    }

    return std::nullopt;
}

RouteResult RequestHandler::dispatch(const std::string& method,
                                     const std::string& target,
                                     const std::string& body) {
    std::string path = target.substr(0, target.find('?'));

    try {
        auto result = route(method, path, body);
        if (!result) {
            return {404, errorBody("Not found: " + method + " " + path)};
        }
        return *result;
    } catch (const BadRequestError& e) {
        LOG_WARN(method + " " + path + ": " + e.what());
        return {400, errorBody(e.what())};
    } catch (const graph::InvalidLabelError& e) {
        LOG_WARN(method + " " + path + ": " + e.what());
        return {400, errorBody(e.what())};
    } catch (const graph::NotFoundError& e) {
        LOG_WARN(method + " " + path + ": " + e.what());
        return {404, errorBody(e.what())};
    } catch (const graph::EndpointNotFoundError& e) {
        LOG_WARN(method + " " + path + ": " + e.what());
        return {404, errorBody("One or both nodes not found")};
    } catch (const graph::ConnectionError& e) {
        LOG_ERROR(method + " " + path + ": " + e.what());
        return {503, errorBody(e.what())};
    } catch (const graph::EngineQueryError& e) {
        LOG_ERROR(method + " " + path + ": " + e.what());
        return {500, errorBody(e.what())};
    } catch (const std::exception& e) {
        LOG_ERROR(method + " " + path + ": " + e.what());
        return {500, errorBody(e.what())};
    }
}

} // namespace server
} // namespace graphstore
