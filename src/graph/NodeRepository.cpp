#include "graph/NodeRepository.hpp"
#include "graph/GraphErrors.hpp"
#include "graph/Identifiers.hpp"
#include "graph/LabelSanitizer.hpp"
#include "graph/QueryBuilder.hpp"
#include "server/Logger.hpp"
#include "server/Profiler.hpp"
#include <iomanip>
#include <sstream>

namespace graph {

namespace {

const char* kUnknownType = "Unknown";

// Properties written by other clients may hold numbers or temporal values
std::string propertyText(const std::string& key, const bolt::Value& value) {
    switch (value.type()) {
        case bolt::Value::Type::String:
            return value.asString();
        case bolt::Value::Type::Int:
            return std::to_string(value.asInt());
        case bolt::Value::Type::Bool:
            return value.asBool() ? "true" : "false";
        case bolt::Value::Type::Double: {
            std::ostringstream oss;
            oss << std::setprecision(15) << value.asDouble();
            return oss.str();
        }
        case bolt::Value::Type::Structure: {
            const bolt::Structure& structure = value.asStructure();
            const auto& fields = structure.fields;
            if (structure.tag == bolt::signature::Date && fields.size() == 1) {
                return formatTimestamp(fields[0].asInt() * 86400, 0).substr(0, 10);
            }
            if ((structure.tag == bolt::signature::LocalDateTime ||
                 structure.tag == bolt::signature::DateTime) && fields.size() >= 2) {
                return formatTimestamp(fields[0].asInt(), fields[1].asInt());
            }
            break;
        }
        default:
            break;
    }
    throw MalformedRecordError("Property '" + key + "' holds a " +
                               bolt::Value::typeName(value.type()) +
                               " that cannot be read as text");
}

std::string stringProperty(const bolt::Value::Map& properties, const std::string& key) {
    auto it = properties.find(key);
    if (it == properties.end() || it->second.isNull()) {
        return "";
    }
    return propertyText(key, it->second);
}

std::optional<std::string> optionalProperty(const bolt::Value::Map& properties,
                                            const std::string& key) {
    auto it = properties.find(key);
    if (it == properties.end() || it->second.isNull()) {
        return std::nullopt;
    }
    return propertyText(key, it->second);
}

} // anonymous namespace

NodeRepository::NodeRepository(QueryRunner& runner)
    : m_runner(runner)
{
}

std::string NodeRepository::typeFromLabels(const std::vector<std::string>& labels) {
    for (const auto& label : labels) {
        if (label != kEntityLabel) {
            return label;
        }
    }
    return kUnknownType;
}

Node NodeRepository::fromRecord(const bolt::Record& record) {
    if (!record.has("n") || !record.get("n").isVertex()) {
        throw MalformedRecordError("Expected a node in column 'n'");
    }
    const bolt::Vertex& vertex = record.get("n").asVertex();

    std::vector<std::string> labels;
    if (record.has("labels") && record.get("labels").isList()) {
        for (const auto& label : record.get("labels").asList()) {
            labels.push_back(propertyText("labels", label));
        }
    } else {
        labels = vertex.labels;
    }

    Node node;
    node.uuid = stringProperty(vertex.properties, "uuid");
    node.name = stringProperty(vertex.properties, "name");
    node.type = typeFromLabels(labels);
    node.summary = optionalProperty(vertex.properties, "summary");
    node.groupId = optionalProperty(vertex.properties, "group_id");
    node.createdAt = stringProperty(vertex.properties, "created_at");
    return node;
}

Node NodeRepository::createNode(const std::string& name,
                                const std::string& type,
                                const std::optional<std::string>& summary,
                                const std::optional<std::string>& groupId) {
    PROFILE_SCOPE("node.create");

    SafeLabel label = LabelSanitizer::sanitizeNodeType(type);

    Node draft;
    draft.uuid = generateUuid();
    draft.name = name;
    draft.type = type;
    draft.summary = summary;
    draft.groupId = groupId;
    draft.createdAt = currentTimestamp();

    auto record = m_runner.single(QueryBuilder::createNode(label, draft));
    if (!record) {
        throw CreateFailedError("Node creation returned no record (type " + type + ")");
    }

    Node node = fromRecord(*record);
    LOG_INFO("Node created: " + node.uuid + " (" + node.type + ")");
    return node;
}

std::optional<Node> NodeRepository::getNode(const std::string& uuid) {
    PROFILE_SCOPE("node.get");

    auto record = m_runner.single(QueryBuilder::getNode(uuid));
    if (!record) {
        return std::nullopt;
    }
    return fromRecord(*record);
}

Node NodeRepository::updateNode(const std::string& uuid,
                                const std::optional<std::string>& name,
                                const std::optional<std::string>& summary) {
    PROFILE_SCOPE("node.update");

    auto query = QueryBuilder::updateNode(uuid, name, summary);
    if (!query) {
        auto current = m_runner.single(QueryBuilder::getNode(uuid));
        if (!current) {
            throw NotFoundError(uuid);
        }
        return fromRecord(*current);
    }

    auto record = m_runner.single(*query);
    if (!record) {
        throw NotFoundError(uuid);
    }
    return fromRecord(*record);
}

bool NodeRepository::deleteNode(const std::string& uuid) {
    PROFILE_SCOPE("node.delete");

    auto record = m_runner.single(QueryBuilder::deleteNode(uuid));
    if (!record || record->get("deleted_count").asInt() == 0) {
        return false;
    }

    LOG_INFO("Node deleted: " + uuid);
    return true;
}

} // namespace graph
