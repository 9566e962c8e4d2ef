#include "bolt/Value.hpp"
#include <algorithm>
#include <stdexcept>

namespace bolt {

Value::Value(bool value) : m_type(Type::Bool), m_data(value) {}

Value::Value(int value) : m_type(Type::Int), m_data(static_cast<int64_t>(value)) {}

Value::Value(int64_t value) : m_type(Type::Int), m_data(value) {}

Value::Value(double value) : m_type(Type::Double), m_data(value) {}

Value::Value(const char* value) : m_type(Type::String), m_data(std::string(value)) {}

Value::Value(std::string value) : m_type(Type::String), m_data(std::move(value)) {}

Value::Value(List value)
    : m_type(Type::List)
    , m_data(std::make_shared<const List>(std::move(value)))
{}

Value::Value(Map value)
    : m_type(Type::Map)
    , m_data(std::make_shared<const Map>(std::move(value)))
{}

Value::Value(Vertex value)
    : m_type(Type::Vertex)
    , m_data(std::make_shared<const Vertex>(std::move(value)))
{}

Value::Value(Edge value)
    : m_type(Type::Edge)
    , m_data(std::make_shared<const Edge>(std::move(value)))
{}

Value::Value(Structure value)
    : m_type(Type::Structure)
    , m_data(std::make_shared<const Structure>(std::move(value)))
{}

Value Value::fromOptional(const std::optional<std::string>& value) {
    if (!value) {
        return Value();
    }
    return Value(*value);
}

std::string Value::typeName(Type type) {
    switch (type) {
        case Type::Null:      return "Null";
        case Type::Bool:      return "Bool";
        case Type::Int:       return "Int";
        case Type::Double:    return "Double";
        case Type::String:    return "String";
        case Type::List:      return "List";
        case Type::Map:       return "Map";
        case Type::Vertex:    return "Vertex";
        case Type::Edge:      return "Edge";
        case Type::Structure: return "Structure";
        default: return "?";
    }
}

void Value::expect(Type type) const {
    if (m_type != type) {
        throw std::runtime_error("Bolt value type mismatch: expected " + typeName(type) +
                                 ", got " + typeName(m_type));
    }
}

bool Value::asBool() const {
    expect(Type::Bool);
    return std::get<bool>(m_data);
}

int64_t Value::asInt() const {
    expect(Type::Int);
    return std::get<int64_t>(m_data);
}

double Value::asDouble() const {
    expect(Type::Double);
    return std::get<double>(m_data);
}

const std::string& Value::asString() const {
    expect(Type::String);
    return std::get<std::string>(m_data);
}

const Value::List& Value::asList() const {
    expect(Type::List);
    return *std::get<std::shared_ptr<const List>>(m_data);
}

const Value::Map& Value::asMap() const {
    expect(Type::Map);
    return *std::get<std::shared_ptr<const Map>>(m_data);
}

const Vertex& Value::asVertex() const {
    expect(Type::Vertex);
    return *std::get<std::shared_ptr<const Vertex>>(m_data);
}

const Edge& Value::asEdge() const {
    expect(Type::Edge);
    return *std::get<std::shared_ptr<const Edge>>(m_data);
}

const Structure& Value::asStructure() const {
    expect(Type::Structure);
    return *std::get<std::shared_ptr<const Structure>>(m_data);
}

// =============================================================================
// Record
// =============================================================================

Record::Record(std::shared_ptr<const std::vector<std::string>> fields, std::vector<Value> values)
    : m_fields(std::move(fields))
    , m_values(std::move(values))
{
    if (!m_fields || m_fields->size() != m_values.size()) {
        throw std::runtime_error("Bolt record size does not match its field list");
    }
}

bool Record::has(const std::string& field) const {
    if (!m_fields) return false;
    return std::find(m_fields->begin(), m_fields->end(), field) != m_fields->end();
}

const Value& Record::get(const std::string& field) const {
    if (m_fields) {
        auto it = std::find(m_fields->begin(), m_fields->end(), field);
        if (it != m_fields->end()) {
            return m_values[static_cast<size_t>(it - m_fields->begin())];
        }
    }
    throw std::out_of_range("Record has no field '" + field + "'");
}

} // namespace bolt
