#include "bolt/MgValue.hpp"
#include <stdexcept>

namespace bolt {

mg::Value toMgValue(const Value& value) {
    switch (value.type()) {
        case Value::Type::Null:
            return mg::Value();
        case Value::Type::Bool:
            return mg::Value(value.asBool());
        case Value::Type::Int:
            return mg::Value(value.asInt());
        case Value::Type::Double:
            return mg::Value(value.asDouble());
        case Value::Type::String:
            return mg::Value(std::string_view(value.asString()));
        case Value::Type::List: {
            const auto& items = value.asList();
            mg::List list(items.size());
            for (const auto& item : items) {
                if (!list.Append(toMgValue(item))) {
                    throw std::runtime_error("mgclient list capacity exceeded");
                }
            }
            return mg::Value(std::move(list));
        }
        case Value::Type::Map:
            return mg::Value(toMgMap(value.asMap()));
        default:
            // Graph entities are never sent as query parameters
            throw std::invalid_argument("Cannot bind " + Value::typeName(value.type()) +
                                        " as a query parameter");
    }
}

mg::Map toMgMap(const Value::Map& map) {
    mg::Map out(map.size());
    for (const auto& [key, item] : map) {
        if (!out.Insert(key, toMgValue(item))) {
            throw std::invalid_argument("Duplicate query parameter: " + key);
        }
    }
    return out;
}

Value::Map fromMgMap(const mg::ConstMap& map) {
    Value::Map out;
    for (const auto& [key, item] : map) {
        out.emplace(std::string(key), fromMgValue(item));
    }
    return out;
}

Value fromMgValue(const mg::ConstValue& value) {
    switch (value.type()) {
        case mg::Value::Type::Null:
            return Value();
        case mg::Value::Type::Bool:
            return Value(value.ValueBool());
        case mg::Value::Type::Int:
            return Value(static_cast<int64_t>(value.ValueInt()));
        case mg::Value::Type::Double:
            return Value(value.ValueDouble());
        case mg::Value::Type::String:
            return Value(std::string(value.ValueString()));
        case mg::Value::Type::List: {
            Value::List list;
            for (const auto& item : value.ValueList()) {
                list.push_back(fromMgValue(item));
            }
            return Value(std::move(list));
        }
        case mg::Value::Type::Map:
            return Value(fromMgMap(value.ValueMap()));
        case mg::Value::Type::Node: {
            auto node = value.ValueNode();
            Vertex vertex;
            vertex.id = node.id().AsInt();
            for (const auto& label : node.labels()) {
                vertex.labels.emplace_back(label);
            }
            vertex.properties = fromMgMap(node.properties());
            return Value(std::move(vertex));
        }
        case mg::Value::Type::Relationship: {
            auto relationship = value.ValueRelationship();
            Edge edge;
            edge.id = relationship.id().AsInt();
            edge.startId = relationship.from().AsInt();
            edge.endId = relationship.to().AsInt();
            edge.type = std::string(relationship.type());
            edge.properties = fromMgMap(relationship.properties());
            return Value(std::move(edge));
        }
        case mg::Value::Type::Date:
            return Value(Structure{signature::Date, {Value(value.ValueDate().days())}});
        case mg::Value::Type::LocalDateTime: {
            auto local = value.ValueLocalDateTime();
            return Value(Structure{signature::LocalDateTime,
                                   {Value(local.seconds()), Value(local.nanoseconds())}});
        }
        case mg::Value::Type::DateTime: {
            // seconds are local to the offset
            auto dateTime = value.ValueDateTime();
            int64_t offset = static_cast<int64_t>(dateTime.tz_offset_minutes()) * 60;
            return Value(Structure{signature::DateTime,
                                   {Value(dateTime.seconds() - offset),
                                    Value(dateTime.nanoseconds()),
                                    Value(offset)}});
        }
        default:
            return Value(Structure{signature::Opaque, {}});
    }
}

} // namespace bolt
