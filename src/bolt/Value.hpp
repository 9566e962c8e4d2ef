#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace bolt {

struct Vertex;
struct Edge;
struct Structure;

// Bolt signatures of the structures kept as Structure values
namespace signature {
constexpr uint8_t Opaque = 0x00;         // paths, durations, points, zoned times
constexpr uint8_t Date = 0x44;           // days since epoch
constexpr uint8_t LocalDateTime = 0x64;  // seconds, nanoseconds
constexpr uint8_t DateTime = 0x49;       // UTC seconds, nanoseconds, offset seconds
} // namespace signature

/**
 * @brief Valeur échangée avec le moteur de graphe
 *
 * Les conteneurs (liste, map) et les structures sont partagés et
 * immuables une fois construits: copier une Value est peu coûteux.
 */
class Value {
public:
    enum class Type {
        Null,
        Bool,
        Int,
        Double,
        String,
        List,
        Map,
        Vertex,
        Edge,
        Structure
    };

    using List = std::vector<Value>;
    using Map = std::map<std::string, Value>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool value);
    Value(int value);
    Value(int64_t value);
    Value(double value);
    Value(const char* value);
    Value(std::string value);
    Value(List value);
    Value(Map value);
    Value(Vertex value);
    Value(Edge value);
    Value(Structure value);

    // Null for std::nullopt
    static Value fromOptional(const std::optional<std::string>& value);

    Type type() const { return m_type; }
    bool isNull() const { return m_type == Type::Null; }
    bool isString() const { return m_type == Type::String; }
    bool isInt() const { return m_type == Type::Int; }
    bool isList() const { return m_type == Type::List; }
    bool isMap() const { return m_type == Type::Map; }
    bool isVertex() const { return m_type == Type::Vertex; }
    bool isEdge() const { return m_type == Type::Edge; }

    // Typed accessors, throw std::runtime_error on a type mismatch
    bool asBool() const;
    int64_t asInt() const;
    double asDouble() const;
    const std::string& asString() const;
    const List& asList() const;
    const Map& asMap() const;
    const Vertex& asVertex() const;
    const Edge& asEdge() const;
    const Structure& asStructure() const;

    static std::string typeName(Type type);

private:
    void expect(Type type) const;

    Type m_type = Type::Null;
    std::variant<std::monostate,
                 bool,
                 int64_t,
                 double,
                 std::string,
                 std::shared_ptr<const List>,
                 std::shared_ptr<const Map>,
                 std::shared_ptr<const Vertex>,
                 std::shared_ptr<const Edge>,
                 std::shared_ptr<const Structure>> m_data;
};

/**
 * Node as sent by the engine (structure tag 'N')
 */
struct Vertex {
    int64_t id = 0;
    std::vector<std::string> labels;
    Value::Map properties;
};

/**
 * Relationship as sent by the engine (structure tag 'R')
 */
struct Edge {
    int64_t id = 0;
    int64_t startId = 0;
    int64_t endId = 0;
    std::string type;
    Value::Map properties;
};

/**
 * Temporal values (see signature), or an opaque value the store does not read
 */
struct Structure {
    uint8_t tag = 0;
    std::vector<Value> fields;
};

/**
 * Une ligne de résultat: noms de colonnes + valeurs alignées
 */
class Record {
public:
    Record() = default;
    Record(std::shared_ptr<const std::vector<std::string>> fields, std::vector<Value> values);

    bool has(const std::string& field) const;

    /**
     * @throws std::out_of_range si la colonne n'existe pas
     */
    const Value& get(const std::string& field) const;

    const std::vector<Value>& values() const { return m_values; }
    size_t size() const { return m_values.size(); }

private:
    std::shared_ptr<const std::vector<std::string>> m_fields;
    std::vector<Value> m_values;
};

} // namespace bolt
