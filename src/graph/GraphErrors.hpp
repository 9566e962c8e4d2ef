#pragma once

#include <stdexcept>
#include <string>

namespace graph {

/**
 * Base de toutes les erreurs remontées par le coeur du graphe
 */
class GraphError : public std::runtime_error {
public:
    explicit GraphError(const std::string& message)
        : std::runtime_error(message) {}
};

// Type de noeud ou de relation refusé par le sanitizer
class InvalidLabelError : public GraphError {
public:
    explicit InvalidLabelError(const std::string& message)
        : GraphError(message) {}
};

// Moteur injoignable (transitoire, non rejoué en interne)
class ConnectionError : public GraphError {
public:
    explicit ConnectionError(const std::string& message)
        : GraphError(message) {}
};

// Requête rejetée ou interrompue par le moteur
class EngineQueryError : public GraphError {
public:
    explicit EngineQueryError(const std::string& message)
        : GraphError(message) {}
};

/**
 * Enregistrement renvoyé par le moteur qui ne correspond pas à la forme
 * attendue (propriété d'un type non représentable, colonne qui n'est pas
 * un noeud...)
 */
class MalformedRecordError : public GraphError {
public:
    explicit MalformedRecordError(const std::string& message)
        : GraphError(message) {}
};

class NotFoundError : public GraphError {
public:
    explicit NotFoundError(const std::string& uuid)
        : GraphError("Node not found: " + uuid)
        , m_uuid(uuid) {}

    const std::string& uuid() const { return m_uuid; }

private:
    std::string m_uuid;
};

// Source and/or target missing: the query cannot tell which one
class EndpointNotFoundError : public GraphError {
public:
    EndpointNotFoundError(const std::string& sourceUuid, const std::string& targetUuid)
        : GraphError("Source or target node not found (source: " + sourceUuid +
                     ", target: " + targetUuid + ")") {}
};

class CreateFailedError : public GraphError {
public:
    explicit CreateFailedError(const std::string& message)
        : GraphError(message) {}
};

} // namespace graph
