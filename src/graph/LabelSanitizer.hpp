#pragma once

#include <string>

namespace graph {

// Label générique porté par tous les noeuds créés par le NodeRepository
inline constexpr const char* kEntityLabel = "Entity";
inline constexpr const char* kEpisodeLabel = "Episode";

/**
 * @brief Label validé, insérable tel quel dans le texte d'une requête
 *
 * Ne peut être obtenu que via LabelSanitizer.
 */
class SafeLabel {
public:
    const std::string& str() const { return m_value; }

    // Backtick-quoted form: `Label`
    std::string quoted() const { return "`" + m_value + "`"; }

    bool operator==(const SafeLabel& other) const { return m_value == other.m_value; }

private:
    friend class LabelSanitizer;
    explicit SafeLabel(std::string value) : m_value(std::move(value)) {}

    std::string m_value;
};

/**
 * @brief Validation des types fournis par l'appelant
 *
 * Le moteur ne permet pas de lier un label comme paramètre: tout type de
 * noeud ou de relation est donc validé ici avant d'être inséré dans le
 * texte de la requête, entre backticks.
 *
 * Rejetés: chaîne vide, backtick, backslash, caractères de contrôle
 * (C0, DEL, C1), séparateurs U+2028/U+2029, UTF-8 invalide.
 */
class LabelSanitizer {
public:
    /**
     * @throws InvalidLabelError
     */
    static SafeLabel sanitize(const std::string& raw);

    /**
     * @brief Trim, uppercase ASCII, runs of whitespace become a single '_'
     *
     * Pure normalization: no validation happens here.
     */
    static std::string normalizeRelationshipType(const std::string& raw);

    // normalizeRelationshipType then sanitize
    static SafeLabel sanitizeRelationshipType(const std::string& raw);

    /**
     * @brief sanitize, en refusant aussi le label marqueur
     * @throws InvalidLabelError
     */
    static SafeLabel sanitizeNodeType(const std::string& raw);
};

} // namespace graph
