#pragma once

#include <cstdint>
#include <string>

namespace graph {

/**
 * @brief Génère un UUID version 4 (forme canonique 8-4-4-4-12, minuscules)
 *
 * Thread-safe: chaque thread possède son propre générateur.
 */
std::string generateUuid();

// Current UTC time as YYYY-MM-DDTHH:MM:SS.ffffff
std::string currentTimestamp();

/**
 * @brief Instant UTC (secondes depuis l'epoch + nanosecondes) au même format
 * que currentTimestamp(). Les nanosecondes sont tronquées à la microseconde.
 */
std::string formatTimestamp(int64_t seconds, int64_t nanoseconds);

} // namespace graph
