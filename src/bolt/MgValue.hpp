#pragma once

#include "bolt/Value.hpp"
#include <mgclient.hpp>

namespace bolt {

/**
 * @brief Conversion vers les valeurs mgclient (paramètres de requête)
 *
 * Seuls les scalaires, listes et maps peuvent être liés à une requête.
 * @throws std::invalid_argument pour un Vertex, un Edge ou une Structure
 */
mg::Value toMgValue(const Value& value);
mg::Map toMgMap(const Value::Map& map);

/**
 * @brief Conversion d'une valeur reçue du moteur
 *
 * Noeuds et relations deviennent Vertex / Edge. Date, LocalDateTime et
 * DateTime deviennent des Structure (voir bolt::signature); les autres
 * types (chemins, durées, points...) une Structure opaque sans champ.
 */
Value fromMgValue(const mg::ConstValue& value);
Value::Map fromMgMap(const mg::ConstMap& map);

} // namespace bolt
