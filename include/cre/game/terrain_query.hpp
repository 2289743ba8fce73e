#pragma once

/// @file terrain_query.hpp
/// @brief Terrain collaborator consulted by the trajectory system.

#include "cre/game/math_types.hpp"

namespace cre::game {

/// Answers whether a ground position is solid (walls, cliffs, props).
///
/// Implemented by the map layer; the engine only queries it.
class TerrainQuery {
public:
    virtual ~TerrainQuery() = default;

    [[nodiscard]] virtual bool IsBlocked(const Vector3& position) const = 0;
};

}  // namespace cre::game
