#pragma once

/// @file spatial_index.hpp
/// @brief Uniform-grid broadphase over combatant hit volumes.
///
/// Only X and Z are used (Y is up). Each tracked entity is a circle
/// (position plus hit radius), so queries can filter exactly instead of
/// returning whole cells.

#include <cmath>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <unordered_map>
#include <vector>

#include "cre/ecs/entity.hpp"
#include "cre/game/math_types.hpp"

namespace cre::game {

constexpr float kDefaultCellSize = 64.0f;

struct CellCoord {
    int32_t x = 0;
    int32_t y = 0;

    constexpr auto operator<=>(const CellCoord&) const = default;
};

} // namespace cre::game

template <>
struct std::hash<cre::game::CellCoord> {
    std::size_t operator()(const cre::game::CellCoord& c) const noexcept {
        auto h1 = std::hash<int32_t>{}(c.x);
        auto h2 = std::hash<int32_t>{}(c.y);
        return h1 ^ (h2 * 2654435761u);
    }
};

namespace cre::game {

/// Sparse grid of combatant circles.
///
/// Query results are ordered by entity handle so that callers iterating
/// them (area damage, chain retargeting) behave the same on every run.
class SpatialIndex {
public:
    explicit SpatialIndex(float cellSize = kDefaultCellSize);

    /// Track @p entity. Re-inserting updates position and radius.
    void Insert(cre::ecs::Entity entity, const Vector3& position, float radius = 0.0f);

    /// Move a tracked entity. Untracked entities are inserted with radius 0.
    void Update(cre::ecs::Entity entity, const Vector3& newPosition);

    void Remove(cre::ecs::Entity entity);

    void Clear();

    /// Entities whose centre lies within @p radius of @p center.
    [[nodiscard]] std::vector<cre::ecs::Entity>
    QueryRadius(const Vector3& center, float radius) const;

    /// Entities whose hit circle overlaps the circle (@p center, @p radius).
    [[nodiscard]] std::vector<cre::ecs::Entity>
    QueryOverlap(const Vector3& center, float radius) const;

    /// Closest entity within @p maxRadius accepted by @p filter.
    /// An infinite radius scans every tracked entity.
    [[nodiscard]] std::optional<cre::ecs::Entity>
    Nearest(const Vector3& center, float maxRadius,
            const std::function<bool(cre::ecs::Entity)>& filter) const;

    [[nodiscard]] std::size_t Size() const noexcept { return entries_.size(); }

    [[nodiscard]] float CellSize() const noexcept { return cellSize_; }

    [[nodiscard]] bool Contains(cre::ecs::Entity entity) const;

    [[nodiscard]] std::optional<Vector3> PositionOf(cre::ecs::Entity entity) const;

    [[nodiscard]] CellCoord WorldToCell(const Vector3& pos) const noexcept {
        return {
            static_cast<int32_t>(std::floor(pos.x / cellSize_)),
            static_cast<int32_t>(std::floor(pos.z / cellSize_))
        };
    }

private:
    struct Entry {
        Vector3 position;
        float radius = 0.0f;
        CellCoord cell;
    };

    /// Visit every entity in the cells covering the given circle.
    template <typename Fn>
    void forEachCandidate(const Vector3& center, float reach, Fn&& fn) const;

    void removeFromCell(cre::ecs::Entity entity, CellCoord cell);
    void addToCell(cre::ecs::Entity entity, CellCoord cell);

    float cellSize_;
    float maxRadius_ = 0.0f;
    std::unordered_map<CellCoord, std::vector<cre::ecs::Entity>> cells_;
    std::unordered_map<cre::ecs::Entity, Entry> entries_;
};

} // namespace cre::game
