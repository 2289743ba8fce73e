/// @file spatial_index.cpp
/// @brief Uniform-grid SpatialIndex queries and cell bookkeeping.

#include "cre/game/spatial_index.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace cre::game {

using cre::ecs::Entity;

SpatialIndex::SpatialIndex(float cellSize) : cellSize_(cellSize) {
    if (!(cellSize_ > 0.0f)) {
        cellSize_ = kDefaultCellSize;
    }
}

void SpatialIndex::Insert(Entity entity, const Vector3& position, float radius) {
    auto cell = WorldToCell(position);
    auto it = entries_.find(entity);
    if (it != entries_.end()) {
        if (it->second.cell != cell) {
            removeFromCell(entity, it->second.cell);
            addToCell(entity, cell);
        }
        it->second = Entry{position, radius, cell};
    } else {
        addToCell(entity, cell);
        entries_.emplace(entity, Entry{position, radius, cell});
    }
    maxRadius_ = std::max(maxRadius_, radius);
}

void SpatialIndex::Update(Entity entity, const Vector3& newPosition) {
    auto it = entries_.find(entity);
    if (it == entries_.end()) {
        Insert(entity, newPosition);
        return;
    }

    auto newCell = WorldToCell(newPosition);
    if (it->second.cell != newCell) {
        removeFromCell(entity, it->second.cell);
        addToCell(entity, newCell);
        it->second.cell = newCell;
    }
    it->second.position = newPosition;
}

void SpatialIndex::Remove(Entity entity) {
    auto it = entries_.find(entity);
    if (it == entries_.end()) {
        return;
    }
    removeFromCell(entity, it->second.cell);
    entries_.erase(it);
}

void SpatialIndex::Clear() {
    cells_.clear();
    entries_.clear();
    maxRadius_ = 0.0f;
}

template <typename Fn>
void SpatialIndex::forEachCandidate(const Vector3& center, float reach, Fn&& fn) const {
    // Cell bounds in double so that huge reaches neither overflow int32_t
    // nor walk millions of empty cells.
    const double size = cellSize_;
    const double minX = std::floor((static_cast<double>(center.x) - reach) / size);
    const double maxX = std::floor((static_cast<double>(center.x) + reach) / size);
    const double minY = std::floor((static_cast<double>(center.z) - reach) / size);
    const double maxY = std::floor((static_cast<double>(center.z) + reach) / size);

    constexpr double kLowest = std::numeric_limits<int32_t>::min() + 1.0;
    constexpr double kHighest = std::numeric_limits<int32_t>::max() - 1.0;
    const double span = (maxX - minX + 1.0) * (maxY - minY + 1.0);
    const bool inRange = minX >= kLowest && maxX <= kHighest && minY >= kLowest &&
                         maxY <= kHighest;
    if (!inRange || !(span <= static_cast<double>(cells_.size()))) {
        // Wider than the occupied grid: visit the occupied cells instead.
        for (const auto& [cell, entities] : cells_) {
            if (cell.x < minX || cell.x > maxX || cell.y < minY || cell.y > maxY) {
                continue;
            }
            for (auto entity : entities) {
                fn(entity, entries_.at(entity));
            }
        }
        return;
    }

    const auto minCellX = static_cast<int32_t>(minX);
    const auto maxCellX = static_cast<int32_t>(maxX);
    const auto minCellY = static_cast<int32_t>(minY);
    const auto maxCellY = static_cast<int32_t>(maxY);

    for (int32_t cx = minCellX; cx <= maxCellX; ++cx) {
        for (int32_t cy = minCellY; cy <= maxCellY; ++cy) {
            auto it = cells_.find(CellCoord{cx, cy});
            if (it == cells_.end()) {
                continue;
            }
            for (auto entity : it->second) {
                fn(entity, entries_.at(entity));
            }
        }
    }
}

std::vector<Entity> SpatialIndex::QueryRadius(const Vector3& center, float radius) const {
    std::vector<Entity> result;
    if (radius < 0.0f) {
        return result;
    }

    forEachCandidate(center, radius, [&](Entity entity, const Entry& entry) {
        if (PlanarDistance(center, entry.position) <= radius) {
            result.push_back(entity);
        }
    });
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<Entity> SpatialIndex::QueryOverlap(const Vector3& center, float radius) const {
    std::vector<Entity> result;
    if (radius < 0.0f) {
        return result;
    }

    forEachCandidate(center, radius + maxRadius_, [&](Entity entity, const Entry& entry) {
        if (PlanarDistance(center, entry.position) <= radius + entry.radius) {
            result.push_back(entity);
        }
    });
    std::sort(result.begin(), result.end());
    return result;
}

std::optional<Entity> SpatialIndex::Nearest(const Vector3& center, float maxRadius,
                                            const std::function<bool(Entity)>& filter) const {
    std::optional<Entity> best;
    float bestDistance = std::numeric_limits<float>::infinity();

    auto consider = [&](Entity entity, const Entry& entry) {
        const float d = PlanarDistance(center, entry.position);
        if (d > maxRadius) {
            return;
        }
        if (filter && !filter(entity)) {
            return;
        }
        if (d < bestDistance || (d == bestDistance && best && entity < *best)) {
            bestDistance = d;
            best = entity;
        }
    };

    if (std::isinf(maxRadius)) {
        for (const auto& [entity, entry] : entries_) {
            consider(entity, entry);
        }
    } else if (maxRadius >= 0.0f) {
        forEachCandidate(center, maxRadius, consider);
    }
    return best;
}

bool SpatialIndex::Contains(Entity entity) const {
    return entries_.contains(entity);
}

std::optional<Vector3> SpatialIndex::PositionOf(Entity entity) const {
    auto it = entries_.find(entity);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.position;
}

void SpatialIndex::removeFromCell(Entity entity, CellCoord cell) {
    auto it = cells_.find(cell);
    if (it == cells_.end()) {
        return;
    }
    auto& vec = it->second;
    std::erase(vec, entity);
    if (vec.empty()) {
        cells_.erase(it);
    }
}

void SpatialIndex::addToCell(Entity entity, CellCoord cell) {
    cells_[cell].push_back(entity);
}

} // namespace cre::game
