#pragma once

/// @file entity_manager.hpp
/// @brief Entity creation, recycling and deferred destruction.

#include "cre/ecs/component_storage.hpp"
#include "cre/ecs/entity.hpp"

#include <cstdint>
#include <deque>
#include <vector>

namespace cre::ecs {

/// Owns entity lifetimes for one combat world.
///
/// Destroyed slots are recycled oldest-first with a bumped generation.
/// Registered storages lose the entity's components on destruction.
///
/// Destruction requested while systems are running goes through
/// DestroyDeferred(); the world flushes the queue once at the end of
/// every tick, so a combatant defeated mid-tick stays addressable until
/// all hits of that tick have been resolved.
class EntityManager {
public:
    EntityManager() = default;

    EntityManager(const EntityManager&) = delete;
    EntityManager& operator=(const EntityManager&) = delete;
    EntityManager(EntityManager&&) noexcept = default;
    EntityManager& operator=(EntityManager&&) noexcept = default;

    [[nodiscard]] Entity Create();

    /// Destroy @p entity now. No-op for dead handles.
    void Destroy(Entity entity);

    /// Queue @p entity for the next FlushDeferred(). Queuing twice is harmless.
    void DestroyDeferred(Entity entity);

    /// Destroy every queued entity that is still alive.
    void FlushDeferred();

    [[nodiscard]] bool IsAlive(Entity entity) const noexcept;

    /// True while @p entity sits in the deferred destruction queue.
    [[nodiscard]] bool IsPendingDestroy(Entity entity) const noexcept;

    [[nodiscard]] std::size_t Count() const noexcept;

    [[nodiscard]] std::size_t Capacity() const noexcept;

    [[nodiscard]] std::size_t PendingCount() const noexcept { return pendingDestroy_.size(); }

    /// The manager does not own @p storage; it must outlive the manager.
    void RegisterStorage(IComponentStorage* storage);

private:
    void destroyInternal(Entity entity);

    std::vector<uint8_t> versions_;
    std::vector<bool> alive_;
    std::vector<bool> pending_;
    std::deque<uint32_t> freeList_;
    std::vector<Entity> pendingDestroy_;
    std::vector<IComponentStorage*> storages_;
    std::size_t count_ = 0;
};

}  // namespace cre::ecs
