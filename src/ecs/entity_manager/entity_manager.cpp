/// @file entity_manager.cpp
/// @brief Entity lifecycle implementation.

#include "cre/ecs/entity_manager.hpp"

#include <cassert>

namespace cre::ecs {

Entity EntityManager::Create() {
    uint32_t index = 0;

    if (!freeList_.empty()) {
        index = freeList_.front();
        freeList_.pop_front();
        alive_[index] = true;
    } else {
        index = static_cast<uint32_t>(versions_.size());
        assert(index <= Entity::kMaxId && "Entity index space exhausted");
        versions_.push_back(0);
        alive_.push_back(true);
        pending_.push_back(false);
    }

    ++count_;
    return Entity(index, versions_[index]);
}

void EntityManager::Destroy(Entity entity) {
    if (!IsAlive(entity)) {
        return;
    }
    destroyInternal(entity);
}

void EntityManager::DestroyDeferred(Entity entity) {
    if (!IsAlive(entity) || pending_[entity.id()]) {
        return;
    }
    pending_[entity.id()] = true;
    pendingDestroy_.push_back(entity);
}

void EntityManager::FlushDeferred() {
    auto pending = std::move(pendingDestroy_);
    pendingDestroy_.clear();

    for (const auto& entity : pending) {
        if (IsAlive(entity)) {
            destroyInternal(entity);
        }
    }
}

bool EntityManager::IsAlive(Entity entity) const noexcept {
    if (!entity.isValid()) {
        return false;
    }

    const auto idx = entity.id();
    if (idx >= versions_.size()) {
        return false;
    }

    return alive_[idx] && versions_[idx] == entity.version();
}

bool EntityManager::IsPendingDestroy(Entity entity) const noexcept {
    return IsAlive(entity) && pending_[entity.id()];
}

std::size_t EntityManager::Count() const noexcept {
    return count_;
}

std::size_t EntityManager::Capacity() const noexcept {
    return versions_.size();
}

void EntityManager::RegisterStorage(IComponentStorage* storage) {
    assert(storage != nullptr && "Cannot register null storage");
    storages_.push_back(storage);
}

void EntityManager::destroyInternal(Entity entity) {
    const auto idx = entity.id();

    for (auto* storage : storages_) {
        storage->Remove(entity);
    }

    alive_[idx] = false;
    pending_[idx] = false;
    versions_[idx] = static_cast<uint8_t>(versions_[idx] + 1);

    freeList_.push_back(idx);
    --count_;
}

} // namespace cre::ecs
