#pragma once

/// @file component_storage.hpp
/// @brief Sparse-set component storage keyed by versioned entity handles.

#include "cre/ecs/entity.hpp"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <limits>
#include <type_traits>
#include <utility>
#include <vector>

namespace cre::ecs {

/// Type-erased view of a component pool so EntityManager can drop an
/// entity's components without knowing their types.
class IComponentStorage {
public:
    virtual ~IComponentStorage() = default;

    virtual void Remove(Entity entity) = 0;
    [[nodiscard]] virtual bool Has(Entity entity) const = 0;
    virtual void Clear() = 0;
    [[nodiscard]] virtual std::size_t Size() const = 0;

    /// Handle of the entity owning dense slot @p index.
    [[nodiscard]] virtual Entity EntityAt(std::size_t index) const = 0;
};

/// Sparse-set component storage.
///
/// @code
///   sparse_  [entity.id] -> dense index  (or kInvalidIndex)
///   dense_   [index]     -> component data
///   owners_  [index]     -> full handle owning dense_[index]
/// @endcode
///
/// Membership compares the full handle, so a stale handle whose slot was
/// recycled does not see the new occupant's components.
///
/// Add() and Remove() reorder the dense array. Systems that create or
/// destroy components while walking a storage collect the handles first
/// (see Entities()).
template <typename T>
class ComponentStorage final : public IComponentStorage {
public:
    static_assert(std::is_move_constructible_v<T>, "Component type must be move-constructible");

    using value_type = T;
    using iterator = typename std::vector<T>::iterator;
    using const_iterator = typename std::vector<T>::const_iterator;

    [[nodiscard]] std::size_t Size() const override { return dense_.size(); }

    [[nodiscard]] bool Empty() const noexcept { return dense_.empty(); }

    /// Add a component for @p entity, constructed from @p args.
    /// @pre `!Has(entity)`.
    template <typename... Args>
    T& Add(Entity entity, Args&&... args) {
        assert(entity.isValid() && "Cannot add component to invalid entity");
        assert(!Has(entity) && "Entity already has this component");

        const auto idx = static_cast<uint32_t>(dense_.size());

        ensureSparseSize(entity.id());
        sparse_[entity.id()] = idx;

        dense_.emplace_back(std::forward<Args>(args)...);
        owners_.push_back(entity);

        return dense_.back();
    }

    /// @pre `Has(entity)`.
    [[nodiscard]] T& Get(Entity entity) {
        assert(Has(entity) && "Entity does not have this component");
        return dense_[sparse_[entity.id()]];
    }

    [[nodiscard]] const T& Get(Entity entity) const {
        assert(Has(entity) && "Entity does not have this component");
        return dense_[sparse_[entity.id()]];
    }

    /// Pointer to the component, or nullptr when absent.
    [[nodiscard]] T* TryGet(Entity entity) {
        return Has(entity) ? &dense_[sparse_[entity.id()]] : nullptr;
    }

    [[nodiscard]] const T* TryGet(Entity entity) const {
        return Has(entity) ? &dense_[sparse_[entity.id()]] : nullptr;
    }

    [[nodiscard]] bool Has(Entity entity) const override {
        if (!entity.isValid()) {
            return false;
        }
        auto eid = entity.id();
        return eid < sparse_.size() && sparse_[eid] != kInvalidIndex &&
               owners_[sparse_[eid]] == entity;
    }

    /// Remove the component owned by @p entity. No-op when absent.
    void Remove(Entity entity) override {
        if (!Has(entity)) {
            return;
        }

        auto idx = sparse_[entity.id()];
        auto lastIdx = static_cast<uint32_t>(dense_.size() - 1);

        if (idx != lastIdx) {
            dense_[idx] = std::move(dense_[lastIdx]);
            owners_[idx] = owners_[lastIdx];
            sparse_[owners_[idx].id()] = idx;
        }

        dense_.pop_back();
        owners_.pop_back();
        sparse_[entity.id()] = kInvalidIndex;
    }

    /// Return the existing component or default-construct one.
    T& GetOrAdd(Entity entity) {
        if (Has(entity)) {
            return Get(entity);
        }
        return Add(entity);
    }

    void Clear() override {
        dense_.clear();
        owners_.clear();
        std::fill(sparse_.begin(), sparse_.end(), kInvalidIndex);
    }

    iterator begin() noexcept { return dense_.begin(); }
    iterator end() noexcept { return dense_.end(); }
    [[nodiscard]] const_iterator begin() const noexcept { return dense_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return dense_.end(); }

    [[nodiscard]] Entity EntityAt(std::size_t index) const override {
        assert(index < owners_.size());
        return owners_[index];
    }

    /// Snapshot of every owning handle, in dense order.
    [[nodiscard]] std::vector<Entity> Entities() const { return owners_; }

private:
    static constexpr uint32_t kInvalidIndex = std::numeric_limits<uint32_t>::max();

    void ensureSparseSize(uint32_t entityId) {
        if (entityId >= sparse_.size()) {
            sparse_.resize(static_cast<std::size_t>(entityId) + 1, kInvalidIndex);
        }
    }

    std::vector<T> dense_;
    std::vector<Entity> owners_;
    std::vector<uint32_t> sparse_;
};

}  // namespace cre::ecs
