#pragma once

/// @file combat_components.hpp
/// @brief Combatant components: placement, team, health, energy, status
///        effects, spells and character stats.
///
/// Health and Energy are only changed through their mutators, which keep
/// the clamp and report what happened as a change record. The world turns
/// change records into CombatEvents notifications.

#include <algorithm>
#include <array>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "cre/ecs/entity.hpp"
#include "cre/game/combat_types.hpp"
#include "cre/game/math_types.hpp"
#include "cre/game/stat_derivation.hpp"

namespace cre::game {

// ── Placement and sides ─────────────────────────────────────────────────

struct Transform {
    Vector3 position;
};

/// Circular hit volume on the ground plane.
struct HitVolume {
    float radius = 16.0f;
};

struct TeamMember {
    CombatTeam team = CombatTeam::Enemy;
};

/// True when a projectile owned by @p attacker may hit @p defender.
[[nodiscard]] constexpr bool AreOpposed(CombatTeam attacker, CombatTeam defender) noexcept {
    return attacker != CombatTeam::Neutral && defender != CombatTeam::Neutral &&
           attacker != defender;
}

/// Percentage resistance (0-100) per damage type.
struct Resistances {
    std::array<float, kDamageTypeCount> percent{};

    void Set(DamageType type, float value) noexcept {
        percent[static_cast<std::size_t>(type)] = std::clamp(value, 0.0f, 100.0f);
    }

    [[nodiscard]] float Get(DamageType type) const noexcept {
        return percent[static_cast<std::size_t>(type)];
    }
};

// ── Health ──────────────────────────────────────────────────────────────

/// Result of a Health mutation.
struct HealthChange {
    int32_t previous = 0;
    int32_t current = 0;
    int32_t applied = 0;   ///< Amount actually removed or restored.
    int32_t overkill = 0;  ///< Damage beyond zero on the defeating hit.
    bool defeated = false; ///< This mutation defeated the entity.

    [[nodiscard]] bool Changed() const noexcept { return previous != current; }
};

/// Hit points clamped to [0, max] unless `exceed` is set.
struct Health {
    int32_t current = 100;
    int32_t max = 100;
    bool exceed = false;
    bool godMode = false;
    bool defeated = false;

    Health() = default;
    explicit Health(int32_t maxHealth) : current(maxHealth), max(maxHealth) {}

    /// Remove @p amount hit points. Ignored for non-positive amounts, in
    /// god mode, and once the entity is defeated.
    HealthChange ApplyDamage(int32_t amount) noexcept {
        HealthChange change{current, current, 0, 0, false};
        if (amount <= 0 || godMode || defeated) {
            return change;
        }

        const int64_t raw = static_cast<int64_t>(current) - amount;
        if (raw <= 0) {
            change.overkill = static_cast<int32_t>(-raw);
            current = exceed ? static_cast<int32_t>(raw) : 0;
            defeated = true;
            change.defeated = true;
        } else {
            current = static_cast<int32_t>(raw);
        }
        change.current = current;
        change.applied = change.previous - current;
        return change;
    }

    /// Restore @p amount hit points. Ignored once defeated.
    HealthChange ApplyHeal(int32_t amount) noexcept {
        HealthChange change{current, current, 0, 0, false};
        if (amount <= 0 || defeated) {
            return change;
        }
        const int64_t raw = static_cast<int64_t>(current) + amount;
        current = exceed ? static_cast<int32_t>(raw)
                         : static_cast<int32_t>(std::min<int64_t>(raw, max));
        change.current = current;
        change.applied = current - change.previous;
        return change;
    }

    [[nodiscard]] bool IsDefeated() const noexcept { return defeated; }
};

// ── Energy ──────────────────────────────────────────────────────────────

/// Result of an Energy mutation.
struct EnergyChange {
    int32_t previous = 0;
    int32_t current = 0;
    int32_t overkill = 0;   ///< Exhaustion beyond zero.
    bool exhausted = false; ///< This mutation set noEnergy.
    bool restored = false;  ///< This mutation was a full restore.

    [[nodiscard]] bool Changed() const noexcept { return previous != current; }
};

/// Stamina-like resource mirroring Health.
///
/// Reaching zero through exhaustion sets `noEnergy`; while it is set boosts
/// are ignored and only FullRestore() recovers the pool. God mode blocks
/// exhaustion but not boosts.
struct Energy {
    int32_t current = 100;
    int32_t max = 100;
    bool exceed = false;
    bool godMode = false;
    bool noEnergy = false;

    Energy() = default;
    explicit Energy(int32_t maxEnergy) : current(maxEnergy), max(maxEnergy) {}

    EnergyChange ApplyExhaustion(int32_t amount) noexcept {
        EnergyChange change{current, current, 0, false, false};
        if (amount <= 0 || godMode) {
            return change;
        }

        const int64_t raw = static_cast<int64_t>(current) - amount;
        if (raw <= 0) {
            change.overkill = static_cast<int32_t>(-raw);
            current = exceed ? static_cast<int32_t>(raw) : 0;
            change.exhausted = !noEnergy;
            noEnergy = true;
        } else {
            current = static_cast<int32_t>(raw);
        }
        change.current = current;
        return change;
    }

    EnergyChange ApplyBoost(int32_t amount) noexcept {
        EnergyChange change{current, current, 0, false, false};
        if (amount <= 0 || noEnergy) {
            return change;
        }
        const int64_t raw = static_cast<int64_t>(current) + amount;
        current = exceed ? static_cast<int32_t>(raw)
                         : static_cast<int32_t>(std::min<int64_t>(raw, max));
        change.current = current;
        return change;
    }

    /// Refill to max and clear noEnergy.
    EnergyChange FullRestore() noexcept {
        EnergyChange change{current, max, 0, false, true};
        current = max;
        noEnergy = false;
        return change;
    }
};

// ── Status effects ──────────────────────────────────────────────────────

/// One active status effect on an entity.
struct StatusEffectInstance {
    StatusEffectKind kind = StatusEffectKind::None;
    int32_t level = 1;
    int32_t remainingTicks = 0;  ///< Status ticks until removal.
    DamageType sourceType = DamageType::Physical;
    int32_t tickAccumulator = 0; ///< Status ticks processed so far.
    float slowAmount = 0.0f;     ///< Chill only, fraction of speed removed.
    cre::ecs::Entity source;
};

/// Active status effects on an entity, at most one per kind.
///
/// Re-applying a kind refreshes the existing instance: level, remaining
/// duration and slow become the maximum of old and new.
struct StatusHolder {
    std::vector<StatusEffectInstance> effects;

    StatusEffectInstance& Apply(const StatusEffectInstance& incoming) {
        for (auto& existing : effects) {
            if (existing.kind == incoming.kind) {
                existing.level = std::max(existing.level, incoming.level);
                existing.remainingTicks = std::max(existing.remainingTicks,
                                                   incoming.remainingTicks);
                existing.slowAmount = std::max(existing.slowAmount, incoming.slowAmount);
                existing.sourceType = incoming.sourceType;
                existing.source = incoming.source;
                return existing;
            }
        }
        effects.push_back(incoming);
        return effects.back();
    }

    [[nodiscard]] const StatusEffectInstance* Find(StatusEffectKind kind) const {
        for (const auto& e : effects) {
            if (e.kind == kind) {
                return &e;
            }
        }
        return nullptr;
    }

    [[nodiscard]] bool Has(StatusEffectKind kind) const { return Find(kind) != nullptr; }

    /// Strongest active chill slow, 0 when none.
    [[nodiscard]] float SlowAmount() const {
        float slow = 0.0f;
        for (const auto& e : effects) {
            if (e.kind == StatusEffectKind::Chill && e.remainingTicks > 0) {
                slow = std::max(slow, e.slowAmount);
            }
        }
        return slow;
    }

    /// Dispel every instance of @p kind.
    void Remove(StatusEffectKind kind) {
        std::erase_if(effects, [kind](const StatusEffectInstance& e) {
            return e.kind == kind;
        });
    }

    void RemoveExpired() {
        std::erase_if(effects, [](const StatusEffectInstance& e) {
            return e.remainingTicks <= 0;
        });
    }
};

// ── Spells and character ────────────────────────────────────────────────

/// Spells an entity may cast, with their upgrade level.
struct SpellLoadout {
    std::unordered_map<std::string, int32_t> levels;

    [[nodiscard]] int32_t LevelOf(const std::string& spellId) const {
        auto it = levels.find(spellId);
        return it != levels.end() ? it->second : 1;
    }
};

/// Remaining cooldown per spell id, in seconds.
struct SpellCooldowns {
    std::unordered_map<std::string, float> remaining;

    [[nodiscard]] bool IsReady(const std::string& spellId) const {
        auto it = remaining.find(spellId);
        return it == remaining.end() || it->second <= 0.0f;
    }

    [[nodiscard]] float Remaining(const std::string& spellId) const {
        auto it = remaining.find(spellId);
        return it != remaining.end() ? std::max(0.0f, it->second) : 0.0f;
    }

    void Start(const std::string& spellId, float seconds) {
        if (seconds > 0.0f) {
            remaining[spellId] = seconds;
        }
    }

    void Tick(float dt) {
        for (auto& [id, time] : remaining) {
            time -= dt;
        }
        std::erase_if(remaining, [](const auto& entry) { return entry.second <= 0.0f; });
    }
};

/// Raw attributes and the stats derived from them.
struct CharacterSheet {
    CharacterStats stats;
    DerivedCombatStats derived;
};

}  // namespace cre::game
