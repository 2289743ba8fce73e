#pragma once

/// @file spell_book.hpp
/// @brief Spell definitions loaded from YAML or JSON data files.

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "cre/foundation/combat_result.hpp"
#include "cre/game/combat_types.hpp"
#include "cre/game/projectile_types.hpp"

namespace cre::game {

enum class SpellKind : uint8_t {
    Projectile,
    ProjectileAoe
};

/// Data names: PROJECTILE, PROJECTILE_AOE.
[[nodiscard]] std::string_view ToString(SpellKind kind);
[[nodiscard]] std::optional<SpellKind> ParseSpellKind(std::string_view name);

/// Highest upgrade level a spell entry may declare.
inline constexpr int32_t kMaxSpellLevel = 100;

/// A spell at one upgrade level.
struct SpellDefinition {
    std::string id;
    std::string name;
    SpellKind kind = SpellKind::Projectile;
    int32_t level = 1;

    int32_t damage = 10;
    float cooldown = 1.0f;
    float range = 500.0f;
    float speed = 300.0f;
    float hitRadius = 5.0f;
    int32_t energyCost = 0;
    DamageType damageType = DamageType::Physical;
    StatusPayload status;
    TrajectoryParams trajectory;
};

/// Registry of spell definitions.
///
/// File layout (JSON files are read as YAML):
/// @code
///   ice_lance:
///     name: Ice Lance
///     type: PROJECTILE
///     damage: 18
///     cooldown: 1.2
///     range: 600
///     speed: 450
///     damage_type: ice
///     status_effect: { kind: chill, duration: 2, slow_amount: 0.3 }
///     trajectory_properties: { type: PIERCING, pierce_count: 1 }
///     upgrades:
///       level_2: { damage: 24, trajectory_properties: { pierce_count: 2 } }
/// @endcode
///
/// Upgrades are applied cumulatively: level 3 is the base entry with
/// level_2 and then level_3 merged over it. Nested maps merge key by key.
/// Every level of every spell is parsed at load time, so a malformed
/// upgrade fails the load rather than a later cast. Upgrade keys above
/// kMaxSpellLevel are rejected, and so are forking spells whose
/// child_spell_id chain leads back to themselves.
class SpellBook {
public:
    SpellBook() = default;

    /// Load spells from a file, replacing the current contents.
    /// On failure the book is left unchanged.
    /// @return SpellDataInvalid for unreadable files, bad syntax, unknown
    ///         archetype or enum names and malformed field types.
    foundation::CombatResult<void> LoadFromFile(const std::filesystem::path& path);

    foundation::CombatResult<void> LoadFromString(std::string_view text);

    /// Level 1 definition, or nullptr.
    [[nodiscard]] const SpellDefinition* Find(std::string_view id) const;

    [[nodiscard]] bool Contains(std::string_view id) const { return Find(id) != nullptr; }

    /// The spell with upgrades applied up to @p level. Levels past the last
    /// upgrade resolve to the last upgrade.
    /// @return UnknownSpell, or InvalidArgument for a level below 1.
    [[nodiscard]] foundation::CombatResult<SpellDefinition>
    Resolve(std::string_view id, int32_t level) const;

    /// Highest level with an upgrade entry, 1 without upgrades, 0 for an
    /// unknown id.
    [[nodiscard]] int32_t MaxLevel(std::string_view id) const;

    /// Spell ids in lexicographic order.
    [[nodiscard]] std::vector<std::string> SpellIds() const;

    [[nodiscard]] std::size_t Size() const noexcept { return spells_.size(); }

    /// Lookup suitable for projectile validation.
    [[nodiscard]] SpellExists ExistsFn() const;

private:
    foundation::CombatResult<void> loadNode(const YAML::Node& root, std::string_view origin);

    /// Index 0 is level 1.
    std::map<std::string, std::vector<SpellDefinition>, std::less<>> spells_;
};

}  // namespace cre::game
