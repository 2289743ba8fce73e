/// @file spell_book.cpp
/// @brief SpellBook loading, upgrade merging and lookup.

#include "cre/game/spell_book.hpp"

#include <algorithm>
#include <charconv>
#include <functional>
#include <map>
#include <string>
#include <utility>

#include "cre/foundation/combat_logger.hpp"

namespace cre::game {

using foundation::CombatError;
using foundation::CombatResult;
using foundation::ErrorCode;
using foundation::LogCategory;

namespace {

constexpr std::string_view kUpgradePrefix = "level_";

CombatError invalid(std::string_view spellId, const std::string& detail) {
    return CombatError(ErrorCode::SpellDataInvalid,
                       "spell '" + std::string(spellId) + "': " + detail,
                       std::string(spellId));
}

template <typename T>
void readIf(const YAML::Node& node, const char* key, T& out) {
    if (const auto value = node[key]) {
        out = value.as<T>();
    }
}

void readIf(const YAML::Node& node, const char* key, std::optional<float>& out) {
    if (const auto value = node[key]) {
        out = value.as<float>();
    }
}

/// "level_3" -> 3. Anything else, or a level outside [2, kMaxSpellLevel],
/// is rejected.
std::optional<int32_t> parseUpgradeLevel(std::string_view key) {
    if (!key.starts_with(kUpgradePrefix)) {
        return std::nullopt;
    }
    auto digits = key.substr(kUpgradePrefix.size());
    int32_t level = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), level);
    if (ec != std::errc{} || ptr != digits.data() + digits.size() || level < 2 ||
        level > kMaxSpellLevel) {
        return std::nullopt;
    }
    return level;
}

/// Merge @p overlay into @p target. Maps merge recursively, everything else
/// replaces. `divergence` markers carry no data and are skipped.
void mergeInto(YAML::Node target, const YAML::Node& overlay) {
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        const auto key = it->first.as<std::string>();
        if (key == "divergence") {
            continue;
        }
        YAML::Node existing = target[key];
        if (it->second.IsMap() && existing.IsMap()) {
            mergeInto(existing, it->second);
        } else {
            target[key] = YAML::Clone(it->second);
        }
    }
}

CombatResult<TrajectoryParams> parseTrajectory(std::string_view spellId, const YAML::Node& node,
                                               TrajectoryArchetype fallback) {
    TrajectoryParams t;
    t.archetype = fallback;
    if (!node) {
        return CombatResult<TrajectoryParams>::ok(t);
    }
    if (!node.IsMap()) {
        return CombatResult<TrajectoryParams>::err(
            invalid(spellId, "trajectory_properties must be a mapping"));
    }

    if (const auto type = node["type"]) {
        const auto name = type.as<std::string>();
        auto archetype = ParseArchetype(name);
        if (!archetype) {
            return CombatResult<TrajectoryParams>::err(
                invalid(spellId, "unknown trajectory type '" + name + "'"));
        }
        t.archetype = *archetype;
    }

    readIf(node, "homing_strength", t.homingStrength);
    readIf(node, "orbit_radius", t.orbitRadius);
    readIf(node, "angular_speed", t.angularSpeed);
    readIf(node, "initial_angle", t.initialAngle);
    readIf(node, "duration", t.duration);
    readIf(node, "amplitude", t.amplitude);
    readIf(node, "frequency", t.frequency);
    readIf(node, "max_chains", t.maxChains);
    readIf(node, "chain_radius", t.chainRadius);
    readIf(node, "pierce_count", t.pierceCount);
    readIf(node, "travel_speed", t.travelSpeed);
    readIf(node, "aoe_radius", t.aoeRadius);
    readIf(node, "aoe_damage", t.aoeDamage);
    readIf(node, "delay_after_arrival", t.delayAfterArrival);

    if (const auto condition = node["fork_condition_type"]) {
        const auto name = condition.as<std::string>();
        auto parsed = ParseForkCondition(name);
        if (!parsed) {
            return CombatResult<TrajectoryParams>::err(
                invalid(spellId, "unknown fork condition '" + name + "'"));
        }
        t.forkCondition = *parsed;
    }
    readIf(node, "fork_condition_value", t.forkConditionValue);
    readIf(node, "fork_count", t.forkCount);
    readIf(node, "fork_angle_spread", t.forkAngleSpread);
    readIf(node, "child_spell_id", t.childSpellId);

    readIf(node, "expansion_speed", t.expansionSpeed);
    readIf(node, "rotation_speed", t.rotationSpeed);
    readIf(node, "base_travel_speed", t.baseTravelSpeed);
    readIf(node, "initial_radius", t.initialRadius);
    readIf(node, "max_radius", t.maxRadius);
    readIf(node, "growth_rate", t.growthRate);
    readIf(node, "growth_duration", t.growthDuration);

    return CombatResult<TrajectoryParams>::ok(t);
}

CombatResult<SpellDefinition> parseSpell(const std::string& id, const YAML::Node& node,
                                         int32_t level) {
    if (!node.IsMap()) {
        return CombatResult<SpellDefinition>::err(invalid(id, "entry must be a mapping"));
    }

    SpellDefinition def;
    def.id = id;
    def.name = id;
    def.level = level;

    try {
        readIf(node, "name", def.name);

        if (const auto type = node["type"]) {
            const auto name = type.as<std::string>();
            auto kind = ParseSpellKind(name);
            if (!kind) {
                return CombatResult<SpellDefinition>::err(
                    invalid(id, "unknown spell type '" + name + "'"));
            }
            def.kind = *kind;
        }

        readIf(node, "damage", def.damage);
        readIf(node, "cooldown", def.cooldown);
        readIf(node, "range", def.range);
        readIf(node, "speed", def.speed);
        readIf(node, "hit_radius", def.hitRadius);
        readIf(node, "energy_cost", def.energyCost);

        if (const auto type = node["damage_type"]) {
            const auto name = type.as<std::string>();
            auto parsed = ParseDamageType(name);
            if (!parsed) {
                return CombatResult<SpellDefinition>::err(
                    invalid(id, "unknown damage type '" + name + "'"));
            }
            def.damageType = *parsed;
        }

        if (const auto status = node["status_effect"]) {
            if (!status.IsMap()) {
                return CombatResult<SpellDefinition>::err(
                    invalid(id, "status_effect must be a mapping"));
            }
            if (const auto kind = status["kind"]) {
                const auto name = kind.as<std::string>();
                auto parsed = ParseStatusEffectKind(name);
                if (!parsed) {
                    return CombatResult<SpellDefinition>::err(
                        invalid(id, "unknown status effect '" + name + "'"));
                }
                def.status.kind = *parsed;
            }
            readIf(status, "duration", def.status.duration);
            readIf(status, "level", def.status.level);
            readIf(status, "slow_amount", def.status.slowAmount);
        }

        const auto fallback = def.kind == SpellKind::ProjectileAoe
                                  ? TrajectoryArchetype::GroundArea
                                  : TrajectoryArchetype::Straight;
        auto trajectory = parseTrajectory(id, node["trajectory_properties"], fallback);
        if (trajectory.hasError()) {
            return CombatResult<SpellDefinition>::err(trajectory.error());
        }
        def.trajectory = std::move(trajectory.value());
    } catch (const YAML::Exception& e) {
        return CombatResult<SpellDefinition>::err(invalid(id, e.what()));
    }

    return CombatResult<SpellDefinition>::ok(std::move(def));
}

/// Every level of one spell entry, level 1 first.
CombatResult<std::vector<SpellDefinition>> parseLevels(const std::string& id,
                                                        const YAML::Node& entry) {
    using LevelsResult = CombatResult<std::vector<SpellDefinition>>;
    if (!entry.IsMap()) {
        return LevelsResult::err(invalid(id, "entry must be a mapping"));
    }

    try {
        // Check every upgrade key before merging anything.
        int32_t maxLevel = 1;
        const auto upgrades = entry["upgrades"];
        if (upgrades) {
            if (!upgrades.IsMap()) {
                return LevelsResult::err(invalid(id, "upgrades must be a mapping"));
            }
            for (auto up = upgrades.begin(); up != upgrades.end(); ++up) {
                const auto key = up->first.as<std::string>();
                auto level = parseUpgradeLevel(key);
                if (!level) {
                    return LevelsResult::err(invalid(
                        id, "bad upgrade key '" + key + "', expected level_2 to level_" +
                                std::to_string(kMaxSpellLevel)));
                }
                if (!up->second.IsMap()) {
                    return LevelsResult::err(
                        invalid(id, "upgrade '" + key + "' must be a mapping"));
                }
                maxLevel = std::max(maxLevel, *level);
            }
        }

        YAML::Node merged = YAML::Clone(entry);
        merged.remove("upgrades");

        std::vector<SpellDefinition> levels;
        levels.reserve(static_cast<std::size_t>(maxLevel));
        for (int32_t level = 1; level <= maxLevel; ++level) {
            if (level > 1) {
                const auto key = std::string(kUpgradePrefix) + std::to_string(level);
                if (const auto up = upgrades[key]) {
                    mergeInto(merged, up);
                }
            }
            auto parsed = parseSpell(id, merged, level);
            if (parsed.hasError()) {
                return LevelsResult::err(parsed.error());
            }
            levels.push_back(std::move(parsed.value()));
        }
        return LevelsResult::ok(std::move(levels));
    } catch (const YAML::Exception& e) {
        return LevelsResult::err(invalid(id, e.what()));
    }
}

using SpellTable = std::map<std::string, std::vector<SpellDefinition>, std::less<>>;

/// Child spells a forking spell may split into, across all its levels.
std::vector<std::string_view> forkChildren(const std::vector<SpellDefinition>& levels) {
    std::vector<std::string_view> children;
    for (const auto& def : levels) {
        const auto& t = def.trajectory;
        if (t.archetype != TrajectoryArchetype::Forking || t.childSpellId.empty()) {
            continue;
        }
        if (std::find(children.begin(), children.end(), t.childSpellId) == children.end()) {
            children.push_back(t.childSpellId);
        }
    }
    return children;
}

/// Reject child_spell_id chains that lead back to a spell already on the
/// chain. Such a chain forks without end.
CombatResult<void> checkForkCycles(const SpellTable& spells) {
    enum class Mark : uint8_t { Unvisited, OnPath, Done };
    std::map<std::string_view, Mark> marks;
    std::vector<std::string_view> path;

    std::function<CombatResult<void>(std::string_view)> visit =
        [&](std::string_view id) -> CombatResult<void> {
        auto spell = spells.find(id);
        if (spell == spells.end()) {
            return CombatResult<void>::ok();
        }
        auto& mark = marks[id];
        if (mark == Mark::Done) {
            return CombatResult<void>::ok();
        }
        if (mark == Mark::OnPath) {
            std::string chain;
            auto start = std::find(path.begin(), path.end(), id);
            for (auto it = start; it != path.end(); ++it) {
                chain += std::string(*it) + " -> ";
            }
            chain += std::string(id);
            return CombatResult<void>::err(invalid(id, "fork cycle " + chain));
        }

        mark = Mark::OnPath;
        path.push_back(id);
        for (auto child : forkChildren(spell->second)) {
            auto result = visit(child);
            if (result.hasError()) {
                return result;
            }
        }
        path.pop_back();
        marks[id] = Mark::Done;
        return CombatResult<void>::ok();
    };

    for (const auto& [id, levels] : spells) {
        auto result = visit(id);
        if (result.hasError()) {
            return result;
        }
    }
    return CombatResult<void>::ok();
}

}  // namespace

std::string_view ToString(SpellKind kind) {
    switch (kind) {
        case SpellKind::Projectile:    return "PROJECTILE";
        case SpellKind::ProjectileAoe: return "PROJECTILE_AOE";
    }
    return "UNKNOWN";
}

std::optional<SpellKind> ParseSpellKind(std::string_view name) {
    for (auto kind : {SpellKind::Projectile, SpellKind::ProjectileAoe}) {
        if (detail::equalsIgnoreCase(name, ToString(kind))) {
            return kind;
        }
    }
    return std::nullopt;
}

// ── Loading ─────────────────────────────────────────────────────────────

CombatResult<void> SpellBook::LoadFromFile(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        return CombatResult<void>::err(
            CombatError(ErrorCode::SpellDataInvalid, "failed to open spell file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return CombatResult<void>::err(CombatError(
            ErrorCode::SpellDataInvalid, path.string() + ": parse error: " + e.what()));
    }
    return loadNode(root, path.string());
}

CombatResult<void> SpellBook::LoadFromString(std::string_view text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(text));
    } catch (const YAML::ParserException& e) {
        return CombatResult<void>::err(
            CombatError(ErrorCode::SpellDataInvalid, std::string("parse error: ") + e.what()));
    }
    return loadNode(root, "<string>");
}

CombatResult<void> SpellBook::loadNode(const YAML::Node& root, std::string_view origin) {
    decltype(spells_) loaded;

    if (root && !root.IsNull()) {
        if (!root.IsMap()) {
            return CombatResult<void>::err(CombatError(
                ErrorCode::SpellDataInvalid,
                std::string(origin) + ": spell data root must be a mapping"));
        }

        for (auto it = root.begin(); it != root.end(); ++it) {
            std::string id;
            try {
                id = it->first.as<std::string>();
            } catch (const YAML::Exception& e) {
                return CombatResult<void>::err(CombatError(
                    ErrorCode::SpellDataInvalid, std::string(origin) + ": bad spell id: " + e.what()));
            }
            auto levels = parseLevels(id, it->second);
            if (levels.hasError()) {
                return CombatResult<void>::err(levels.error());
            }
            loaded.emplace(id, std::move(levels.value()));
        }
    }

    if (auto cycles = checkForkCycles(loaded); cycles.hasError()) {
        return cycles;
    }

    spells_ = std::move(loaded);
    CRE_LOG_INFO(LogCategory::Spells,
                 "Loaded " + std::to_string(spells_.size()) + " spells from " +
                     std::string(origin));
    return CombatResult<void>::ok();
}

// ── Lookup ──────────────────────────────────────────────────────────────

const SpellDefinition* SpellBook::Find(std::string_view id) const {
    auto it = spells_.find(id);
    return it != spells_.end() ? &it->second.front() : nullptr;
}

CombatResult<SpellDefinition> SpellBook::Resolve(std::string_view id, int32_t level) const {
    auto it = spells_.find(id);
    if (it == spells_.end()) {
        return CombatResult<SpellDefinition>::err(
            CombatError(ErrorCode::UnknownSpell, "unknown spell '" + std::string(id) + "'",
                        std::string(id)));
    }
    if (level < 1) {
        return CombatResult<SpellDefinition>::err(
            CombatError(ErrorCode::InvalidArgument,
                        "spell level must be at least 1, got " + std::to_string(level)));
    }
    const auto& levels = it->second;
    const auto index = std::min(static_cast<std::size_t>(level), levels.size()) - 1;
    return CombatResult<SpellDefinition>::ok(levels[index]);
}

int32_t SpellBook::MaxLevel(std::string_view id) const {
    auto it = spells_.find(id);
    return it != spells_.end() ? static_cast<int32_t>(it->second.size()) : 0;
}

std::vector<std::string> SpellBook::SpellIds() const {
    std::vector<std::string> ids;
    ids.reserve(spells_.size());
    for (const auto& [id, levels] : spells_) {
        ids.push_back(id);
    }
    return ids;
}

SpellExists SpellBook::ExistsFn() const {
    return [this](std::string_view id) { return Contains(id); };
}

}  // namespace cre::game
