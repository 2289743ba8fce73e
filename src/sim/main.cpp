/// @file main.cpp
/// @brief cre_sim entry point.
///
/// Runs one scripted encounter: a player caster surrounded by a ring of
/// dummies casts every spell in the book at the nearest dummy whenever it
/// is off cooldown, for a configured number of physics ticks.
///
/// Usage: cre_sim [--config <path>] [--spells <path>]

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <numbers>
#include <string>
#include <string_view>
#include <vector>

#include "cre/foundation/combat_logger.hpp"
#include "cre/foundation/config_manager.hpp"
#include "cre/game/combat_settings.hpp"
#include "cre/game/combat_world.hpp"
#include "cre/game/spell_book.hpp"
#include "cre/version.hpp"

namespace {

using cre::ecs::Entity;
using cre::foundation::ConfigManager;
namespace game = cre::game;

constexpr const char* kDefaultConfigPath = "config/cre.yaml";

std::filesystem::path parseArg(int argc, char* argv[], std::string_view flag) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == flag) {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

/// --config flag > CRE_CONFIG_PATH env > default.
std::filesystem::path resolveConfigPath(int argc, char* argv[]) {
    auto path = parseArg(argc, argv, "--config");
    if (!path.empty()) {
        return path;
    }
    if (const char* env = std::getenv("CRE_CONFIG_PATH"); env != nullptr) {
        return env;
    }
    return kDefaultConfigPath;
}

struct SimConfig {
    int32_t ticks = 600;
    int32_t enemyCount = 5;
    float enemyDistance = 220.0f;
    int32_t enemyHealth = 120;
    game::CharacterStats hero = game::CharacterStats::WithValues(14, 10, 9, 7, 5, 3);
};

SimConfig buildSimConfig(const ConfigManager& config) {
    SimConfig cfg;

    auto ticks = config.get<int>("sim.ticks");
    if (ticks) {
        cfg.ticks = ticks.value();
    }

    auto enemies = config.get<int>("sim.enemy_count");
    if (enemies) {
        cfg.enemyCount = enemies.value();
    }

    auto distance = config.get<float>("sim.enemy_distance");
    if (distance) {
        cfg.enemyDistance = distance.value();
    }

    auto health = config.get<int>("sim.enemy_health");
    if (health) {
        cfg.enemyHealth = health.value();
    }

    auto level = config.get<int>("sim.hero.level");
    if (level) {
        cfg.hero.level = level.value();
    }

    for (auto attr : {game::Attribute::Strength, game::Attribute::Vitality,
                      game::Attribute::Agility, game::Attribute::Intelligence,
                      game::Attribute::Luck}) {
        auto value = config.get<double>("sim.hero." + std::string(game::ToString(attr)));
        if (value) {
            cfg.hero.Set(attr, value.value());
        }
    }

    return cfg;
}

std::filesystem::path resolveSpellsPath(int argc, char* argv[], const ConfigManager& config,
                                        const std::filesystem::path& configPath) {
    auto path = parseArg(argc, argv, "--spells");
    if (!path.empty()) {
        return path;
    }
    auto fromConfig = config.get<std::string>("spells.path");
    std::filesystem::path spells = fromConfig ? fromConfig.value() : "spells.yaml";
    if (spells.is_relative()) {
        spells = configPath.parent_path() / spells;
    }
    return spells;
}

/// Nearest undefeated enemy to @p from, or an invalid handle.
Entity nearestEnemy(const game::CombatWorld& world, const game::Vector3& from,
                    const std::vector<Entity>& enemies) {
    Entity best;
    float bestDistance = 0.0f;
    for (auto enemy : enemies) {
        const auto* health = world.HealthOf(enemy);
        auto position = world.PositionOf(enemy);
        if (!world.IsAlive(enemy) || health == nullptr || health->IsDefeated() || !position) {
            continue;
        }
        const float d = game::PlanarDistance(from, *position);
        if (!best.isValid() || d < bestDistance) {
            best = enemy;
            bestDistance = d;
        }
    }
    return best;
}

} // namespace

int main(int argc, char* argv[]) {
    const auto configPath = resolveConfigPath(argc, argv);

    ConfigManager config;
    auto loadResult = config.load(configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto settings = game::LoadCombatSettings(config);
    if (!settings) {
        std::cerr << "Invalid combat settings: " << settings.error().message() << "\n";
        return EXIT_FAILURE;
    }

    game::SpellBook spells;
    const auto spellsPath = resolveSpellsPath(argc, argv, config, configPath);
    auto spellResult = spells.LoadFromFile(spellsPath);
    if (!spellResult) {
        std::cerr << "Failed to load spells: " << spellResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    const auto sim = buildSimConfig(config);
    game::CombatWorld world(settings.value(), &spells);

    game::CombatantDesc heroDesc;
    heroDesc.team = game::CombatTeam::Player;
    heroDesc.maxEnergy = 200;
    const auto hero = world.CreateCombatant(heroDesc);
    auto derived = world.SetCharacterStats(hero, sim.hero);
    if (!derived) {
        std::cerr << "Invalid hero stats: " << derived.error().message() << "\n";
        return EXIT_FAILURE;
    }

    std::vector<Entity> enemies;
    for (int32_t i = 0; i < sim.enemyCount; ++i) {
        const float angle = 2.0f * std::numbers::pi_v<float> * static_cast<float>(i) /
                            static_cast<float>(std::max(sim.enemyCount, 1));
        game::CombatantDesc desc;
        desc.position = game::Vector3::FromHeading(angle) * sim.enemyDistance;
        desc.maxHealth = sim.enemyHealth;
        enemies.push_back(world.CreateCombatant(desc));
    }

    int32_t defeats = 0;
    int32_t statuses = 0;
    world.Events().defeated.connect([&](Entity, int32_t) { ++defeats; });
    world.Events().statusApplied.connect([&](Entity, game::StatusEffectKind) { ++statuses; });

    std::cout << "cre_sim " << cre::Version::string << ": " << spells.Size() << " spells, "
              << enemies.size() << " dummies, " << sim.ticks << " ticks\n";

    const auto spellIds = spells.SpellIds();
    const auto heroPosition = world.PositionOf(hero).value_or(game::Vector3{});
    const float dt = settings.value().PhysicsStep();
    int32_t casts = 0;

    world.BeginCombatPhase();
    for (int32_t tick = 0; tick < sim.ticks; ++tick) {
        const auto target = nearestEnemy(world, heroPosition, enemies);
        if (!target.isValid()) {
            break;
        }
        const auto targetPosition = world.PositionOf(target).value_or(game::Vector3{});
        const auto direction = targetPosition - heroPosition;

        // Drink a potion once the caster runs dry.
        if (const auto* energy = world.EnergyOf(hero); energy != nullptr && energy->noEnergy) {
            world.Damage().RestoreEnergy(hero);
        }

        for (const auto& id : spellIds) {
            const auto* cooldowns = world.CooldownsOf(hero);
            if (cooldowns != nullptr && !cooldowns->IsReady(id)) {
                continue;
            }
            auto cast = world.CastSpell(hero, id, direction, targetPosition);
            if (cast) {
                ++casts;
            } else if (cast.error().code() != cre::foundation::ErrorCode::InsufficientEnergy) {
                std::cerr << "Cast of '" << id << "' failed: " << cast.error().message() << "\n";
            }
        }

        world.Step(dt);
    }
    world.EndCombatPhase();

    std::cout << "Finished after " << world.TickCount() << " ticks: " << casts << " casts, "
              << defeats << " defeated, " << statuses << " status effects applied\n";
    for (auto enemy : enemies) {
        const auto* health = world.HealthOf(enemy);
        std::cout << "  dummy " << enemy.id() << ": "
                  << (health != nullptr ? std::to_string(health->current) + "/" +
                                              std::to_string(health->max)
                                        : std::string("defeated"))
                  << "\n";
    }

    auto flushed = cre::foundation::CombatLogger::instance().flush();
    if (!flushed) {
        std::cerr << "Log flush failed: " << flushed.error().message() << "\n";
    }
    return EXIT_SUCCESS;
}
