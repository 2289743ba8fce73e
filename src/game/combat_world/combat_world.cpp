/// @file combat_world.cpp
/// @brief CombatWorld wiring, casting and tick driver.

#include "cre/game/combat_world.hpp"

#include <string>
#include <utility>

#include "cre/foundation/combat_logger.hpp"
#include "cre/game/cooldown_system.hpp"
#include "cre/game/status_effect_system.hpp"

namespace cre::game {

using cre::ecs::Entity;
using foundation::CombatError;
using foundation::CombatResult;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

CombatWorld::CombatWorld(const CombatSettings& settings, const SpellBook* spells)
    : settings_(settings),
      spells_(spells),
      index_(settings.spatialCellSize),
      rng_(settings.randomSeed) {
    entities_.RegisterStorage(&transforms_);
    entities_.RegisterStorage(&volumes_);
    entities_.RegisterStorage(&teams_);
    entities_.RegisterStorage(&healths_);
    entities_.RegisterStorage(&energies_);
    entities_.RegisterStorage(&statuses_);
    entities_.RegisterStorage(&resistances_);
    entities_.RegisterStorage(&sheets_);
    entities_.RegisterStorage(&loadouts_);
    entities_.RegisterStorage(&cooldowns_);
    entities_.RegisterStorage(&projectiles_);

    scheduler_.Register<CooldownSystem>(cooldowns_);
    trajectory_ = &scheduler_.Register<TrajectorySystem>(
        entities_, projectiles_, transforms_, teams_, healths_, index_, hits_);
    pipeline_ = &scheduler_.Register<DamagePipeline>(
        entities_, healths_, energies_, statuses_, resistances_, hits_, events_);
    scheduler_.Register<StatusEffectSystem>(statuses_, healths_, *pipeline_, rng_);
    scheduler_.SetFixedTimeStep(settings_.statusTickInterval);

    if (!scheduler_.Build()) {
        CRE_LOG_ERROR(LogCategory::Core, "System schedule failed: " + scheduler_.GetLastError());
    }

    trajectory_->SetSpellLookup([this](std::string_view id) { return spellExists(id); });
    trajectory_->SetForkHandler([this](const ForkRequest& request) { handleFork(request); });
    pipeline_->SetDefeatHandler([this](Entity entity) { handleDefeat(entity); });
}

CombatWorld::~CombatWorld() = default;

// ── Combatants ──────────────────────────────────────────────────────────

Entity CombatWorld::CreateCombatant(const CombatantDesc& desc) {
    const auto entity = entities_.Create();
    transforms_.Add(entity, Transform{desc.position});
    volumes_.Add(entity, HitVolume{desc.hitRadius});
    teams_.Add(entity, TeamMember{desc.team});
    healths_.Add(entity, desc.maxHealth);
    energies_.Add(entity, desc.maxEnergy);
    statuses_.Add(entity);
    resistances_.Add(entity);
    loadouts_.Add(entity);
    cooldowns_.Add(entity);
    index_.Insert(entity, desc.position, desc.hitRadius);

    CRE_LOG_DEBUG(LogCategory::Core, "Combatant " + std::to_string(entity.raw) + " created");
    return entity;
}

CombatResult<DerivedCombatStats> CombatWorld::SetCharacterStats(Entity entity,
                                                                const CharacterStats& stats) {
    if (!entities_.IsAlive(entity)) {
        return foundation::makeError<DerivedCombatStats>(
            ErrorCode::EntityNotFound, "no such entity " + std::to_string(entity.raw));
    }
    auto derived = DeriveCombatStats(stats, settings_.stats);
    if (derived.hasError()) {
        return derived;
    }
    auto& sheet = sheets_.GetOrAdd(entity);
    sheet.stats = stats;
    sheet.derived = derived.value();
    return derived;
}

CombatResult<void> CombatWorld::SetPosition(Entity entity, const Vector3& position) {
    auto* transform = transforms_.TryGet(entity);
    if (transform == nullptr) {
        return CombatResult<void>::err(
            CombatError(ErrorCode::EntityNotFound, "no such entity " + std::to_string(entity.raw)));
    }
    transform->position = position;
    if (index_.Contains(entity)) {
        index_.Update(entity, position);
    }
    return CombatResult<void>::ok();
}

CombatResult<void> CombatWorld::SetResistance(Entity entity, DamageType type, float percent) {
    auto* resistances = resistances_.TryGet(entity);
    if (resistances == nullptr) {
        return CombatResult<void>::err(CombatError(
            ErrorCode::ComponentNotFound, "entity " + std::to_string(entity.raw) +
                                              " has no resistances"));
    }
    resistances->Set(type, percent);
    return CombatResult<void>::ok();
}

CombatResult<void> CombatWorld::LearnSpell(Entity entity, const std::string& spellId,
                                           int32_t level) {
    if (!entities_.IsAlive(entity)) {
        return CombatResult<void>::err(
            CombatError(ErrorCode::EntityNotFound, "no such entity " + std::to_string(entity.raw)));
    }
    if (level < 1) {
        return CombatResult<void>::err(
            CombatError(ErrorCode::InvalidArgument, "spell level must be at least 1"));
    }
    loadouts_.GetOrAdd(entity).levels[spellId] = level;
    return CombatResult<void>::ok();
}

// ── Casting ─────────────────────────────────────────────────────────────

CombatResult<Entity> CombatWorld::CastSpell(Entity caster, std::string_view spellId,
                                            const Vector3& direction,
                                            std::optional<Vector3> targetPoint) {
    const std::string id(spellId);

    if (!active_) {
        return foundation::makeError<Entity>(ErrorCode::CombatPhaseInactive,
                                             "cannot cast '" + id + "' outside combat");
    }

    const auto* transform = transforms_.TryGet(caster);
    if (!entities_.IsAlive(caster) || transform == nullptr ||
        (healths_.Has(caster) && healths_.Get(caster).IsDefeated())) {
        return foundation::makeError<Entity>(ErrorCode::CasterNotFound,
                                             "caster " + std::to_string(caster.raw) +
                                                 " cannot cast");
    }

    const auto* loadout = loadouts_.TryGet(caster);
    const int32_t level = loadout != nullptr ? loadout->LevelOf(id) : 1;
    if (spells_ == nullptr) {
        return CombatResult<Entity>::err(CombatError(
            ErrorCode::UnknownSpell, "no spell book for '" + id + "'", id));
    }
    auto resolved = spells_->Resolve(id, level);
    if (resolved.hasError()) {
        return CombatResult<Entity>::err(resolved.error());
    }
    const auto& spell = resolved.value();

    auto* cooldowns = cooldowns_.TryGet(caster);
    if (cooldowns != nullptr && !cooldowns->IsReady(id)) {
        return CombatResult<Entity>::err(CombatError(
            ErrorCode::SpellOnCooldown,
            "'" + id + "' ready in " + std::to_string(cooldowns->Remaining(id)) + " s", id));
    }

    const auto* energy = energies_.TryGet(caster);
    if (energy != nullptr && spell.energyCost > 0 &&
        (energy->noEnergy || energy->current < spell.energyCost)) {
        return CombatResult<Entity>::err(CombatError(
            ErrorCode::InsufficientEnergy,
            "'" + id + "' costs " + std::to_string(spell.energyCost) + " energy, have " +
                std::to_string(energy->current),
            id));
    }

    ProjectileSpec spec;
    spec.spellId = spell.id;
    spec.owner = caster;
    spec.origin = transform->position;
    spec.direction = direction;
    spec.targetPoint = targetPoint;
    spec.damage = spell.damage;
    spec.damageType = spell.damageType;
    spec.status = spell.status;
    spec.speed = spell.speed;
    spec.range = spell.range;
    spec.hitRadius = spell.hitRadius;
    spec.trajectory = spell.trajectory;

    bool critical = false;
    if (const auto* sheet = sheets_.TryGet(caster)) {
        const auto roll = ResolveAttackDamage(sheet->derived, spell.damage, rng_);
        spec.damage = roll.damage;
        critical = roll.critical;
    }

    auto spawned = SpawnProjectile(spec);
    if (spawned.hasError()) {
        return spawned;
    }

    if (cooldowns != nullptr) {
        cooldowns->Start(id, spell.cooldown);
    }
    if (energy != nullptr && spell.energyCost > 0) {
        pipeline_->ApplyExhaustion(caster, spell.energyCost);
    }

    auto& logger = foundation::CombatLogger::instance();
    if (logger.isEnabled(LogLevel::Debug, LogCategory::Spells)) {
        LogContext ctx;
        ctx.entity = caster.raw;
        ctx.spellId = id;
        ctx.extra["level"] = std::to_string(spell.level);
        ctx.extra["damage"] = std::to_string(spec.damage);
        if (critical) {
            ctx.extra["critical"] = "true";
        }
        logger.logWithContext(LogLevel::Debug, LogCategory::Spells, "Spell cast", ctx);
    }
    return spawned;
}

CombatResult<Entity> CombatWorld::SpawnProjectile(const ProjectileSpec& spec) {
    ProjectileSpec adjusted = spec;
    if (const auto* team = teams_.TryGet(spec.owner)) {
        adjusted.team = team->team;
    }
    return trajectory_->Spawn(adjusted);
}

// ── Simulation ──────────────────────────────────────────────────────────

void CombatWorld::Step(float deltaTime) {
    if (!active_) {
        return;
    }
    scheduler_.Execute(deltaTime);
    entities_.FlushDeferred();
    ++ticks_;
}

void CombatWorld::BeginCombatPhase() {
    if (active_) {
        return;
    }
    active_ = true;
    scheduler_.ResetFixedAccumulator();
    CRE_LOG_INFO(LogCategory::Core, "Combat phase started");
}

void CombatWorld::EndCombatPhase() {
    if (!active_) {
        return;
    }
    active_ = false;
    CRE_LOG_INFO(LogCategory::Core,
                 "Combat phase ended after " + std::to_string(ticks_) + " ticks");
}

void CombatWorld::SetSpellBook(const SpellBook* spells) {
    spells_ = spells;
}

void CombatWorld::SetTerrain(const TerrainQuery* terrain) {
    trajectory_->SetTerrain(terrain);
}

// ── Queries ─────────────────────────────────────────────────────────────

bool CombatWorld::IsAlive(Entity entity) const noexcept {
    return entities_.IsAlive(entity);
}

const Health* CombatWorld::HealthOf(Entity entity) const {
    return healths_.TryGet(entity);
}

const Energy* CombatWorld::EnergyOf(Entity entity) const {
    return energies_.TryGet(entity);
}

const StatusHolder* CombatWorld::StatusOf(Entity entity) const {
    return statuses_.TryGet(entity);
}

const CharacterSheet* CombatWorld::SheetOf(Entity entity) const {
    return sheets_.TryGet(entity);
}

const SpellCooldowns* CombatWorld::CooldownsOf(Entity entity) const {
    return cooldowns_.TryGet(entity);
}

std::optional<Vector3> CombatWorld::PositionOf(Entity entity) const {
    if (const auto* transform = transforms_.TryGet(entity)) {
        return transform->position;
    }
    if (const auto* projectile = projectiles_.TryGet(entity)) {
        return projectile->position;
    }
    return std::nullopt;
}

float CombatWorld::SlowOf(Entity entity) const {
    const auto* holder = statuses_.TryGet(entity);
    return holder != nullptr ? holder->SlowAmount() : 0.0f;
}

const Projectile* CombatWorld::ProjectileOf(Entity entity) const {
    return projectiles_.TryGet(entity);
}

std::vector<Entity> CombatWorld::Projectiles() const {
    return projectiles_.Entities();
}

std::size_t CombatWorld::ActiveProjectiles() const {
    return trajectory_->ActiveCount();
}

// ── Internals ───────────────────────────────────────────────────────────

bool CombatWorld::spellExists(std::string_view id) const {
    return spells_ != nullptr && spells_->Contains(id);
}

void CombatWorld::handleFork(const ForkRequest& request) {
    const auto* loadout = loadouts_.TryGet(request.owner);
    const int32_t level = loadout != nullptr ? loadout->LevelOf(request.childSpellId) : 1;

    if (spells_ == nullptr) {
        CRE_LOG_WARN(LogCategory::Trajectory,
                     "Fork child '" + request.childSpellId + "' dropped, no spell book");
        return;
    }
    auto child = spells_->Resolve(request.childSpellId, level);
    if (child.hasError()) {
        CRE_LOG_WARN(LogCategory::Trajectory, std::string(child.error().message()));
        return;
    }
    const auto& spell = child.value();

    for (const auto& heading : request.headings) {
        ProjectileSpec spec;
        spec.spellId = spell.id;
        spec.owner = request.owner;
        spec.team = request.team;
        spec.origin = request.position;
        spec.direction = heading;
        spec.damage = spell.damage;
        spec.damageType = spell.damageType;
        spec.status = spell.status;
        spec.speed = spell.speed;
        spec.range = spell.range;
        spec.hitRadius = spell.hitRadius;
        spec.trajectory = spell.trajectory;

        auto spawned = trajectory_->Spawn(spec);
        if (spawned.hasError()) {
            CRE_LOG_WARN(LogCategory::Trajectory,
                         "Fork child of '" + request.parentSpellId + "' not spawned: " +
                             std::string(spawned.error().message()));
        }
    }
}

void CombatWorld::handleDefeat(Entity entity) {
    trajectory_->CancelOwnedBy(entity);
    index_.Remove(entity);
}

}  // namespace cre::game
