#include "cce/combat/progression_engine.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "cce/foundation/game_logger.hpp"

namespace cce::combat {

using cce::foundation::ErrorCode;
using cce::foundation::GameError;
using cce::foundation::GameResult;
using cce::foundation::LogCategory;

std::string_view toString(ActionKind kind) {
    switch (kind) {
        case ActionKind::DamageDealt:     return "damage_dealt";
        case ActionKind::CriticalHit:     return "critical_hit";
        case ActionKind::Kill:            return "kill";
        case ActionKind::EffectTriggered: return "effect_triggered";
    }
    return "unknown";
}

namespace {

template <typename T>
GameResult<T> noInstance(const WeaponKey& key) {
    return GameResult<T>::err(GameError(ErrorCode::WeaponNotFound,
                                        "no weapon instance " + toString(key)));
}

}  // namespace

ProgressionEngine::ProgressionEngine(WeaponRegistry& registry, CombatLog& log)
    : registry_(registry), log_(log), balance_(registry.Balance()) {
    triggerSlot_ = registry_.OnEffectTriggered().connect(
        [this](const EffectTriggeredEvent& event) { onEffectTriggered(event); });
}

ProgressionEngine::~ProgressionEngine() {
    registry_.OnEffectTriggered().disconnect(triggerSlot_);
}

double ProgressionEngine::actionFactor(ActionKind kind) const {
    switch (kind) {
        case ActionKind::DamageDealt:     return balance_.damageDealtFactor;
        case ActionKind::CriticalHit:     return balance_.criticalHitFactor;
        case ActionKind::Kill:            return balance_.killFactor;
        case ActionKind::EffectTriggered: return balance_.effectTriggeredFactor;
    }
    return 0.0;
}

// ---------------------------------------------------------------------------
// Experience
// ---------------------------------------------------------------------------

ExperienceGrant ProgressionEngine::GrantExperience(WeaponInstance& instance, ActionKind kind,
                                                   double baseExperience) {
    auto& p = instance.progress;
    auto rarity = instance.effective.rarity.value_or(Rarity::Common);

    ExperienceGrant grant;
    auto scaled = std::floor(std::max(0.0, baseExperience) * actionFactor(kind)
                             * balance_.DampeningFor(rarity));
    grant.experienceGained = static_cast<int64_t>(scaled);
    p.experience += grant.experienceGained;

    while (p.nextLevelThreshold > 0 && p.experience >= p.nextLevelThreshold) {
        p.experience -= p.nextLevelThreshold;
        ++p.level;
        ++grant.levelsGained;
        p.nextLevelThreshold = static_cast<int64_t>(
            static_cast<double>(p.nextLevelThreshold) * balance_.thresholdGrowth);
        if (balance_.evolutionEveryLevels > 0 && p.level % balance_.evolutionEveryLevels == 0) {
            ++p.evolutionsAvailable;
            ++grant.evolutionsGained;
        }
        levelUp_.emit(instance.Key(), p.level);
    }

    grant.level = p.level;
    grant.experience = p.experience;
    grant.nextLevelThreshold = p.nextLevelThreshold;

    if (grant.experienceGained > 0) {
        std::ostringstream line;
        line << instance.effective.name << " +" << grant.experienceGained << " XP ("
             << toString(kind) << ")";
        if (grant.levelsGained > 0) {
            line << ", now level " << p.level;
        }
        if (grant.evolutionsGained > 0) {
            line << ", evolution available";
        }
        log_.append(LogCategory::Progression, line.str());
    }
    return grant;
}

GameResult<ExperienceGrant> ProgressionEngine::GrantExperience(const WeaponKey& key,
                                                               ActionKind kind,
                                                               double baseExperience) {
    auto* instance = registry_.FindInstance(key);
    if (instance == nullptr) {
        return noInstance<ExperienceGrant>(key);
    }
    return GameResult<ExperienceGrant>::ok(GrantExperience(*instance, kind, baseExperience));
}

GameResult<ExperienceGrant> ProgressionEngine::GrantBattleSummary(const WeaponKey& key,
                                                                  const BattleSummary& summary) {
    auto* instance = registry_.FindInstance(key);
    if (instance == nullptr) {
        return noInstance<ExperienceGrant>(key);
    }

    instance->counters.damageDealt += summary.damageDealt;
    instance->counters.kills += summary.kills;
    instance->counters.criticalHits += summary.criticalHits;
    instance->counters.specialTriggers += summary.effectsTriggered;

    ExperienceGrant total;
    auto fold = [&total](const ExperienceGrant& g) {
        total.experienceGained += g.experienceGained;
        total.levelsGained += g.levelsGained;
        total.evolutionsGained += g.evolutionsGained;
        total.level = g.level;
        total.experience = g.experience;
        total.nextLevelThreshold = g.nextLevelThreshold;
    };

    fold(GrantExperience(*instance, ActionKind::DamageDealt, static_cast<double>(summary.damageDealt)));
    fold(GrantExperience(*instance, ActionKind::Kill, summary.kills * balance_.killBaseExperience));
    fold(GrantExperience(*instance, ActionKind::CriticalHit,
                         summary.criticalHits * balance_.criticalBaseExperience));
    fold(GrantExperience(*instance, ActionKind::EffectTriggered,
                         summary.effectsTriggered * balance_.effectExperiencePerRarity));
    return GameResult<ExperienceGrant>::ok(total);
}

void ProgressionEngine::onEffectTriggered(const EffectTriggeredEvent& event) {
    auto* instance = registry_.FindInstance(event.key);
    if (instance == nullptr) {
        CCE_LOG_WARN(LogCategory::Progression,
                     "trigger event for unknown instance " + toString(event.key));
        return;
    }
    GrantExperience(*instance, ActionKind::EffectTriggered, event.baseExperience);
}

// ---------------------------------------------------------------------------
// Evolution
// ---------------------------------------------------------------------------

std::vector<EvolutionPath> ProgressionEngine::ListAvailableEvolutions(
    const WeaponInstance& instance) const {
    std::vector<EvolutionPath> out;
    const auto& p = instance.progress;
    for (const auto& path : instance.effective.evolutions) {
        if (p.HasApplied(path.id) || path.levelRequirement > p.level) {
            continue;
        }
        bool prerequisitesMet = true;
        for (const auto& prereq : path.prerequisites) {
            if (!p.HasApplied(prereq)) {
                prerequisitesMet = false;
                break;
            }
        }
        if (prerequisitesMet) {
            out.push_back(path);
        }
    }
    return out;
}

GameResult<std::vector<EvolutionPath>> ProgressionEngine::ListAvailableEvolutions(
    const WeaponKey& key) const {
    const auto* instance = registry_.FindInstance(key);
    if (instance == nullptr) {
        return noInstance<std::vector<EvolutionPath>>(key);
    }
    return GameResult<std::vector<EvolutionPath>>::ok(ListAvailableEvolutions(*instance));
}

GameResult<void> ProgressionEngine::ApplyEvolution(const WeaponKey& key,
                                                   const foundation::EvolutionId& evolutionId) {
    auto* instance = registry_.FindInstance(key);
    if (instance == nullptr) {
        return noInstance<void>(key);
    }
    auto& p = instance->progress;
    if (p.HasApplied(evolutionId)) {
        return GameResult<void>::err(GameError(
            ErrorCode::EvolutionNotAvailable, "evolution '" + evolutionId + "' already applied"));
    }
    if (p.evolutionsAvailable <= 0) {
        return GameResult<void>::err(GameError(
            ErrorCode::NoEvolutionSlots,
            instance->effective.name + " has no evolution slots (level "
                + std::to_string(p.level) + ")"));
    }

    auto available = ListAvailableEvolutions(*instance);
    auto it = std::find_if(available.begin(), available.end(),
                           [&](const EvolutionPath& path) { return path.id == evolutionId; });
    if (it == available.end()) {
        return GameResult<void>::err(GameError(
            ErrorCode::EvolutionNotAvailable,
            "evolution '" + evolutionId + "' is not available for " + instance->effective.name));
    }

    ApplyDelta(instance->effective, it->delta);
    instance->ClampResources();
    --p.evolutionsAvailable;
    p.appliedEvolutions.push_back(evolutionId);

    log_.append(LogCategory::Progression,
                instance->effective.name + " evolved: " + it->name);
    return GameResult<void>::ok();
}

GameResult<EvolutionStatus> ProgressionEngine::GetEvolutionStatus(const WeaponKey& key) const {
    const auto* instance = registry_.FindInstance(key);
    if (instance == nullptr) {
        return noInstance<EvolutionStatus>(key);
    }
    const auto& p = instance->progress;
    auto every = std::max(1, balance_.evolutionEveryLevels);

    EvolutionStatus status;
    status.level = p.level;
    status.experience = p.experience;
    status.nextLevelThreshold = p.nextLevelThreshold;
    status.evolutionsAvailable = p.evolutionsAvailable;
    status.nextEvolutionLevel = (p.level / every + 1) * every;
    status.appliedEvolutions = p.appliedEvolutions;
    for (const auto& path : ListAvailableEvolutions(*instance)) {
        status.availableEvolutions.push_back(path.id);
    }
    return GameResult<EvolutionStatus>::ok(std::move(status));
}

// ---------------------------------------------------------------------------
// Delta merge
// ---------------------------------------------------------------------------

void ProgressionEngine::ApplyDelta(WeaponTemplate& effective, const EvolutionDelta& delta) {
    for (const auto& [field, value] : delta.statOverwrites) {
        effective.stats.Set(field, value);
    }
    if (delta.damageType) {
        effective.stats.damageType = *delta.damageType;
    }

    for (const auto& [effectId, mod] : delta.effectModifications) {
        auto* effect = effective.FindEffect(effectId);
        if (effect == nullptr) {
            CCE_LOG_WARN(LogCategory::Progression,
                         "evolution modifies unknown effect '" + effectId + "'");
            continue;
        }
        if (mod.name) effect->name = *mod.name;
        if (mod.description) effect->description = *mod.description;
        if (mod.cooldown) effect->cooldown = *mod.cooldown;
        if (mod.duration) effect->duration = *mod.duration;
        if (mod.costCharge) effect->cost.charge = *mod.costCharge;
        if (mod.costDurability) effect->cost.durability = *mod.costDurability;
        if (mod.minCharge) effect->conditions.minCharge = *mod.minCharge;
        if (mod.triggerChance) effect->conditions.triggerChance = *mod.triggerChance;

        if (auto* d = effect->AsDamage()) {
            if (mod.damage) d->damage = *mod.damage;
            if (mod.multiplier) d->multiplier = *mod.multiplier;
            if (mod.damageType) d->damageType = *mod.damageType;
            if (mod.armorPenetration) d->armorPenetration = *mod.armorPenetration;
            if (mod.maxTargets) d->maxTargets = *mod.maxTargets;
            if (mod.aoeRadius) d->aoeRadius = *mod.aoeRadius;
        } else if (auto* s = effect->AsStatus()) {
            if (mod.statusDuration) s->statusDuration = *mod.statusDuration;
            if (mod.strength) s->strength = *mod.strength;
            if (mod.applicationChance) s->applicationChance = *mod.applicationChance;
            if (mod.maxTargets) s->maxTargets = *mod.maxTargets;
        } else if (auto* u = effect->AsUtility()) {
            if (mod.amount) u->amount = *mod.amount;
            if (mod.percentage) u->percentage = *mod.percentage;
            if (mod.magnitude) u->magnitude = *mod.magnitude;
            if (mod.maxTargets) u->maxTargets = *mod.maxTargets;
        }
    }

    if (delta.newEffect) {
        if (effective.FindEffect(delta.newEffect->id) != nullptr) {
            CCE_LOG_WARN(LogCategory::Progression,
                         "evolution redefines effect '" + delta.newEffect->id + "'");
            *effective.FindEffect(delta.newEffect->id) = *delta.newEffect;
        } else {
            effective.effects.push_back(*delta.newEffect);
        }
    }
}

}  // namespace cce::combat
