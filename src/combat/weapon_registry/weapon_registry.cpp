/// @file weapon_registry.cpp
/// @brief WeaponRegistry implementation: catalog validation, instance
///        lifecycle and the activation/trigger pipeline.

#include "cce/combat/weapon_registry.hpp"

#include <algorithm>
#include <sstream>

#include "cce/foundation/game_logger.hpp"

namespace cce::combat {

using cce::foundation::ErrorCode;
using cce::foundation::GameError;
using cce::foundation::GameResult;
using cce::foundation::LogCategory;
using cce::foundation::ResourceKind;
using cce::foundation::ResourceShortfall;

std::string_view toString(ActivationReason reason) {
    switch (reason) {
        case ActivationReason::Eligible:        return "eligible";
        case ActivationReason::WeaponNotFound:  return "weapon not found";
        case ActivationReason::NoEffects:       return "weapon has no effects";
        case ActivationReason::WeaponBroken:    return "weapon is broken";
        case ActivationReason::AllOnCooldown:   return "all effects on cooldown";
        case ActivationReason::ConditionsUnmet: return "trigger conditions unmet";
    }
    return "unknown";
}

WeaponRegistry::WeaponRegistry(foundation::RandomSource& rng, CombatLog& log,
                               BalanceConfig balance)
    : rng_(rng), log_(log), balance_(std::move(balance)) {}

// ---------------------------------------------------------------------------
// Catalog
// ---------------------------------------------------------------------------

GameResult<void> WeaponRegistry::ValidateTemplate(const WeaponTemplate& tmpl) {
    auto missing = [&](std::string_view field) {
        return GameResult<void>::err(GameError(
            ErrorCode::MissingRequiredField,
            "template '" + tmpl.id + "' is missing " + std::string(field)));
    };

    if (tmpl.id.empty()) {
        return missing("id");
    }
    if (tmpl.name.empty()) {
        return missing("name");
    }
    if (tmpl.description.empty()) {
        return missing("description");
    }
    if (!tmpl.category) {
        return missing("category");
    }
    if (!tmpl.rarity) {
        return missing("rarity");
    }
    if (tmpl.stats.baseDamage <= 0) {
        return missing("base_damage");
    }
    if (tmpl.effects.empty()) {
        return missing("effects");
    }
    return GameResult<void>::ok();
}

GameResult<void> WeaponRegistry::RegisterTemplate(WeaponTemplate tmpl) {
    if (auto valid = ValidateTemplate(tmpl); valid.hasError()) {
        return valid;
    }
    if (templates_.count(tmpl.id) > 0) {
        return GameResult<void>::err(GameError(
            ErrorCode::DuplicateTemplate, "template '" + tmpl.id + "' already registered"));
    }

    log_.append(LogCategory::Weapon, "Registered weapon template '" + tmpl.id + "'");
    auto id = tmpl.id;
    templates_.emplace(std::move(id), std::move(tmpl));
    return GameResult<void>::ok();
}

const WeaponTemplate* WeaponRegistry::FindTemplate(const foundation::TemplateId& id) const {
    auto it = templates_.find(id);
    return it != templates_.end() ? &it->second : nullptr;
}

std::vector<const WeaponTemplate*> WeaponRegistry::ListTemplates(
    std::optional<WeaponCategory> category, std::optional<Rarity> minRarity) const {
    std::vector<const WeaponTemplate*> out;
    for (const auto& [id, tmpl] : templates_) {
        if (category && tmpl.category != category) {
            continue;
        }
        if (minRarity && tmpl.rarity && *tmpl.rarity < *minRarity) {
            continue;
        }
        out.push_back(&tmpl);
    }
    return out;
}

// ---------------------------------------------------------------------------
// Instances
// ---------------------------------------------------------------------------

GameResult<WeaponKey> WeaponRegistry::Assign(foundation::PlayerId player,
                                             const foundation::TemplateId& templateId) {
    const auto* tmpl = FindTemplate(templateId);
    if (tmpl == nullptr) {
        return GameResult<WeaponKey>::err(GameError(
            ErrorCode::WeaponNotFound, "unknown weapon template '" + templateId + "'"));
    }

    WeaponKey key{player, templateId};
    if (instances_.count(key) > 0) {
        return GameResult<WeaponKey>::err(GameError(
            ErrorCode::AlreadyAssigned,
            "player " + std::to_string(player.value()) + " already owns '" + templateId + "'"));
    }

    WeaponInstance instance;
    instance.owner = player;
    instance.templateId = templateId;
    instance.effective = *tmpl;
    instance.currentCharge = 0;
    instance.currentDurability = tmpl->stats.durability;
    instance.progress.nextLevelThreshold = balance_.firstLevelThreshold;

    instances_.emplace(key, std::move(instance));
    log_.append(LogCategory::Weapon, tmpl->name + " assigned to player "
                + std::to_string(player.value()));
    return GameResult<WeaponKey>::ok(key);
}

GameResult<void> WeaponRegistry::RestoreInstance(WeaponInstance instance) {
    if (FindTemplate(instance.templateId) == nullptr) {
        return GameResult<void>::err(GameError(
            ErrorCode::WeaponNotFound, "unknown weapon template '" + instance.templateId + "'"));
    }
    auto key = instance.Key();
    if (instances_.count(key) > 0) {
        return GameResult<void>::err(GameError(
            ErrorCode::AlreadyAssigned, "instance " + toString(key) + " already exists"));
    }
    instance.ClampResources();
    log_.append(LogCategory::Weapon, "Restored " + instance.effective.name + " for "
                + toString(key));
    instances_.emplace(key, std::move(instance));
    return GameResult<void>::ok();
}

WeaponInstance* WeaponRegistry::FindInstance(const WeaponKey& key) {
    auto it = instances_.find(key);
    return it != instances_.end() ? &it->second : nullptr;
}

const WeaponInstance* WeaponRegistry::FindInstance(const WeaponKey& key) const {
    auto it = instances_.find(key);
    return it != instances_.end() ? &it->second : nullptr;
}

std::vector<WeaponKey> WeaponRegistry::ListPlayerWeapons(foundation::PlayerId player) const {
    std::vector<WeaponKey> keys;
    for (const auto& [key, instance] : instances_) {
        if (key.player == player) {
            keys.push_back(key);
        }
    }
    return keys;
}

GameResult<void> WeaponRegistry::RemoveInstance(const WeaponKey& key) {
    auto it = instances_.find(key);
    if (it == instances_.end()) {
        return GameResult<void>::err(GameError(
            ErrorCode::WeaponNotFound, "no weapon instance " + toString(key)));
    }
    instances_.erase(it);
    activeEffects_.erase(
        std::remove_if(activeEffects_.begin(), activeEffects_.end(),
                       [&](const ActiveEffect& e) {
                           return e.player == key.player && e.weaponId == key.weaponId;
                       }),
        activeEffects_.end());

    log_.append(LogCategory::Weapon, "Removed weapon instance " + toString(key));
    instanceRemoved_.emit(key);
    return GameResult<void>::ok();
}

GameResult<int32_t> WeaponRegistry::AddCharge(const WeaponKey& key, int32_t amount) {
    auto* instance = FindInstance(key);
    if (instance == nullptr) {
        return GameResult<int32_t>::err(GameError(
            ErrorCode::WeaponNotFound, "no weapon instance " + toString(key)));
    }
    auto added = instance->AddCharge(amount);
    if (added != 0) {
        log_.append(LogCategory::Weapon, instance->effective.name + " charge "
                    + std::to_string(instance->currentCharge) + "/"
                    + std::to_string(instance->MaxCharge()));
    }
    return GameResult<int32_t>::ok(instance->currentCharge);
}

GameResult<int32_t> WeaponRegistry::Repair(const WeaponKey& key, int32_t amount) {
    auto* instance = FindInstance(key);
    if (instance == nullptr) {
        return GameResult<int32_t>::err(GameError(
            ErrorCode::WeaponNotFound, "no weapon instance " + toString(key)));
    }
    auto restored = instance->Repair(amount);
    log_.append(LogCategory::Weapon, instance->effective.name + " repaired by "
                + std::to_string(restored));
    return GameResult<int32_t>::ok(instance->currentDurability);
}

// ---------------------------------------------------------------------------
// Activation
// ---------------------------------------------------------------------------

std::optional<std::string> WeaponRegistry::failedPredicate(const EffectDescriptor& effect,
                                                           const WeaponInstance& instance,
                                                           const EffectContext& ctx) {
    const auto& c = effect.conditions;
    if (c.minCharge && instance.currentCharge < *c.minCharge) {
        return "charge " + std::to_string(instance.currentCharge) + " below "
            + std::to_string(*c.minCharge);
    }
    if (c.targetHealthBelowPercent && ctx.PrimaryTargetHealthPercent() >= *c.targetHealthBelowPercent) {
        return std::string("target health not below threshold");
    }
    if (c.consecutiveHits && ctx.consecutiveHits < *c.consecutiveHits) {
        return "needs " + std::to_string(*c.consecutiveHits) + " consecutive hits";
    }
    if (c.enemyCount && ctx.enemyCount < *c.enemyCount) {
        return "needs " + std::to_string(*c.enemyCount) + " enemies";
    }
    if (c.requiresCritical && !ctx.isCritical) {
        return std::string("requires a critical hit");
    }
    return std::nullopt;
}

ActivationResult WeaponRegistry::CheckActivation(const WeaponKey& key, const EffectContext& ctx) {
    ActivationResult result;

    const auto* instance = FindInstance(key);
    if (instance == nullptr) {
        result.reason = ActivationReason::WeaponNotFound;
        result.message = "no weapon instance " + toString(key);
        return result;
    }
    if (instance->effective.effects.empty()) {
        result.reason = ActivationReason::NoEffects;
        result.message = instance->effective.name + " has no special effects";
        return result;
    }
    if (instance->IsBroken()) {
        result.reason = ActivationReason::WeaponBroken;
        result.message = instance->effective.name + " is broken";
        return result;
    }

    std::size_t onCooldown = 0;
    for (const auto& effect : instance->effective.effects) {
        if (instance->IsOnCooldown(effect.id, ctx.time)) {
            ++onCooldown;
            continue;
        }
        if (failedPredicate(effect, *instance, ctx)) {
            continue;
        }
        if (effect.conditions.triggerChance && rng_.nextUnit() > *effect.conditions.triggerChance) {
            continue;
        }
        result.eligibleEffects.push_back(effect.id);
    }

    if (!result.eligibleEffects.empty()) {
        result.reason = ActivationReason::Eligible;
        result.message = std::to_string(result.eligibleEffects.size()) + " effect(s) ready";
    } else if (onCooldown == instance->effective.effects.size()) {
        result.reason = ActivationReason::AllOnCooldown;
        result.message = "all effects of " + instance->effective.name + " are on cooldown";
    } else {
        result.reason = ActivationReason::ConditionsUnmet;
        result.message = "no effect of " + instance->effective.name + " meets its conditions";
    }
    return result;
}

GameResult<TriggerOutcome> WeaponRegistry::Trigger(const WeaponKey& key,
                                                   const foundation::EffectId& effectId,
                                                   const EffectContext& ctx) {
    auto* instance = FindInstance(key);
    if (instance == nullptr) {
        return GameResult<TriggerOutcome>::err(GameError(
            ErrorCode::WeaponNotFound, "no weapon instance " + toString(key)));
    }
    const auto* effect = instance->effective.FindEffect(effectId);
    if (effect == nullptr) {
        return GameResult<TriggerOutcome>::err(GameError(
            ErrorCode::EffectNotFound,
            instance->effective.name + " has no effect '" + effectId + "'"));
    }
    if (instance->IsBroken()) {
        return GameResult<TriggerOutcome>::err(GameError(
            ErrorCode::WeaponBroken, instance->effective.name + " is broken",
            ResourceShortfall{ResourceKind::Durability, 0, std::max(1, effect->cost.durability)}));
    }
    if (instance->IsOnCooldown(effectId, ctx.time)) {
        auto readyAt = instance->cooldowns.at(effectId);
        return GameResult<TriggerOutcome>::err(GameError(
            ErrorCode::EffectOnCooldown,
            effect->name + " is on cooldown until turn " + std::to_string(readyAt),
            ResourceShortfall{ResourceKind::Cooldown, ctx.time, readyAt}));
    }
    if (instance->currentCharge < effect->cost.charge) {
        return GameResult<TriggerOutcome>::err(GameError(
            ErrorCode::InsufficientCharge,
            effect->name + " needs " + std::to_string(effect->cost.charge) + " charge, have "
                + std::to_string(instance->currentCharge),
            ResourceShortfall{ResourceKind::Charge, instance->currentCharge, effect->cost.charge}));
    }
    if (instance->currentDurability < effect->cost.durability) {
        return GameResult<TriggerOutcome>::err(GameError(
            ErrorCode::InsufficientDurability,
            effect->name + " needs " + std::to_string(effect->cost.durability)
                + " durability, have " + std::to_string(instance->currentDurability),
            ResourceShortfall{ResourceKind::Durability, instance->currentDurability,
                              effect->cost.durability}));
    }
    if (auto reason = failedPredicate(*effect, *instance, ctx)) {
        return GameResult<TriggerOutcome>::err(GameError(
            ErrorCode::NotEligible, effect->name + " not eligible: " + *reason));
    }
    if (effect->Category() != EffectCategory::Utility && ctx.targets.empty()) {
        return GameResult<TriggerOutcome>::err(GameError(
            ErrorCode::MissingTarget, effect->name + " needs at least one target"));
    }

    // Resolution may mutate the instance; keep the descriptor as triggered.
    EffectDescriptor snapshot = *effect;

    instance->currentCharge -= snapshot.cost.charge;
    instance->currentDurability -= snapshot.cost.durability;
    if (snapshot.cooldown > 0) {
        instance->cooldowns[snapshot.id] = ctx.time + snapshot.cooldown;
    }

    EffectContext resolveCtx = ctx;
    resolveCtx.minStatusChance = balance_.minStatusChance;
    auto outcome = EffectResolver::Resolve(snapshot, *instance, resolveCtx, rng_);

    ++instance->counters.specialTriggers;

    ActiveEffect active;
    active.instanceId = std::to_string(key.player.value()) + ":" + key.weaponId + ":"
        + snapshot.id + ":" + std::to_string(++activeSequence_);
    active.player = key.player;
    active.weaponId = key.weaponId;
    active.effectId = snapshot.id;
    active.startTime = ctx.time;
    active.endTime = ctx.time + std::max(0, snapshot.duration);
    for (const auto* target : ctx.targets) {
        if (target != nullptr) {
            active.targets.push_back(target->id);
        }
    }
    active.results = outcome.targetResults;
    active.snapshot = std::move(snapshot);
    activeEffects_.push_back(active);

    std::ostringstream line;
    line << instance->effective.name << " triggers " << active.snapshot.name << ": " << outcome.message;
    log_.append(LogCategory::Weapon, line.str());
    if (!outcome.success) {
        CCE_LOG_WARN(LogCategory::Weapon, "effect '" + active.effectId
                     + "' resolved without effect: " + outcome.message);
    }

    EffectTriggeredEvent event;
    event.key = key;
    event.effectId = active.effectId;
    event.effectRarity = active.snapshot.rarity;
    event.baseExperience = active.snapshot.rarity * balance_.effectExperiencePerRarity;
    event.time = ctx.time;

    TriggerOutcome result;
    result.activeEffect = std::move(active);
    result.outcome = std::move(outcome);
    result.chargeRemaining = instance->currentCharge;
    result.durabilityRemaining = instance->currentDurability;

    // Emitted last: a subscriber may change the instance (level up).
    effectTriggered_.emit(event);
    return GameResult<TriggerOutcome>::ok(std::move(result));
}

std::vector<ActiveEffect> WeaponRegistry::Tick(foundation::LogicalTime now) {
    std::vector<ActiveEffect> expired;
    std::vector<ActiveEffect> remaining;
    for (auto& effect : activeEffects_) {
        if (effect.endTime <= now) {
            expired.push_back(std::move(effect));
        } else {
            remaining.push_back(std::move(effect));
        }
    }
    activeEffects_ = std::move(remaining);

    for (auto& [key, instance] : instances_) {
        for (auto it = instance.cooldowns.begin(); it != instance.cooldowns.end();) {
            if (it->second <= now) {
                it = instance.cooldowns.erase(it);
            } else {
                ++it;
            }
        }
    }
    return expired;
}

void WeaponRegistry::RestoreActiveEffect(ActiveEffect effect) {
    log_.append(LogCategory::Weapon, "Restored active effect '" + effect.effectId + "' until t="
                + std::to_string(effect.endTime));
    activeEffects_.push_back(std::move(effect));
}

}  // namespace cce::combat
