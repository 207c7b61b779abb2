#include "cce/combat/effect_resolver.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "cce/foundation/game_logger.hpp"

namespace cce::combat {

using cce::foundation::LogCategory;

double EffectContext::PrimaryTargetHealthPercent() const {
    if (targets.empty() || targets.front() == nullptr) {
        return 100.0;
    }
    return targets.front()->HealthPercent();
}

EffectOutcome EffectOutcome::Failure(EffectCategory category, foundation::EffectId effectId,
                                     std::string message) {
    EffectOutcome out;
    out.success = false;
    out.category = category;
    out.effectId = std::move(effectId);
    out.message = std::move(message);
    return out;
}

namespace {

bool hasNullTarget(const std::vector<Combatant*>& targets) {
    return std::any_of(targets.begin(), targets.end(),
                       [](const Combatant* c) { return c == nullptr; });
}

std::string modifierId(const EffectDescriptor& effect, foundation::LogicalTime time) {
    return effect.id + "@" + std::to_string(time);
}

void attachModifier(Combatant& actor, const EffectDescriptor& effect, ModifierKind kind,
                    double value, int32_t duration, foundation::LogicalTime time) {
    actor.modifiers.push_back(TimedModifier{
        modifierId(effect, time), kind, value, time, time + std::max(1, duration)});
}

}  // namespace

// ---------------------------------------------------------------------------
// Damage
// ---------------------------------------------------------------------------

int32_t EffectResolver::CalculateDamage(int32_t effectDamage,
                                        double multiplier,
                                        int32_t weaponBaseDamage,
                                        double resistance,
                                        double armorPenetration) {
    auto total = static_cast<double>(effectDamage)
        + std::floor(static_cast<double>(weaponBaseDamage) * multiplier);

    if (armorPenetration > 0.0) {
        resistance = std::max(0.0, resistance - armorPenetration);
    }

    auto finalDamage = static_cast<int32_t>(std::floor(total * (1.0 - resistance)));
    return std::max(1, finalDamage);
}

std::vector<Combatant*> EffectResolver::SelectTargets(
    const std::vector<Combatant*>& candidates,
    int32_t maxTargets,
    double aoeRadius,
    const std::map<std::string, double>& distances) {
    std::vector<Combatant*> selected;
    if (candidates.empty() || maxTargets < 1) {
        return selected;
    }

    if (aoeRadius <= 0.0) {
        auto count = std::min<std::size_t>(candidates.size(), static_cast<std::size_t>(maxTargets));
        selected.assign(candidates.begin(), candidates.begin() + static_cast<std::ptrdiff_t>(count));
        return selected;
    }

    selected.push_back(candidates.front());
    for (std::size_t i = 1; i < candidates.size(); ++i) {
        if (selected.size() >= static_cast<std::size_t>(maxTargets)) {
            break;
        }
        auto it = distances.find(candidates[i]->id);
        if (it != distances.end() && it->second <= aoeRadius) {
            selected.push_back(candidates[i]);
        }
    }
    return selected;
}

EffectOutcome EffectResolver::ResolveDamage(const EffectDescriptor& effect,
                                            WeaponInstance& weapon,
                                            const EffectContext& ctx) {
    const auto* payload = effect.AsDamage();
    if (payload == nullptr) {
        return EffectOutcome::Failure(EffectCategory::Damage, effect.id,
                                      "effect '" + effect.id + "' has no damage payload");
    }
    if (payload->maxTargets < 1) {
        return EffectOutcome::Failure(EffectCategory::Damage, effect.id,
                                      "effect '" + effect.id + "' has max_targets < 1");
    }
    if (ctx.targets.empty() || hasNullTarget(ctx.targets)) {
        return EffectOutcome::Failure(EffectCategory::Damage, effect.id,
                                      "effect '" + effect.id + "' has no valid targets");
    }

    EffectOutcome out;
    out.category = EffectCategory::Damage;
    out.effectId = effect.id;

    auto damageType = payload->damageType.value_or(weapon.effective.stats.damageType);
    auto selected = SelectTargets(ctx.targets, payload->maxTargets, payload->aoeRadius, ctx.distances);

    for (auto* target : selected) {
        bool wasAlive = target->IsAlive();
        auto damage = CalculateDamage(payload->damage, payload->multiplier,
                                      weapon.effective.stats.baseDamage,
                                      target->Resistance(damageType),
                                      payload->armorPenetration);
        target->TakeDamage(damage);

        TargetResult tr;
        tr.targetId = target->id;
        tr.damage = damage;
        tr.healthRemaining = target->health;
        tr.killed = wasAlive && !target->IsAlive();

        weapon.counters.damageDealt += damage;
        if (tr.killed) {
            ++weapon.counters.kills;
            ++out.kills;
        }
        ++out.targetsAffected;
        out.totalDamage += damage;
        out.targetResults.push_back(std::move(tr));
    }

    std::ostringstream msg;
    msg << effect.name << " hits " << out.targetsAffected << " target(s) for "
        << out.totalDamage << " " << toString(damageType) << " damage";
    out.message = msg.str();
    return out;
}

// ---------------------------------------------------------------------------
// Status
// ---------------------------------------------------------------------------

EffectOutcome EffectResolver::ResolveStatus(const EffectDescriptor& effect,
                                            const WeaponInstance& weapon,
                                            const EffectContext& ctx,
                                            foundation::RandomSource& rng) {
    const auto* payload = effect.AsStatus();
    if (payload == nullptr) {
        return EffectOutcome::Failure(EffectCategory::Status, effect.id,
                                      "effect '" + effect.id + "' has no status payload");
    }
    if (payload->maxTargets < 1 || payload->statusDuration < 0) {
        return EffectOutcome::Failure(EffectCategory::Status, effect.id,
                                      "effect '" + effect.id + "' has an invalid status payload");
    }
    if (ctx.targets.empty() || hasNullTarget(ctx.targets)) {
        return EffectOutcome::Failure(EffectCategory::Status, effect.id,
                                      "effect '" + effect.id + "' has no valid targets");
    }

    EffectOutcome out;
    out.category = EffectCategory::Status;
    out.effectId = effect.id;

    auto selected = SelectTargets(ctx.targets, payload->maxTargets, 0.0, ctx.distances);
    for (auto* target : selected) {
        if (!target->canReceiveStatus) {
            continue;
        }

        TargetResult tr;
        tr.targetId = target->id;
        tr.status = payload->statusType;
        tr.applicationChance = std::max(
            ctx.minStatusChance, payload->applicationChance - target->StatusResistance(payload->statusType));
        tr.applied = rng.chance(tr.applicationChance);

        if (tr.applied) {
            // Same-type statuses are replaced, never stacked.
            target->statuses[payload->statusType] = StatusRecord{
                payload->statusType,
                payload->strength,
                ctx.time,
                ctx.time + payload->statusDuration,
                weapon.owner,
                weapon.templateId,
                effect.id};
            ++out.targetsAffected;
        }
        tr.healthRemaining = target->health;
        out.targetResults.push_back(std::move(tr));
    }

    std::ostringstream msg;
    msg << effect.name << " applies " << toString(payload->statusType) << " to "
        << out.targetsAffected << " of " << out.targetResults.size() << " target(s)";
    out.message = msg.str();
    return out;
}

// ---------------------------------------------------------------------------
// Utility
// ---------------------------------------------------------------------------

EffectOutcome EffectResolver::ResolveUtility(const EffectDescriptor& effect,
                                             WeaponInstance& weapon,
                                             const EffectContext& ctx) {
    const auto* payload = effect.AsUtility();
    if (payload == nullptr) {
        return EffectOutcome::Failure(EffectCategory::Utility, effect.id,
                                      "effect '" + effect.id + "' has no utility payload");
    }

    EffectOutcome out;
    out.category = EffectCategory::Utility;
    out.effectId = effect.id;
    std::ostringstream msg;

    switch (payload->utilityType) {
        case UtilityType::Teleport:
            msg << "Teleported " << payload->distance << " m " << payload->direction;
            break;

        case UtilityType::Stealth:
            if (ctx.actor == nullptr) {
                return EffectOutcome::Failure(EffectCategory::Utility, effect.id, "stealth needs an actor");
            }
            attachModifier(*ctx.actor, effect, ModifierKind::Stealth, payload->level,
                           payload->modifierDuration, ctx.time);
            msg << "Stealth level " << payload->level << " for " << payload->modifierDuration << " turns";
            break;

        case UtilityType::Shield: {
            if (ctx.actor == nullptr) {
                return EffectOutcome::Failure(EffectCategory::Utility, effect.id, "shield needs an actor");
            }
            auto amount = payload->AmountOrDefault();
            attachModifier(*ctx.actor, effect, ModifierKind::Shield, amount,
                           payload->modifierDuration, ctx.time);
            msg << "Shield of " << amount << " points for " << payload->modifierDuration << " turns";
            break;
        }

        case UtilityType::Scan: {
            if (hasNullTarget(ctx.targets)) {
                return EffectOutcome::Failure(EffectCategory::Utility, effect.id, "scan target list is invalid");
            }
            auto count = std::min<std::size_t>(ctx.targets.size(),
                                               static_cast<std::size_t>(std::max(0, payload->maxTargets)));
            for (std::size_t i = 0; i < count; ++i) {
                TargetResult tr;
                tr.targetId = ctx.targets[i]->id;
                tr.healthRemaining = ctx.targets[i]->health;
                if (payload->revealWeakness) {
                    auto [type, value] = FindWeakness(*ctx.targets[i]);
                    tr.weakness = type;
                    tr.weaknessValue = value;
                }
                out.targetResults.push_back(std::move(tr));
            }
            out.targetsAffected = static_cast<int32_t>(count);
            msg << "Scan complete: " << count << " enemies detected";
            break;
        }

        case UtilityType::Heal: {
            if (ctx.actor == nullptr) {
                return EffectOutcome::Failure(EffectCategory::Utility, effect.id, "heal needs an actor");
            }
            auto total = payload->AmountOrDefault()
                + static_cast<int32_t>(std::floor(ctx.actor->maxHealth * payload->percentage));
            out.healed = ctx.actor->Heal(total);
            msg << "Healed +" << out.healed << " HP";
            break;
        }

        case UtilityType::ChargeRefund:
            out.chargeRestored = weapon.AddCharge(payload->AmountOrDefault());
            msg << "Refunded " << out.chargeRestored << " charge";
            break;

        case UtilityType::Stance:
        case UtilityType::ReloadSpeed:
        case UtilityType::AccuracyBoost: {
            if (ctx.actor == nullptr) {
                return EffectOutcome::Failure(EffectCategory::Utility, effect.id, "modifier needs an actor");
            }
            auto kind = payload->utilityType == UtilityType::Stance ? ModifierKind::Stance
                : payload->utilityType == UtilityType::ReloadSpeed  ? ModifierKind::ReloadSpeed
                                                                    : ModifierKind::AccuracyBoost;
            attachModifier(*ctx.actor, effect, kind, payload->magnitude,
                           payload->modifierDuration, ctx.time);
            msg << toString(payload->utilityType) << " +" << payload->magnitude
                << " for " << payload->modifierDuration << " turns";
            break;
        }

        default:
            return EffectOutcome::Failure(
                EffectCategory::Utility, effect.id,
                "unsupported utility type " + std::to_string(static_cast<int>(payload->utilityType)));
    }

    out.message = msg.str();
    return out;
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

EffectOutcome EffectResolver::Resolve(const EffectDescriptor& effect,
                                      WeaponInstance& weapon,
                                      const EffectContext& ctx,
                                      foundation::RandomSource& rng) {
    EffectOutcome out;
    switch (effect.Category()) {
        case EffectCategory::Damage:
            out = ResolveDamage(effect, weapon, ctx);
            break;
        case EffectCategory::Status:
            out = ResolveStatus(effect, weapon, ctx, rng);
            break;
        case EffectCategory::Utility:
            out = ResolveUtility(effect, weapon, ctx);
            break;
    }
    if (!out.success) {
        CCE_LOG_WARN(LogCategory::Effect, "resolution failed: " + out.message);
    }
    return out;
}

std::pair<DamageType, double> EffectResolver::FindWeakness(const Combatant& target) {
    auto lowestType = DamageType::Physical;
    double lowestValue = 1.0;
    for (auto type : kScannableDamageTypes) {
        auto value = target.Resistance(type);
        if (value < lowestValue) {
            lowestValue = value;
            lowestType = type;
        }
    }
    return {lowestType, lowestValue};
}

}  // namespace cce::combat
