#include "cce/combat/crafting_tables.hpp"

namespace cce::combat::crafting_tables {

namespace {

struct DamageSpec {
    int32_t damage;
    double multiplier;
    std::optional<DamageType> type;
    int32_t maxTargets = 1;
    double aoeRadius = 0.0;
    double armorPenetration = 0.0;
};

EffectDescriptor damageEffect(std::string id, std::string name, std::string description,
                              const DamageSpec& spec) {
    EffectDescriptor e;
    e.id = std::move(id);
    e.name = std::move(name);
    e.description = std::move(description);
    DamagePayload p;
    p.damage = spec.damage;
    p.multiplier = spec.multiplier;
    p.damageType = spec.type;
    p.maxTargets = spec.maxTargets;
    p.aoeRadius = spec.aoeRadius;
    p.armorPenetration = spec.armorPenetration;
    e.payload = p;
    return e;
}

EffectDescriptor statusEffect(std::string id, std::string name, std::string description,
                              StatusType type, int32_t duration, int32_t strength,
                              double applicationChance) {
    EffectDescriptor e;
    e.id = std::move(id);
    e.name = std::move(name);
    e.description = std::move(description);
    StatusPayload p;
    p.statusType = type;
    p.statusDuration = duration;
    p.strength = strength;
    p.applicationChance = applicationChance;
    e.payload = p;
    return e;
}

EffectDescriptor utilityEffect(std::string id, std::string name, std::string description,
                               UtilityType type) {
    EffectDescriptor e;
    e.id = std::move(id);
    e.name = std::move(name);
    e.description = std::move(description);
    UtilityPayload p;
    p.utilityType = type;
    e.payload = p;
    return e;
}

}  // namespace

WeaponStats BaseStats(WeaponCategory category) {
    WeaponStats s;
    switch (category) {
        case WeaponCategory::Energy:
            s.baseDamage = 20; s.damageType = DamageType::Energy; s.range = 18; s.accuracy = 0.8;
            s.maxCharge = 100; s.chargeRate = 10; s.durability = 100; s.weight = 3;
            break;
        case WeaponCategory::Melee:
            s.baseDamage = 35; s.damageType = DamageType::Physical; s.range = 2; s.accuracy = 0.9;
            s.maxCharge = 100; s.chargeRate = 0; s.durability = 120; s.weight = 4;
            break;
        case WeaponCategory::Projectile:
            s.baseDamage = 25; s.damageType = DamageType::Physical; s.range = 20; s.accuracy = 0.75;
            s.maxCharge = 30; s.chargeRate = 6; s.durability = 110; s.weight = 5;
            break;
        case WeaponCategory::Tech:
            s.baseDamage = 18; s.damageType = DamageType::Tech; s.range = 15; s.accuracy = 0.85;
            s.maxCharge = 80; s.chargeRate = 12; s.durability = 90; s.weight = 3;
            break;
        case WeaponCategory::Experimental:
            s.baseDamage = 30; s.damageType = DamageType::Variable; s.range = 16; s.accuracy = 0.7;
            s.maxCharge = 120; s.chargeRate = 8; s.durability = 70; s.weight = 6;
            break;
    }
    return s;
}

EffectDescriptor DefaultEffect(WeaponCategory category) {
    switch (category) {
        case WeaponCategory::Energy: {
            auto e = damageEffect("energy_discharge", "Energy Discharge",
                                  "Releases stored energy in a single burst",
                                  {30, 1.0, DamageType::Energy});
            e.conditions.minCharge = 50;
            e.conditions.triggerChance = 1.0;
            e.cost.charge = 50;
            e.cooldown = 3;
            return e;
        }
        case WeaponCategory::Melee: {
            auto e = damageEffect("power_strike", "Power Strike",
                                  "A heavy blow that staggers the target",
                                  {45, 1.2, DamageType::Physical});
            e.conditions.triggerChance = 0.3;
            e.cooldown = 3;
            return e;
        }
        case WeaponCategory::Projectile: {
            auto e = damageEffect("precision_shot", "Precision Shot",
                                  "A carefully aimed shot at a weak point",
                                  {35, 1.5, DamageType::Physical});
            e.conditions.triggerChance = 1.0;
            e.cooldown = 4;
            return e;
        }
        case WeaponCategory::Tech: {
            auto e = statusEffect("system_disruption", "System Disruption",
                                  "Scrambles the target's systems",
                                  StatusType::Disrupted, 3, 2, 0.7);
            e.conditions.minCharge = 40;
            e.conditions.triggerChance = 1.0;
            e.cost.charge = 40;
            e.cooldown = 5;
            e.duration = 3;
            return e;
        }
        case WeaponCategory::Experimental: {
            auto e = damageEffect("reality_shift", "Reality Shift",
                                  "Tears space around the target, dragging nearby enemies in",
                                  {40, 1.3, DamageType::Void, 6, 5.0});
            e.conditions.minCharge = 70;
            e.conditions.triggerChance = 1.0;
            e.cost.charge = 70;
            e.cost.durability = 8;
            e.cooldown = 6;
            e.duration = 3;
            return e;
        }
    }
    return EffectDescriptor{};
}

std::vector<EffectDescriptor> MinorBonuses(WeaponCategory category) {
    std::vector<EffectDescriptor> out;
    switch (category) {
        case WeaponCategory::Energy: {
            auto e = utilityEffect("energy_feedback", "Energy Feedback",
                                   "Recovers part of the spent charge", UtilityType::ChargeRefund);
            std::get<UtilityPayload>(e.payload).amount = 10;
            e.conditions.triggerChance = 0.4;
            e.cooldown = 3;
            out.push_back(std::move(e));
            break;
        }
        case WeaponCategory::Melee: {
            auto e = utilityEffect("stance_shift", "Stance Shift",
                                   "Adopts an aggressive stance that raises critical chance",
                                   UtilityType::Stance);
            auto& p = std::get<UtilityPayload>(e.payload);
            p.magnitude = 0.15;
            p.modifierDuration = 2;
            e.conditions.triggerChance = 0.3;
            e.cooldown = 4;
            e.duration = 2;
            out.push_back(std::move(e));
            break;
        }
        case WeaponCategory::Projectile: {
            auto e = utilityEffect("quick_reload", "Quick Reload",
                                   "Reloads faster for a short time", UtilityType::ReloadSpeed);
            std::get<UtilityPayload>(e.payload).magnitude = 0.5;
            e.conditions.triggerChance = 0.3;
            e.cooldown = 4;
            out.push_back(std::move(e));
            break;
        }
        case WeaponCategory::Tech: {
            auto e = utilityEffect("targeting_assist", "Targeting Assist",
                                   "Assisted aim raises accuracy", UtilityType::AccuracyBoost);
            auto& p = std::get<UtilityPayload>(e.payload);
            p.magnitude = 0.15;
            p.modifierDuration = 2;
            e.conditions.triggerChance = 0.4;
            e.cooldown = 5;
            e.duration = 2;
            out.push_back(std::move(e));
            break;
        }
        case WeaponCategory::Experimental: {
            auto e = statusEffect("unstable_flux", "Unstable Flux",
                                  "Unpredictable energy warps the target",
                                  StatusType::RandomEffect, 2, 2, 0.3);
            e.conditions.triggerChance = 0.2;
            e.cooldown = 6;
            e.duration = 2;
            out.push_back(std::move(e));
            break;
        }
    }
    return out;
}

std::vector<EffectDescriptor> MajorBonuses(WeaponCategory category) {
    std::vector<EffectDescriptor> out;
    switch (category) {
        case WeaponCategory::Energy: {
            auto e = damageEffect("plasma_cascade", "Plasma Cascade",
                                  "Plasma arcs between nearby enemies",
                                  {20, 1.0, std::nullopt, 3, 4.0});
            e.conditions.minCharge = 60;
            e.conditions.triggerChance = 0.3;
            e.cost.charge = 60;
            e.cooldown = 6;
            out.push_back(std::move(e));
            break;
        }
        case WeaponCategory::Melee: {
            auto e = damageEffect("whirlwind_attack", "Whirlwind Attack",
                                  "A spinning attack that hits everything close by",
                                  {30, 0.8, std::nullopt, 5, 3.0});
            e.conditions.triggerChance = 0.2;
            e.cooldown = 8;
            out.push_back(std::move(e));
            break;
        }
        case WeaponCategory::Projectile: {
            auto e = damageEffect("explosive_round", "Explosive Round",
                                  "The round detonates on impact",
                                  {25, 1.2, DamageType::Explosive, 4, 3.0});
            e.conditions.triggerChance = 0.2;
            e.cooldown = 7;
            out.push_back(std::move(e));
            break;
        }
        case WeaponCategory::Tech: {
            auto e = damageEffect("system_overload", "System Overload",
                                  "Overloads the weapon for a devastating discharge",
                                  {50, 1.5, DamageType::Tech, 1, 0.0, 0.3});
            e.conditions.minCharge = 80;
            e.conditions.triggerChance = 0.2;
            e.cost.charge = 80;
            e.cost.durability = 5;
            e.cooldown = 10;
            out.push_back(std::move(e));
            break;
        }
        case WeaponCategory::Experimental: {
            auto e = damageEffect("dimensional_rift", "Dimensional Rift",
                                  "Opens a rift that engulfs the battlefield",
                                  {35, 1.3, DamageType::Void, 6, 5.0});
            e.conditions.minCharge = 90;
            e.conditions.triggerChance = 0.15;
            e.cost.charge = 90;
            e.cost.durability = 8;
            e.cooldown = 12;
            e.duration = 3;
            out.push_back(std::move(e));
            break;
        }
    }
    return out;
}

}  // namespace cce::combat::crafting_tables
