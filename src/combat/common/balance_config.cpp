#include "cce/combat/balance_config.hpp"

#include <string>

namespace cce::combat {

double BalanceConfig::DampeningFor(Rarity rarity) const {
    auto idx = static_cast<std::size_t>(rarity) - 1;
    return idx < rarityDampening.size() ? rarityDampening[idx] : 1.0;
}

BalanceConfig BalanceConfig::fromConfig(const foundation::ConfigManager& config) {
    BalanceConfig b;

    b.firstLevelThreshold = config.getOr<int64_t>("progression.first_level_threshold", b.firstLevelThreshold);
    b.thresholdGrowth = config.getOr<double>("progression.threshold_growth", b.thresholdGrowth);
    b.evolutionEveryLevels = config.getOr<int32_t>("progression.evolution_every_levels", b.evolutionEveryLevels);
    b.damageDealtFactor = config.getOr<double>("progression.factors.damage_dealt", b.damageDealtFactor);
    b.criticalHitFactor = config.getOr<double>("progression.factors.critical_hit", b.criticalHitFactor);
    b.killFactor = config.getOr<double>("progression.factors.kill", b.killFactor);
    b.effectTriggeredFactor = config.getOr<double>("progression.factors.effect_triggered", b.effectTriggeredFactor);
    for (int32_t value = 1; value <= 6; ++value) {
        auto rarity = static_cast<Rarity>(value);
        auto key = "progression.rarity_dampening." + std::string(toString(rarity));
        b.rarityDampening[value - 1] = config.getOr<double>(key, b.rarityDampening[value - 1]);
    }
    b.killBaseExperience = config.getOr<double>("progression.kill_base_experience", b.killBaseExperience);
    b.criticalBaseExperience = config.getOr<double>("progression.critical_base_experience", b.criticalBaseExperience);
    b.effectExperiencePerRarity = config.getOr<double>("progression.effect_experience_per_rarity",
                                                       b.effectExperiencePerRarity);

    b.escapeBaseChance = config.getOr<double>("combat.escape_base_chance", b.escapeBaseChance);
    b.escapeCrowdPenalty = config.getOr<double>("combat.escape_crowd_penalty", b.escapeCrowdPenalty);
    b.escapeCrowdThreshold = config.getOr<int32_t>("combat.escape_crowd_threshold", b.escapeCrowdThreshold);
    b.criticalChance = config.getOr<double>("combat.critical_chance", b.criticalChance);
    b.criticalMultiplier = config.getOr<double>("combat.critical_multiplier", b.criticalMultiplier);
    b.defendDamageFactor = config.getOr<double>("combat.defend_damage_factor", b.defendDamageFactor);
    b.dotDamagePerStrength = config.getOr<int32_t>("combat.dot_damage_per_strength", b.dotDamagePerStrength);
    b.statusLogTail = config.getOr<std::size_t>("combat.status_log_tail", b.statusLogTail);
    b.initiativeRollMax = config.getOr<int32_t>("combat.initiative_roll_max", b.initiativeRollMax);
    b.minStatusChance = config.getOr<double>("combat.min_status_chance", b.minStatusChance);

    b.recoveryBaseChance = config.getOr<double>("crafting.recovery_base_chance", b.recoveryBaseChance);
    b.recoveryDurabilityWeight = config.getOr<double>("crafting.recovery_durability_weight",
                                                      b.recoveryDurabilityWeight);
    b.rarityMeanWeight = config.getOr<double>("crafting.rarity_mean_weight", b.rarityMeanWeight);
    b.rarityMaxWeight = config.getOr<double>("crafting.rarity_max_weight", b.rarityMaxWeight);
    b.rareMinorBonusChance = config.getOr<double>("crafting.bonus.rare_minor_chance", b.rareMinorBonusChance);
    b.legendaryMajorBonusChance = config.getOr<double>("crafting.bonus.legendary_major_chance",
                                                       b.legendaryMajorBonusChance);
    b.minAccuracy = config.getOr<double>("crafting.min_accuracy", b.minAccuracy);
    b.maxAccuracy = config.getOr<double>("crafting.max_accuracy", b.maxAccuracy);
    b.minDurability = config.getOr<int32_t>("crafting.min_durability", b.minDurability);
    b.minBaseDamage = config.getOr<int32_t>("crafting.min_base_damage", b.minBaseDamage);

    return b;
}

}  // namespace cce::combat
