#pragma once

/// @file balance_config.hpp
/// @brief Tunable balance constants for progression, combat and crafting.

#include <array>
#include <cstdint>

#include "cce/combat/weapon_types.hpp"
#include "cce/foundation/config_manager.hpp"

namespace cce::combat {

/// Every tunable constant of the engine, with its shipped default.
///
/// Built from a ConfigManager by fromConfig(); absent keys keep defaults.
/// Keys are listed next to each field.
struct BalanceConfig {
    // -- progression.* ---------------------------------------------------
    int64_t firstLevelThreshold = 1000;          ///< progression.first_level_threshold
    double thresholdGrowth = 1.5;                ///< progression.threshold_growth
    int32_t evolutionEveryLevels = 3;            ///< progression.evolution_every_levels
    double damageDealtFactor = 0.1;              ///< progression.factors.damage_dealt
    double criticalHitFactor = 0.5;              ///< progression.factors.critical_hit
    double killFactor = 2.0;                     ///< progression.factors.kill
    double effectTriggeredFactor = 1.5;          ///< progression.factors.effect_triggered
    /// progression.rarity_dampening.<rarity>, indexed by Rarity value - 1.
    std::array<double, 6> rarityDampening = {1.0, 1.0, 0.8, 0.6, 0.4, 0.2};
    double killBaseExperience = 100.0;           ///< progression.kill_base_experience
    double criticalBaseExperience = 50.0;        ///< progression.critical_base_experience
    double effectExperiencePerRarity = 100.0;    ///< progression.effect_experience_per_rarity

    // -- combat.* --------------------------------------------------------
    double escapeBaseChance = 0.5;               ///< combat.escape_base_chance
    double escapeCrowdPenalty = 0.2;             ///< combat.escape_crowd_penalty
    int32_t escapeCrowdThreshold = 3;            ///< combat.escape_crowd_threshold
    double criticalChance = 0.2;                 ///< combat.critical_chance
    double criticalMultiplier = 1.5;             ///< combat.critical_multiplier
    double defendDamageFactor = 0.5;             ///< combat.defend_damage_factor
    int32_t dotDamagePerStrength = 3;            ///< combat.dot_damage_per_strength
    std::size_t statusLogTail = 5;               ///< combat.status_log_tail
    int32_t initiativeRollMax = 10;              ///< combat.initiative_roll_max
    double minStatusChance = 0.05;               ///< combat.min_status_chance

    // -- crafting.* ------------------------------------------------------
    double recoveryBaseChance = 0.3;             ///< crafting.recovery_base_chance
    double recoveryDurabilityWeight = 0.5;       ///< crafting.recovery_durability_weight
    double rarityMeanWeight = 0.7;               ///< crafting.rarity_mean_weight
    double rarityMaxWeight = 0.3;                ///< crafting.rarity_max_weight
    double rareMinorBonusChance = 0.5;           ///< crafting.bonus.rare_minor_chance
    double legendaryMajorBonusChance = 0.5;      ///< crafting.bonus.legendary_major_chance
    double minAccuracy = 0.1;                    ///< crafting.min_accuracy
    double maxAccuracy = 0.98;                   ///< crafting.max_accuracy
    int32_t minDurability = 30;                  ///< crafting.min_durability
    int32_t minBaseDamage = 5;                   ///< crafting.min_base_damage

    [[nodiscard]] double DampeningFor(Rarity rarity) const;

    static BalanceConfig fromConfig(const foundation::ConfigManager& config);
};

}  // namespace cce::combat
