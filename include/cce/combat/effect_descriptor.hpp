#pragma once

/// @file effect_descriptor.hpp
/// @brief Declarative definition of one special ability a weapon can trigger.

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "cce/combat/weapon_types.hpp"
#include "cce/foundation/types.hpp"

namespace cce::combat {

/// Damage payload.
///
/// total = damage + floor(weapon.baseDamage * multiplier), then reduced by
/// the target's resistance to the damage type (minus armor penetration).
struct DamagePayload {
    int32_t damage = 0;
    double multiplier = 1.0;
    /// Unset means "use the weapon's damage type".
    std::optional<DamageType> damageType;
    double armorPenetration = 0.0;
    int32_t maxTargets = 1;
    /// 0 means single-target; > 0 pulls in candidates within this distance.
    double aoeRadius = 0.0;
};

/// Status payload. Applying a status replaces any same-type status on the target.
struct StatusPayload {
    StatusType statusType = StatusType::Bleeding;
    int32_t statusDuration = 3;
    int32_t strength = 1;
    double applicationChance = 1.0;
    int32_t maxTargets = 1;
};

/// Utility payload. Fields are interpreted per utility type:
///
/// | Type          | Fields used                                          |
/// |---------------|------------------------------------------------------|
/// | Teleport      | distance (5), direction ("forward")                  |
/// | Stealth       | level (1), modifierDuration (3)                      |
/// | Shield        | amount (50), modifierDuration (3)                    |
/// | Scan          | range (10), maxTargets (5), revealWeakness           |
/// | Heal          | amount (20), percentage of max health                |
/// | ChargeRefund  | amount (10) of weapon charge                         |
/// | Stance        | magnitude = critical chance bonus, modifierDuration  |
/// | ReloadSpeed   | magnitude, modifierDuration                          |
/// | AccuracyBoost | magnitude, modifierDuration                          |
struct UtilityPayload {
    UtilityType utilityType = UtilityType::Heal;
    std::optional<int32_t> amount;
    double percentage = 0.0;
    double magnitude = 0.0;
    int32_t distance = 5;
    std::string direction = "forward";
    int32_t level = 1;
    int32_t modifierDuration = 3;
    int32_t range = 10;
    int32_t maxTargets = 5;
    bool revealWeakness = false;

    /// amount, or the per-type default from the table above.
    [[nodiscard]] int32_t AmountOrDefault() const;
};

/// Tagged union; the alternative index matches EffectCategory.
using EffectPayload = std::variant<DamagePayload, StatusPayload, UtilityPayload>;

/// Conjunction of named predicates. Unset predicates always pass.
struct TriggerConditions {
    std::optional<int32_t> minCharge;
    /// Passes when the target's health percentage (0-100) is strictly below.
    std::optional<double> targetHealthBelowPercent;
    std::optional<int32_t> consecutiveHits;
    std::optional<int32_t> enemyCount;
    bool requiresCritical = false;
    /// Random gate in [0, 1]; evaluated by the activation check only.
    std::optional<double> triggerChance;

    [[nodiscard]] bool IsEmpty() const noexcept {
        return !minCharge && !targetHealthBelowPercent && !consecutiveHits
            && !enemyCount && !requiresCritical && !triggerChance;
    }
};

struct ResourceCost {
    int32_t charge = 0;
    int32_t durability = 0;
};

struct EffectDescriptor {
    foundation::EffectId id;
    std::string name;
    std::string description;
    EffectPayload payload;
    TriggerConditions conditions;
    ResourceCost cost;
    /// Turns before the effect can trigger again. 0 means no cooldown.
    int32_t cooldown = 0;
    /// Lifetime of the resulting ActiveEffect in turns.
    int32_t duration = 1;
    /// Effect rarity; triggering grants rarity * 100 base experience.
    int32_t rarity = 1;

    [[nodiscard]] EffectCategory Category() const noexcept {
        return static_cast<EffectCategory>(payload.index());
    }

    [[nodiscard]] int32_t MaxTargets() const;

    [[nodiscard]] const DamagePayload* AsDamage() const noexcept { return std::get_if<DamagePayload>(&payload); }
    [[nodiscard]] const StatusPayload* AsStatus() const noexcept { return std::get_if<StatusPayload>(&payload); }
    [[nodiscard]] const UtilityPayload* AsUtility() const noexcept { return std::get_if<UtilityPayload>(&payload); }
    DamagePayload* AsDamage() noexcept { return std::get_if<DamagePayload>(&payload); }
    StatusPayload* AsStatus() noexcept { return std::get_if<StatusPayload>(&payload); }
    UtilityPayload* AsUtility() noexcept { return std::get_if<UtilityPayload>(&payload); }
};

}  // namespace cce::combat
