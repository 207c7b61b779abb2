#pragma once

/// @file weapon_instance.hpp
/// @brief Per-player mutable weapon state, progression state and active effects.

#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "cce/combat/weapon_template.hpp"
#include "cce/foundation/types.hpp"

namespace cce::combat {

/// Identifies a weapon instance: exactly one per (player, template) pair.
struct WeaponKey {
    foundation::PlayerId player;
    foundation::TemplateId weaponId;

    auto operator<=>(const WeaponKey&) const = default;
};

std::string toString(const WeaponKey& key);

/// Experience and evolution state, co-created and co-destroyed with its instance.
struct EvolutionProgress {
    int32_t level = 1;
    int64_t experience = 0;
    int64_t nextLevelThreshold = 1000;
    int32_t evolutionsAvailable = 0;
    std::vector<foundation::EvolutionId> appliedEvolutions;

    [[nodiscard]] bool HasApplied(const foundation::EvolutionId& id) const;
};

struct InstanceCounters {
    int32_t kills = 0;
    int64_t damageDealt = 0;
    int32_t specialTriggers = 0;
    int32_t criticalHits = 0;
};

/// A player's live copy of a weapon.
///
/// The effective template starts as a copy of the catalog entry and is
/// mutated only by evolutions. Charge and durability are bounded by the
/// effective template's maxCharge and durability.
struct WeaponInstance {
    foundation::PlayerId owner;
    foundation::TemplateId templateId;
    WeaponTemplate effective;
    int32_t currentCharge = 0;
    int32_t currentDurability = 0;
    /// effect id -> logical time at which the effect is ready again.
    std::map<foundation::EffectId, foundation::LogicalTime> cooldowns;
    InstanceCounters counters;
    EvolutionProgress progress;

    [[nodiscard]] WeaponKey Key() const { return WeaponKey{owner, templateId}; }

    [[nodiscard]] int32_t MaxCharge() const noexcept { return effective.stats.maxCharge; }
    [[nodiscard]] int32_t MaxDurability() const noexcept { return effective.stats.durability; }
    [[nodiscard]] bool IsBroken() const noexcept { return currentDurability <= 0; }

    [[nodiscard]] bool IsOnCooldown(const foundation::EffectId& effectId,
                                    foundation::LogicalTime now) const;

    /// Add charge, clamped to [0, maxCharge]. Returns the amount actually added.
    int32_t AddCharge(int32_t amount);

    /// Restore durability, clamped to [0, maxDurability]. Returns the amount restored.
    int32_t Repair(int32_t amount);

    /// Re-establish 0 <= charge <= max and 0 <= durability <= max after
    /// the effective template changed.
    void ClampResources();
};

/// Per-target entry of an effect outcome.
struct TargetResult {
    std::string targetId;
    int32_t damage = 0;
    int32_t healthRemaining = 0;
    bool killed = false;
    std::optional<StatusType> status;
    bool applied = false;
    double applicationChance = 0.0;
    /// Scan weakness report.
    std::optional<DamageType> weakness;
    double weaknessValue = 0.0;
};

/// Runtime record of a triggered effect; collected once time >= endTime.
struct ActiveEffect {
    std::string instanceId;
    foundation::PlayerId player;
    foundation::TemplateId weaponId;
    foundation::EffectId effectId;
    EffectDescriptor snapshot;
    foundation::LogicalTime startTime = 0;
    foundation::LogicalTime endTime = 0;
    std::vector<std::string> targets;
    std::vector<TargetResult> results;
};

}  // namespace cce::combat
