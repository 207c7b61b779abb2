#pragma once

/// @file effect_resolver.hpp
/// @brief Outcome computation for one effect descriptor against its targets.
///
/// Stateless. Side effects are limited to the targets, the acting combatant
/// (utility modifiers) and the weapon's counters and charge.

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "cce/combat/combatant.hpp"
#include "cce/combat/effect_descriptor.hpp"
#include "cce/combat/weapon_instance.hpp"
#include "cce/foundation/random_source.hpp"
#include "cce/foundation/types.hpp"

namespace cce::combat {

/// Battle facts an effect is checked and resolved against.
struct EffectContext {
    foundation::LogicalTime time = 0;
    int32_t consecutiveHits = 0;
    int32_t enemyCount = 0;
    bool isCritical = false;
    /// Floor of the status application chance after resistance.
    double minStatusChance = 0.05;

    /// Acting combatant; receives utility modifiers.
    Combatant* actor = nullptr;
    /// Candidate targets in priority order; the first is the primary target.
    std::vector<Combatant*> targets;
    /// Combatant id -> distance from the primary target (area effects).
    std::map<std::string, double> distances;

    /// Health percentage of the primary target, 100 when there is none.
    [[nodiscard]] double PrimaryTargetHealthPercent() const;
};

/// Result of resolving one effect.
///
/// `success == false` carries a message and leaves every participant untouched.
struct EffectOutcome {
    bool success = true;
    EffectCategory category = EffectCategory::Damage;
    foundation::EffectId effectId;
    std::string message;
    int32_t targetsAffected = 0;
    int32_t totalDamage = 0;
    int32_t kills = 0;
    int32_t healed = 0;
    int32_t chargeRestored = 0;
    std::vector<TargetResult> targetResults;

    static EffectOutcome Failure(EffectCategory category, foundation::EffectId effectId,
                                 std::string message);
};

class EffectResolver {
public:
    /// final = floor((damage + floor(weaponBase * multiplier)) * (1 - max(0, resistance - penetration))),
    /// never below 1.
    [[nodiscard]] static int32_t CalculateDamage(int32_t effectDamage,
                                                 double multiplier,
                                                 int32_t weaponBaseDamage,
                                                 double resistance,
                                                 double armorPenetration);

    /// Primary target plus, for area effects, candidates within @p aoeRadius
    /// in input order, capped at @p maxTargets. Without an area the first
    /// @p maxTargets candidates are taken. Candidates without a distance
    /// entry are out of range.
    [[nodiscard]] static std::vector<Combatant*> SelectTargets(
        const std::vector<Combatant*>& candidates,
        int32_t maxTargets,
        double aoeRadius,
        const std::map<std::string, double>& distances);

    static EffectOutcome ResolveDamage(const EffectDescriptor& effect,
                                       WeaponInstance& weapon,
                                       const EffectContext& ctx);

    static EffectOutcome ResolveStatus(const EffectDescriptor& effect,
                                       const WeaponInstance& weapon,
                                       const EffectContext& ctx,
                                       foundation::RandomSource& rng);

    static EffectOutcome ResolveUtility(const EffectDescriptor& effect,
                                        WeaponInstance& weapon,
                                        const EffectContext& ctx);

    /// Dispatch on the descriptor's category.
    static EffectOutcome Resolve(const EffectDescriptor& effect,
                                 WeaponInstance& weapon,
                                 const EffectContext& ctx,
                                 foundation::RandomSource& rng);

    /// Lowest scannable resistance of @p target (ties keep the earlier type).
    [[nodiscard]] static std::pair<DamageType, double> FindWeakness(const Combatant& target);
};

}  // namespace cce::combat
