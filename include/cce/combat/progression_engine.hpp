#pragma once

/// @file progression_engine.hpp
/// @brief Weapon experience, leveling and evolution.

#include <cstdint>
#include <string_view>
#include <vector>

#include "cce/combat/balance_config.hpp"
#include "cce/combat/combat_log.hpp"
#include "cce/combat/weapon_instance.hpp"
#include "cce/combat/weapon_registry.hpp"
#include "cce/foundation/game_result.hpp"
#include "cce/foundation/signal.hpp"

namespace cce::combat {

/// Battle actions that earn weapon experience.
enum class ActionKind : uint8_t {
    DamageDealt,
    CriticalHit,
    Kill,
    EffectTriggered
};

std::string_view toString(ActionKind kind);

struct ExperienceGrant {
    int64_t experienceGained = 0;
    int32_t levelsGained = 0;
    int32_t evolutionsGained = 0;
    int32_t level = 1;
    int64_t experience = 0;
    int64_t nextLevelThreshold = 0;
};

/// Leveling snapshot for a UI ("2 levels until the next evolution").
struct EvolutionStatus {
    int32_t level = 1;
    int64_t experience = 0;
    int64_t nextLevelThreshold = 0;
    int32_t evolutionsAvailable = 0;
    int32_t nextEvolutionLevel = 3;
    std::vector<foundation::EvolutionId> appliedEvolutions;
    std::vector<foundation::EvolutionId> availableEvolutions;
};

/// Aggregate battle results converted into experience after a fight.
struct BattleSummary {
    int64_t damageDealt = 0;
    int32_t kills = 0;
    int32_t criticalHits = 0;
    int32_t effectsTriggered = 0;
};

/// Monotonic progression over each instance's EvolutionProgress.
///
/// Subscribes to WeaponRegistry::OnEffectTriggered() for the lifetime of
/// the engine, so every successful trigger earns experience.
class ProgressionEngine {
public:
    ProgressionEngine(WeaponRegistry& registry, CombatLog& log);
    ~ProgressionEngine();

    ProgressionEngine(const ProgressionEngine&) = delete;
    ProgressionEngine& operator=(const ProgressionEngine&) = delete;

    /// Scale @p baseExperience by the action factor and the weapon's rarity
    /// dampening, then settle levels. Experience never decreases levels.
    ExperienceGrant GrantExperience(WeaponInstance& instance, ActionKind kind,
                                    double baseExperience);

    foundation::GameResult<ExperienceGrant> GrantExperience(const WeaponKey& key,
                                                            ActionKind kind,
                                                            double baseExperience);

    /// Fold a battle summary into counters and experience.
    foundation::GameResult<ExperienceGrant> GrantBattleSummary(const WeaponKey& key,
                                                               const BattleSummary& summary);

    /// Evolution paths not yet applied whose level requirement and
    /// prerequisites are met, in template order.
    [[nodiscard]] std::vector<EvolutionPath> ListAvailableEvolutions(
        const WeaponInstance& instance) const;

    foundation::GameResult<std::vector<EvolutionPath>> ListAvailableEvolutions(
        const WeaponKey& key) const;

    /// Spend one evolution slot and merge the evolution into the instance's
    /// effective template.
    foundation::GameResult<void> ApplyEvolution(const WeaponKey& key,
                                                const foundation::EvolutionId& evolutionId);

    foundation::GameResult<EvolutionStatus> GetEvolutionStatus(const WeaponKey& key) const;

    /// Fired after every level gained (key, new level).
    foundation::Signal<const WeaponKey&, int32_t>& OnLevelUp() { return levelUp_; }

    /// Merge @p delta into @p effective: scalar stats overwrite, effect
    /// modifications merge field by field into the matching effect, and a
    /// new effect is appended.
    static void ApplyDelta(WeaponTemplate& effective, const EvolutionDelta& delta);

private:
    [[nodiscard]] double actionFactor(ActionKind kind) const;

    void onEffectTriggered(const EffectTriggeredEvent& event);

    WeaponRegistry& registry_;
    CombatLog& log_;
    BalanceConfig balance_;
    foundation::Signal<const EffectTriggeredEvent&>::SlotId triggerSlot_ = 0;
    foundation::Signal<const WeaponKey&, int32_t> levelUp_;
};

}  // namespace cce::combat
