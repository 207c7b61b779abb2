#pragma once

/// @file weapon_registry.hpp
/// @brief Weapon catalog (immutable templates) and per-player instance registry.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "cce/combat/balance_config.hpp"
#include "cce/combat/combat_log.hpp"
#include "cce/combat/effect_resolver.hpp"
#include "cce/combat/weapon_instance.hpp"
#include "cce/combat/weapon_template.hpp"
#include "cce/foundation/game_result.hpp"
#include "cce/foundation/random_source.hpp"
#include "cce/foundation/signal.hpp"

namespace cce::combat {

/// Why an activation check did or did not find eligible effects.
enum class ActivationReason : uint8_t {
    Eligible,
    WeaponNotFound,
    NoEffects,
    WeaponBroken,
    AllOnCooldown,
    ConditionsUnmet
};

std::string_view toString(ActivationReason reason);

struct ActivationResult {
    ActivationReason reason = ActivationReason::ConditionsUnmet;
    /// Eligible effect ids in template order.
    std::vector<foundation::EffectId> eligibleEffects;
    std::string message;

    [[nodiscard]] bool IsEligible() const noexcept { return reason == ActivationReason::Eligible; }
};

struct TriggerOutcome {
    ActiveEffect activeEffect;
    EffectOutcome outcome;
    int32_t chargeRemaining = 0;
    int32_t durabilityRemaining = 0;
};

/// Published after every successful trigger.
struct EffectTriggeredEvent {
    WeaponKey key;
    foundation::EffectId effectId;
    int32_t effectRarity = 1;
    double baseExperience = 0.0;
    foundation::LogicalTime time = 0;
};

/// Owns weapon templates and instances.
///
/// Templates are immutable once registered. Each (player, template) pair
/// has at most one instance, carrying its own effective template copy,
/// resources, cooldowns, counters and progression state.
///
/// The registry never touches session state; it publishes
/// OnEffectTriggered() for progression and OnInstanceRemoved() for
/// crafting bookkeeping.
///
/// Example:
/// @code
///   WeaponRegistry registry(rng, log);
///   (void)registry.RegisterTemplate(novaBlaster);
///   auto key = registry.Assign(PlayerId(1), "nova_blaster");
///   auto check = registry.CheckActivation(key.value(), ctx);
///   if (check.IsEligible()) {
///       auto fired = registry.Trigger(key.value(), check.eligibleEffects.front(), ctx);
///   }
/// @endcode
class WeaponRegistry {
public:
    WeaponRegistry(foundation::RandomSource& rng, CombatLog& log,
                   BalanceConfig balance = {});

    // -- Catalog ---------------------------------------------------------

    /// Required-field checks only: name, description, category, rarity,
    /// positive base damage and at least one effect.
    [[nodiscard]] static foundation::GameResult<void> ValidateTemplate(const WeaponTemplate& tmpl);

    /// Reject templates failing ValidateTemplate() and reused ids.
    foundation::GameResult<void> RegisterTemplate(WeaponTemplate tmpl);

    [[nodiscard]] const WeaponTemplate* FindTemplate(const foundation::TemplateId& id) const;

    /// Templates filtered by category and minimum rarity, sorted by id.
    [[nodiscard]] std::vector<const WeaponTemplate*> ListTemplates(
        std::optional<WeaponCategory> category = std::nullopt,
        std::optional<Rarity> minRarity = std::nullopt) const;

    [[nodiscard]] const std::map<foundation::TemplateId, WeaponTemplate>& Templates() const noexcept {
        return templates_;
    }

    // -- Instances -------------------------------------------------------

    /// Create the instance with zero charge, full durability and level-1 progress.
    foundation::GameResult<WeaponKey> Assign(foundation::PlayerId player,
                                             const foundation::TemplateId& templateId);

    /// Insert a pre-constructed instance (save/load). Its template must be registered.
    foundation::GameResult<void> RestoreInstance(WeaponInstance instance);

    [[nodiscard]] WeaponInstance* FindInstance(const WeaponKey& key);
    [[nodiscard]] const WeaponInstance* FindInstance(const WeaponKey& key) const;

    [[nodiscard]] std::vector<WeaponKey> ListPlayerWeapons(foundation::PlayerId player) const;

    [[nodiscard]] const std::map<WeaponKey, WeaponInstance>& Instances() const noexcept {
        return instances_;
    }

    /// Destroy an instance and its progress. Active effects it owns are dropped.
    foundation::GameResult<void> RemoveInstance(const WeaponKey& key);

    /// Add charge clamped to max. Returns the new charge.
    foundation::GameResult<int32_t> AddCharge(const WeaponKey& key, int32_t amount);

    /// Restore durability clamped to max. Returns the new durability.
    foundation::GameResult<int32_t> Repair(const WeaponKey& key, int32_t amount);

    // -- Activation ------------------------------------------------------

    /// Evaluate every effect not on cooldown against @p ctx. Predicates are
    /// conjunctive and short-circuit; the random trigger chance is drawn
    /// only when all other predicates of that effect passed.
    ActivationResult CheckActivation(const WeaponKey& key, const EffectContext& ctx);

    /// Re-validate, pay costs atomically, start the cooldown, resolve the
    /// effect and record an ActiveEffect. A failure leaves the instance untouched.
    /// Resource shortfalls are reported ahead of unmet conditions.
    foundation::GameResult<TriggerOutcome> Trigger(const WeaponKey& key,
                                                   const foundation::EffectId& effectId,
                                                   const EffectContext& ctx);

    /// Remove and return active effects with endTime <= @p now; prune
    /// expired cooldowns.
    std::vector<ActiveEffect> Tick(foundation::LogicalTime now);

    [[nodiscard]] const std::vector<ActiveEffect>& ActiveEffects() const noexcept {
        return activeEffects_;
    }

    void RestoreActiveEffect(ActiveEffect effect);

    [[nodiscard]] uint64_t ActiveSequence() const noexcept { return activeSequence_; }
    void SetActiveSequence(uint64_t value) noexcept { activeSequence_ = value; }

    // -- Events ----------------------------------------------------------

    foundation::Signal<const EffectTriggeredEvent&>& OnEffectTriggered() { return effectTriggered_; }
    foundation::Signal<const WeaponKey&>& OnInstanceRemoved() { return instanceRemoved_; }

    [[nodiscard]] const BalanceConfig& Balance() const noexcept { return balance_; }

private:
    /// Deterministic predicates only (everything but the trigger chance).
    [[nodiscard]] static std::optional<std::string> failedPredicate(
        const EffectDescriptor& effect, const WeaponInstance& instance, const EffectContext& ctx);

    foundation::RandomSource& rng_;
    CombatLog& log_;
    BalanceConfig balance_;

    std::map<foundation::TemplateId, WeaponTemplate> templates_;
    std::map<WeaponKey, WeaponInstance> instances_;
    std::vector<ActiveEffect> activeEffects_;
    uint64_t activeSequence_ = 0;

    foundation::Signal<const EffectTriggeredEvent&> effectTriggered_;
    foundation::Signal<const WeaponKey&> instanceRemoved_;
};

}  // namespace cce::combat
