#pragma once

/// @file weapon_template.hpp
/// @brief Immutable weapon catalog entries and evolution definitions.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cce/combat/effect_descriptor.hpp"
#include "cce/combat/weapon_types.hpp"
#include "cce/foundation/types.hpp"

namespace cce::combat {

/// Numeric weapon stats addressable by name (crafting deltas, evolution overwrites).
enum class StatField : uint8_t {
    BaseDamage,
    Range,
    Accuracy,
    MaxCharge,
    ChargeRate,
    Durability,
    Weight,
    ArmorPenetration,
    CriticalChance,
    CriticalDamage,
    ReloadSpeed
};

constexpr std::size_t kStatFieldCount = 11;

std::string_view toString(StatField field);
std::optional<StatField> parseStatField(std::string_view name);

struct WeaponStats {
    int32_t baseDamage = 0;
    DamageType damageType = DamageType::Physical;
    int32_t range = 0;
    double accuracy = 0.8;
    int32_t maxCharge = 100;
    int32_t chargeRate = 0;
    int32_t durability = 100;
    int32_t weight = 0;
    double armorPenetration = 0.0;
    double criticalChance = 0.0;
    double criticalDamage = 0.0;
    double reloadSpeed = 0.0;

    [[nodiscard]] double Get(StatField field) const;

    /// Overwrite a field; integral fields are truncated.
    void Set(StatField field, double value);

    void Add(StatField field, double delta) { Set(field, Get(field) + delta); }
};

/// Per-field changes merged into an existing effect by an evolution.
///
/// Payload fields that do not match the effect's category are ignored.
struct EffectModification {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<int32_t> cooldown;
    std::optional<int32_t> duration;
    std::optional<int32_t> costCharge;
    std::optional<int32_t> costDurability;
    std::optional<int32_t> minCharge;
    std::optional<double> triggerChance;
    // Damage
    std::optional<int32_t> damage;
    std::optional<double> multiplier;
    std::optional<DamageType> damageType;
    std::optional<double> armorPenetration;
    std::optional<int32_t> maxTargets;
    std::optional<double> aoeRadius;
    // Status
    std::optional<int32_t> statusDuration;
    std::optional<int32_t> strength;
    std::optional<double> applicationChance;
    // Utility
    std::optional<int32_t> amount;
    std::optional<double> percentage;
    std::optional<double> magnitude;
};

/// Changes an evolution makes to an instance's effective template.
struct EvolutionDelta {
    std::map<StatField, double> statOverwrites;
    std::optional<DamageType> damageType;
    std::map<foundation::EffectId, EffectModification> effectModifications;
    std::optional<EffectDescriptor> newEffect;
};

struct EvolutionPath {
    foundation::EvolutionId id;
    std::string name;
    std::string description;
    int32_t levelRequirement = 1;
    std::vector<foundation::EvolutionId> prerequisites;
    EvolutionDelta delta;
};

/// Catalog definition of a weapon. Never mutated after registration;
/// instances own a copy as their effective template.
struct WeaponTemplate {
    foundation::TemplateId id;
    std::string name;
    std::string description;
    std::optional<WeaponCategory> category;
    std::optional<Rarity> rarity;
    WeaponStats stats;
    std::vector<EffectDescriptor> effects;
    std::vector<EvolutionPath> evolutions;
    bool crafted = false;

    [[nodiscard]] const EffectDescriptor* FindEffect(std::string_view effectId) const;
    EffectDescriptor* FindEffect(std::string_view effectId);

    [[nodiscard]] const EvolutionPath* FindEvolution(std::string_view evolutionId) const;
};

}  // namespace cce::combat
