#pragma once

/// @file component.hpp
/// @brief Crafting components and the records that tie a crafted weapon to them.

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>

#include "cce/combat/effect_descriptor.hpp"
#include "cce/combat/weapon_template.hpp"
#include "cce/combat/weapon_types.hpp"
#include "cce/foundation/types.hpp"

namespace cce::combat {

/// Stat changes a component contributes to a crafted weapon.
struct StatModifiers {
    /// Summed into the base stats.
    std::map<StatField, double> deltas;
    /// Overwrites the damage type; the last component supplying one wins.
    std::optional<DamageType> damageType;
    /// Effect granted to the crafted weapon.
    std::optional<EffectDescriptor> newEffect;
};

/// Read-only catalog entry for the crafting domain.
struct Component {
    foundation::ComponentId id;
    std::string name;
    std::string description;
    std::optional<ComponentCategory> category;
    Rarity rarity = Rarity::Common;
    /// Empty means "fits any weapon category".
    std::set<WeaponCategory> compatibility;
    StatModifiers modifiers;
    /// Assembly difficulty, 1-10.
    int32_t craftingDifficulty = 1;

    [[nodiscard]] bool IsCompatibleWith(WeaponCategory category) const {
        return compatibility.empty() || compatibility.count(category) > 0;
    }
};

/// Links a crafted weapon instance to the components used per slot.
struct CraftedWeaponRecord {
    foundation::PlayerId player;
    foundation::TemplateId weaponId;
    std::map<ComponentCategory, foundation::ComponentId> components;
    /// Seconds since the Unix epoch.
    int64_t craftedAt = 0;
};

}  // namespace cce::combat
