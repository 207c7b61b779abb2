#pragma once

/// @file crafting_tables.hpp
/// @brief Per-category base stats, default effects and bonus effect pools.

#include <vector>

#include "cce/combat/effect_descriptor.hpp"
#include "cce/combat/weapon_template.hpp"
#include "cce/combat/weapon_types.hpp"

namespace cce::combat::crafting_tables {

/// Starting stats of a crafted weapon before component deltas.
///
/// | Category     | dmg | type     | range | acc  | charge | rate | dur | wt |
/// |--------------|-----|----------|-------|------|--------|------|-----|----|
/// | Energy       | 20  | energy   | 18    | 0.80 | 100    | 10   | 100 | 3  |
/// | Melee        | 35  | physical | 2     | 0.90 | 100    | 0    | 120 | 4  |
/// | Projectile   | 25  | physical | 20    | 0.75 | 30     | 6    | 110 | 5  |
/// | Tech         | 18  | tech     | 15    | 0.85 | 80     | 12   | 90  | 3  |
/// | Experimental | 30  | variable | 16    | 0.70 | 120    | 8    | 70  | 6  |
[[nodiscard]] WeaponStats BaseStats(WeaponCategory category);

/// Signature effect given to a crafted weapon whose components grant none.
[[nodiscard]] EffectDescriptor DefaultEffect(WeaponCategory category);

/// Bonus effect pools. Ids are stems; crafting appends a random suffix.
[[nodiscard]] std::vector<EffectDescriptor> MinorBonuses(WeaponCategory category);
[[nodiscard]] std::vector<EffectDescriptor> MajorBonuses(WeaponCategory category);

}  // namespace cce::combat::crafting_tables
