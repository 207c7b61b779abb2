#pragma once

/// @file weapon_types.hpp
/// @brief Enumerations shared by the weapon, effect, crafting and combat components.

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace cce::combat {

/// Weapon family. Also the unit of crafting compatibility.
enum class WeaponCategory : uint8_t {
    Energy,
    Melee,
    Projectile,
    Tech,
    Experimental
};

constexpr std::size_t kWeaponCategoryCount = 5;

/// Ordinal quality tier; the numeric value is the rarity value used by crafting.
enum class Rarity : uint8_t {
    Common    = 1,
    Uncommon  = 2,
    Rare      = 3,
    Epic      = 4,
    Legendary = 5,
    Artifact  = 6
};

/// Damage type classification for resistance lookups.
enum class DamageType : uint8_t {
    Physical,
    Energy,
    Thermal,
    Chemical,
    Emp,
    Tech,
    Elemental,
    Explosive,
    Void,
    Variable
};

constexpr std::size_t kDamageTypeCount = 10;

/// Resistances inspected by a Scan utility when looking for a weakness.
constexpr std::array<DamageType, 5> kScannableDamageTypes = {
    DamageType::Physical, DamageType::Energy, DamageType::Thermal,
    DamageType::Chemical, DamageType::Emp
};

/// Status conditions placed on combatants by Status effects.
enum class StatusType : uint8_t {
    Bleeding,
    Burning,
    Poisoned,
    Disrupted,
    Disoriented,
    Stunned,
    Slowed,
    Weakened,
    ElementalBurn,
    RandomEffect
};

/// Statuses that deal damage each round.
constexpr bool isDamageOverTime(StatusType type) {
    return type == StatusType::Bleeding || type == StatusType::Burning
        || type == StatusType::Poisoned || type == StatusType::ElementalBurn;
}

enum class EffectCategory : uint8_t { Damage, Status, Utility };

/// Utility effect sub-types.
enum class UtilityType : uint8_t {
    Teleport,
    Stealth,
    Shield,
    Scan,
    Heal,
    ChargeRefund,
    Stance,
    ReloadSpeed,
    AccuracyBoost
};

/// Crafting component slots.
enum class ComponentCategory : uint8_t {
    Frame,
    Barrel,
    PowerSource,
    Focusing,
    Handle,
    Modifier,
    Stabilizer,
    Amplifier
};

constexpr std::size_t kComponentCategoryCount = 8;

// ── Names ──────────────────────────────────────────────────────────────────
// Lower-case snake names are the canonical spelling in YAML catalogs and logs.

std::string_view toString(WeaponCategory value);
std::string_view toString(Rarity value);
std::string_view toString(DamageType value);
std::string_view toString(StatusType value);
std::string_view toString(EffectCategory value);
std::string_view toString(UtilityType value);
std::string_view toString(ComponentCategory value);

/// Parse a canonical name (case-insensitive). Unknown names yield nullopt.
std::optional<WeaponCategory> parseWeaponCategory(std::string_view name);
std::optional<Rarity> parseRarity(std::string_view name);
std::optional<DamageType> parseDamageType(std::string_view name);
std::optional<StatusType> parseStatusType(std::string_view name);
std::optional<EffectCategory> parseEffectCategory(std::string_view name);
std::optional<UtilityType> parseUtilityType(std::string_view name);
std::optional<ComponentCategory> parseComponentCategory(std::string_view name);

/// Map a rarity value to the first tier at or above it (clamped to Common..Artifact).
Rarity rarityAtLeast(int32_t value);

}  // namespace cce::combat
