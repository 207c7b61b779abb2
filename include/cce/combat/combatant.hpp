#pragma once

/// @file combatant.hpp
/// @brief Battle participant state: health, resistances, statuses and timed modifiers.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "cce/combat/weapon_types.hpp"
#include "cce/foundation/types.hpp"

namespace cce::combat {

/// Status record on a combatant. At most one per StatusType.
struct StatusRecord {
    StatusType type = StatusType::Bleeding;
    int32_t strength = 1;
    foundation::LogicalTime startTime = 0;
    foundation::LogicalTime endTime = 0;
    foundation::PlayerId sourcePlayer;
    foundation::TemplateId sourceWeapon;
    foundation::EffectId sourceEffect;
};

/// Timed modifiers attached to the acting combatant by utility effects and Defend.
enum class ModifierKind : uint8_t {
    Stealth,
    Shield,
    Stance,
    ReloadSpeed,
    AccuracyBoost,
    Defending
};

std::string_view toString(ModifierKind kind);
std::optional<ModifierKind> parseModifierKind(std::string_view name);

struct TimedModifier {
    std::string id;
    ModifierKind kind = ModifierKind::Shield;
    /// Shield: remaining absorption. Stealth: level. Others: magnitude.
    double value = 0.0;
    foundation::LogicalTime startTime = 0;
    foundation::LogicalTime endTime = 0;
};

/// Attribute block used for initiative; combatants without it use a flat initiative.
struct CombatAttributes {
    int32_t reflexes = 5;
    int32_t intelligence = 5;
};

struct Combatant {
    std::string id;
    std::string name;
    bool isPlayer = false;
    /// Owner id for weapon lookups (player side only).
    foundation::PlayerId playerId;

    int32_t health = 100;
    int32_t maxHealth = 100;

    /// Damage-type resistance in [0, 1+]; missing entries are 0.
    std::map<DamageType, double> resistances;
    std::map<StatusType, double> statusResistances;
    bool canReceiveStatus = true;

    std::optional<CombatAttributes> attributes;
    int32_t initiative = 10;

    /// Standard attack profile.
    int32_t baseDamage = 10;
    DamageType damageType = DamageType::Physical;

    std::optional<foundation::TemplateId> equippedWeapon;

    std::map<StatusType, StatusRecord> statuses;
    std::vector<TimedModifier> modifiers;

    [[nodiscard]] bool IsAlive() const noexcept { return health > 0; }

    [[nodiscard]] double Resistance(DamageType type) const;
    [[nodiscard]] double StatusResistance(StatusType type) const;

    /// Health as a percentage of maxHealth (0-100).
    [[nodiscard]] double HealthPercent() const;

    /// reflexes + intelligence when attributes are present, flat initiative otherwise.
    [[nodiscard]] int32_t InitiativeBase() const;

    /// Sum of the values of every modifier of @p kind.
    [[nodiscard]] double ModifierTotal(ModifierKind kind) const;

    [[nodiscard]] bool HasModifier(ModifierKind kind) const;

    /// Apply incoming damage: shields absorb first, health is floored at 0.
    /// Returns the health actually lost.
    int32_t TakeDamage(int32_t amount);

    /// Restore health, clamped to maxHealth. Returns the amount healed.
    int32_t Heal(int32_t amount);

    /// Drop statuses and modifiers whose end time has been reached.
    /// Returns the number removed.
    std::size_t ExpireTimed(foundation::LogicalTime now);
};

}  // namespace cce::combat
