#include "cce/combat/weapon_template.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <string>

namespace cce::combat {

namespace {

constexpr std::array<std::string_view, kStatFieldCount> kStatFieldNames = {
    "base_damage", "range", "accuracy", "max_charge", "charge_rate",
    "durability", "weight", "armor_penetration", "critical_chance",
    "critical_damage", "reload_speed"
};

int32_t truncated(double value) {
    return static_cast<int32_t>(std::trunc(value));
}

}  // namespace

std::string_view toString(StatField field) {
    auto idx = static_cast<std::size_t>(field);
    return idx < kStatFieldCount ? kStatFieldNames[idx] : std::string_view("unknown");
}

std::optional<StatField> parseStatField(std::string_view name) {
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (std::size_t i = 0; i < kStatFieldCount; ++i) {
        if (kStatFieldNames[i] == key) {
            return static_cast<StatField>(i);
        }
    }
    return std::nullopt;
}

// ── WeaponStats ────────────────────────────────────────────────────────────

double WeaponStats::Get(StatField field) const {
    switch (field) {
        case StatField::BaseDamage:       return baseDamage;
        case StatField::Range:            return range;
        case StatField::Accuracy:         return accuracy;
        case StatField::MaxCharge:        return maxCharge;
        case StatField::ChargeRate:       return chargeRate;
        case StatField::Durability:       return durability;
        case StatField::Weight:           return weight;
        case StatField::ArmorPenetration: return armorPenetration;
        case StatField::CriticalChance:   return criticalChance;
        case StatField::CriticalDamage:   return criticalDamage;
        case StatField::ReloadSpeed:      return reloadSpeed;
    }
    return 0.0;
}

void WeaponStats::Set(StatField field, double value) {
    switch (field) {
        case StatField::BaseDamage:       baseDamage = truncated(value); break;
        case StatField::Range:            range = truncated(value); break;
        case StatField::Accuracy:         accuracy = value; break;
        case StatField::MaxCharge:        maxCharge = truncated(value); break;
        case StatField::ChargeRate:       chargeRate = truncated(value); break;
        case StatField::Durability:       durability = truncated(value); break;
        case StatField::Weight:           weight = truncated(value); break;
        case StatField::ArmorPenetration: armorPenetration = value; break;
        case StatField::CriticalChance:   criticalChance = value; break;
        case StatField::CriticalDamage:   criticalDamage = value; break;
        case StatField::ReloadSpeed:      reloadSpeed = value; break;
    }
}

// ── WeaponTemplate ─────────────────────────────────────────────────────────

const EffectDescriptor* WeaponTemplate::FindEffect(std::string_view effectId) const {
    auto it = std::find_if(effects.begin(), effects.end(),
                           [&](const EffectDescriptor& e) { return e.id == effectId; });
    return it != effects.end() ? &*it : nullptr;
}

EffectDescriptor* WeaponTemplate::FindEffect(std::string_view effectId) {
    auto it = std::find_if(effects.begin(), effects.end(),
                           [&](const EffectDescriptor& e) { return e.id == effectId; });
    return it != effects.end() ? &*it : nullptr;
}

const EvolutionPath* WeaponTemplate::FindEvolution(std::string_view evolutionId) const {
    auto it = std::find_if(evolutions.begin(), evolutions.end(),
                           [&](const EvolutionPath& p) { return p.id == evolutionId; });
    return it != evolutions.end() ? &*it : nullptr;
}

// ── EffectDescriptor ───────────────────────────────────────────────────────

int32_t UtilityPayload::AmountOrDefault() const {
    if (amount) {
        return *amount;
    }
    switch (utilityType) {
        case UtilityType::Shield:       return 50;
        case UtilityType::Heal:         return 20;
        case UtilityType::ChargeRefund: return 10;
        default:                        return 0;
    }
}

int32_t EffectDescriptor::MaxTargets() const {
    return std::visit([](const auto& p) { return p.maxTargets; }, payload);
}

}  // namespace cce::combat
