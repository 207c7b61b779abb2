#include "cce/combat/weapon_types.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace cce::combat {

namespace {

constexpr std::array<std::string_view, kWeaponCategoryCount> kWeaponCategoryNames = {
    "energy", "melee", "projectile", "tech", "experimental"
};

constexpr std::array<std::string_view, 6> kRarityNames = {
    "common", "uncommon", "rare", "epic", "legendary", "artifact"
};

constexpr std::array<std::string_view, kDamageTypeCount> kDamageTypeNames = {
    "physical", "energy", "thermal", "chemical", "emp",
    "tech", "elemental", "explosive", "void", "variable"
};

constexpr std::array<std::string_view, 10> kStatusTypeNames = {
    "bleeding", "burning", "poisoned", "disrupted", "disoriented",
    "stunned", "slowed", "weakened", "elemental_burn", "random_effect"
};

constexpr std::array<std::string_view, 3> kEffectCategoryNames = {
    "damage", "status", "utility"
};

constexpr std::array<std::string_view, 9> kUtilityTypeNames = {
    "teleport", "stealth", "shield", "scan", "heal",
    "charge_refund", "stance", "reload_speed", "accuracy_boost"
};

constexpr std::array<std::string_view, kComponentCategoryCount> kComponentCategoryNames = {
    "frame", "barrel", "power_source", "focusing",
    "handle", "modifier", "stabilizer", "amplifier"
};

std::string lowered(std::string_view name) {
    std::string out(name);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

template <typename Enum, std::size_t N>
std::optional<Enum> parseIndexed(const std::array<std::string_view, N>& names,
                                 std::string_view name, int offset = 0) {
    auto key = lowered(name);
    for (std::size_t i = 0; i < N; ++i) {
        if (names[i] == key) {
            return static_cast<Enum>(static_cast<int>(i) + offset);
        }
    }
    return std::nullopt;
}

template <std::size_t N>
std::string_view nameAt(const std::array<std::string_view, N>& names, std::size_t idx) {
    return idx < N ? names[idx] : std::string_view("unknown");
}

}  // namespace

std::string_view toString(WeaponCategory value) {
    return nameAt(kWeaponCategoryNames, static_cast<std::size_t>(value));
}

std::string_view toString(Rarity value) {
    return nameAt(kRarityNames, static_cast<std::size_t>(value) - 1);
}

std::string_view toString(DamageType value) {
    return nameAt(kDamageTypeNames, static_cast<std::size_t>(value));
}

std::string_view toString(StatusType value) {
    return nameAt(kStatusTypeNames, static_cast<std::size_t>(value));
}

std::string_view toString(EffectCategory value) {
    return nameAt(kEffectCategoryNames, static_cast<std::size_t>(value));
}

std::string_view toString(UtilityType value) {
    return nameAt(kUtilityTypeNames, static_cast<std::size_t>(value));
}

std::string_view toString(ComponentCategory value) {
    return nameAt(kComponentCategoryNames, static_cast<std::size_t>(value));
}

std::optional<WeaponCategory> parseWeaponCategory(std::string_view name) {
    return parseIndexed<WeaponCategory>(kWeaponCategoryNames, name);
}

std::optional<Rarity> parseRarity(std::string_view name) {
    return parseIndexed<Rarity>(kRarityNames, name, 1);
}

std::optional<DamageType> parseDamageType(std::string_view name) {
    return parseIndexed<DamageType>(kDamageTypeNames, name);
}

std::optional<StatusType> parseStatusType(std::string_view name) {
    return parseIndexed<StatusType>(kStatusTypeNames, name);
}

std::optional<EffectCategory> parseEffectCategory(std::string_view name) {
    return parseIndexed<EffectCategory>(kEffectCategoryNames, name);
}

std::optional<UtilityType> parseUtilityType(std::string_view name) {
    return parseIndexed<UtilityType>(kUtilityTypeNames, name);
}

std::optional<ComponentCategory> parseComponentCategory(std::string_view name) {
    return parseIndexed<ComponentCategory>(kComponentCategoryNames, name);
}

Rarity rarityAtLeast(int32_t value) {
    auto clamped = std::clamp<int32_t>(value, static_cast<int32_t>(Rarity::Common),
                                       static_cast<int32_t>(Rarity::Artifact));
    return static_cast<Rarity>(clamped);
}

}  // namespace cce::combat
