#include "cce/combat/combatant.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace cce::combat {

namespace {

constexpr std::array<std::string_view, 6> kModifierNames = {
    "stealth", "shield", "stance", "reload_speed", "accuracy_boost", "defending"
};

}  // namespace

std::string_view toString(ModifierKind kind) {
    auto idx = static_cast<std::size_t>(kind);
    return idx < kModifierNames.size() ? kModifierNames[idx] : std::string_view("unknown");
}

std::optional<ModifierKind> parseModifierKind(std::string_view name) {
    for (std::size_t i = 0; i < kModifierNames.size(); ++i) {
        if (kModifierNames[i] == name) {
            return static_cast<ModifierKind>(i);
        }
    }
    return std::nullopt;
}

double Combatant::Resistance(DamageType type) const {
    auto it = resistances.find(type);
    return it != resistances.end() ? it->second : 0.0;
}

double Combatant::StatusResistance(StatusType type) const {
    auto it = statusResistances.find(type);
    return it != statusResistances.end() ? it->second : 0.0;
}

double Combatant::HealthPercent() const {
    if (maxHealth <= 0) {
        return 0.0;
    }
    return 100.0 * static_cast<double>(health) / static_cast<double>(maxHealth);
}

int32_t Combatant::InitiativeBase() const {
    if (attributes) {
        return attributes->reflexes + attributes->intelligence;
    }
    return initiative;
}

double Combatant::ModifierTotal(ModifierKind kind) const {
    double total = 0.0;
    for (const auto& mod : modifiers) {
        if (mod.kind == kind) {
            total += mod.value;
        }
    }
    return total;
}

bool Combatant::HasModifier(ModifierKind kind) const {
    return std::any_of(modifiers.begin(), modifiers.end(),
                       [kind](const TimedModifier& m) { return m.kind == kind; });
}

int32_t Combatant::TakeDamage(int32_t amount) {
    int32_t remaining = std::max(0, amount);
    for (auto& mod : modifiers) {
        if (remaining == 0) {
            break;
        }
        if (mod.kind != ModifierKind::Shield || mod.value <= 0.0) {
            continue;
        }
        auto absorbed = std::min(remaining, static_cast<int32_t>(std::floor(mod.value)));
        mod.value -= absorbed;
        remaining -= absorbed;
    }
    modifiers.erase(std::remove_if(modifiers.begin(), modifiers.end(),
                                   [](const TimedModifier& m) {
                                       return m.kind == ModifierKind::Shield && m.value < 1.0;
                                   }),
                    modifiers.end());

    auto before = health;
    health = std::max(0, health - remaining);
    return before - health;
}

int32_t Combatant::Heal(int32_t amount) {
    auto before = health;
    health = std::clamp(health + std::max(0, amount), 0, maxHealth);
    return health - before;
}

std::size_t Combatant::ExpireTimed(foundation::LogicalTime now) {
    std::size_t removed = 0;
    for (auto it = statuses.begin(); it != statuses.end();) {
        if (it->second.endTime <= now) {
            it = statuses.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    auto before = modifiers.size();
    modifiers.erase(std::remove_if(modifiers.begin(), modifiers.end(),
                                   [now](const TimedModifier& m) { return m.endTime <= now; }),
                    modifiers.end());
    return removed + (before - modifiers.size());
}

}  // namespace cce::combat
