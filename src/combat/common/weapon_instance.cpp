#include "cce/combat/weapon_instance.hpp"

#include <algorithm>

namespace cce::combat {

std::string toString(const WeaponKey& key) {
    return std::to_string(key.player.value()) + "/" + key.weaponId;
}

bool EvolutionProgress::HasApplied(const foundation::EvolutionId& id) const {
    return std::find(appliedEvolutions.begin(), appliedEvolutions.end(), id)
        != appliedEvolutions.end();
}

bool WeaponInstance::IsOnCooldown(const foundation::EffectId& effectId,
                                  foundation::LogicalTime now) const {
    auto it = cooldowns.find(effectId);
    return it != cooldowns.end() && now < it->second;
}

int32_t WeaponInstance::AddCharge(int32_t amount) {
    auto before = currentCharge;
    currentCharge = std::clamp(currentCharge + amount, 0, std::max(0, MaxCharge()));
    return currentCharge - before;
}

int32_t WeaponInstance::Repair(int32_t amount) {
    auto before = currentDurability;
    currentDurability = std::clamp(currentDurability + amount, 0, std::max(0, MaxDurability()));
    return currentDurability - before;
}

void WeaponInstance::ClampResources() {
    currentCharge = std::clamp(currentCharge, 0, std::max(0, MaxCharge()));
    currentDurability = std::clamp(currentDurability, 0, std::max(0, MaxDurability()));
}

}  // namespace cce::combat
