#pragma once

/// @file crafting_engine.hpp
/// @brief Component catalog, weapon crafting and disassembly.

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "cce/combat/balance_config.hpp"
#include "cce/combat/combat_log.hpp"
#include "cce/combat/component.hpp"
#include "cce/combat/weapon_registry.hpp"
#include "cce/foundation/game_result.hpp"
#include "cce/foundation/random_source.hpp"

namespace cce::combat {

/// Context of ErrorCode::IncompatibleComponent.
struct IncompatibleComponentInfo {
    foundation::ComponentId componentId;
    WeaponCategory category = WeaponCategory::Energy;
};

/// Component id per slot.
using SlotAssignment = std::map<ComponentCategory, foundation::ComponentId>;

struct DisassembleResult {
    std::vector<foundation::ComponentId> recovered;
    std::vector<foundation::ComponentId> lost;
    double recoveryChance = 0.0;
};

/// Turns components into weapon templates and back.
///
/// A successful craft registers the new template with the WeaponRegistry,
/// assigns it to the crafting player and keeps a CraftedWeaponRecord until
/// the instance is disassembled or removed.
class CraftingEngine {
public:
    using Clock = std::function<int64_t()>;

    CraftingEngine(WeaponRegistry& registry, foundation::RandomSource& rng, CombatLog& log);
    ~CraftingEngine();

    CraftingEngine(const CraftingEngine&) = delete;
    CraftingEngine& operator=(const CraftingEngine&) = delete;

    // -- Component catalog -----------------------------------------------

    /// Reject components lacking id, name or category, or with a difficulty
    /// outside 1-10.
    [[nodiscard]] static foundation::GameResult<void> ValidateComponent(const Component& component);

    /// ValidateComponent() plus a duplicate-id check.
    foundation::GameResult<void> RegisterComponent(Component component);

    [[nodiscard]] const Component* FindComponent(const foundation::ComponentId& id) const;

    /// Components sorted by id, optionally of one slot category.
    [[nodiscard]] std::vector<const Component*> ListComponents(
        std::optional<ComponentCategory> category = std::nullopt) const;

    [[nodiscard]] const std::map<foundation::ComponentId, Component>& Components() const noexcept {
        return components_;
    }

    // -- Crafting ----------------------------------------------------------

    /// Build, register and assign a weapon from one component per slot.
    foundation::GameResult<WeaponTemplate> Craft(foundation::PlayerId player,
                                                 const SlotAssignment& slots,
                                                 const std::string& name,
                                                 const std::string& description);

    /// Recover each recorded component with probability
    /// 0.3 + (durability / maxDurability) * 0.5, then destroy the instance
    /// and its record regardless of the draws.
    foundation::GameResult<DisassembleResult> Disassemble(foundation::PlayerId player,
                                                          const foundation::TemplateId& weaponId);

    [[nodiscard]] const CraftedWeaponRecord* FindRecord(const WeaponKey& key) const;

    [[nodiscard]] const std::map<WeaponKey, CraftedWeaponRecord>& Records() const noexcept {
        return records_;
    }

    /// Insert a record on load. The instance must exist.
    foundation::GameResult<void> RestoreRecord(CraftedWeaponRecord record);

    [[nodiscard]] uint64_t CraftCounter() const noexcept { return craftCounter_; }
    void SetCraftCounter(uint64_t value) noexcept { craftCounter_ = value; }

    /// Replace the timestamp source (defaults to system clock seconds).
    void SetClock(Clock clock) { clock_ = std::move(clock); }

    // -- Pure steps --------------------------------------------------------

    /// Intersect compatibility sets and pick by priority Experimental, Tech,
    /// Energy, Projectile, Melee. Frame and Barrel always narrow the
    /// candidates; an empty set on any other slot fits every category.
    [[nodiscard]] static std::optional<WeaponCategory> ResolveCategory(
        const std::vector<const Component*>& parts);

    /// round(mean difficulty + complexity bonus) clamped to 1-10; the bonus
    /// is 2 for five or more parts, 1 for three or more.
    [[nodiscard]] static int32_t CraftingDifficulty(const std::vector<const Component*>& parts);

    /// round(mean * meanWeight + max * maxWeight) mapped to a tier.
    [[nodiscard]] static Rarity ResolveRarity(const std::vector<const Component*>& parts,
                                              const BalanceConfig& balance);

    /// Base stats plus summed deltas, then clamped.
    [[nodiscard]] static WeaponStats AggregateStats(WeaponCategory category,
                                                    const std::vector<const Component*>& parts,
                                                    const BalanceConfig& balance);

private:
    void appendBonus(std::vector<EffectDescriptor>& effects,
                     const std::vector<EffectDescriptor>& pool);

    [[nodiscard]] foundation::TemplateId nextWeaponId(WeaponCategory category);

    WeaponRegistry& registry_;
    foundation::RandomSource& rng_;
    CombatLog& log_;
    BalanceConfig balance_;
    Clock clock_;

    std::map<foundation::ComponentId, Component> components_;
    std::map<WeaponKey, CraftedWeaponRecord> records_;
    uint64_t craftCounter_ = 0;
    foundation::Signal<const WeaponKey&>::SlotId removedSlot_ = 0;
};

}  // namespace cce::combat
