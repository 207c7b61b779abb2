/// @file crafting_engine.cpp
/// @brief CraftingEngine implementation: component catalog, the craft
///        pipeline and probabilistic disassembly.

#include "cce/combat/crafting_engine.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <iterator>
#include <set>
#include <sstream>

#include "cce/combat/crafting_tables.hpp"
#include "cce/foundation/game_logger.hpp"

namespace cce::combat {

using cce::foundation::ErrorCode;
using cce::foundation::GameError;
using cce::foundation::GameResult;
using cce::foundation::LogCategory;

namespace {

constexpr std::array<WeaponCategory, kWeaponCategoryCount> kCategoryPriority = {
    WeaponCategory::Experimental, WeaponCategory::Tech, WeaponCategory::Energy,
    WeaponCategory::Projectile, WeaponCategory::Melee
};

int64_t systemSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

double meanOf(const std::vector<const Component*>& parts, double (*value)(const Component&)) {
    if (parts.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (const auto* part : parts) {
        sum += value(*part);
    }
    return sum / static_cast<double>(parts.size());
}

}  // namespace

CraftingEngine::CraftingEngine(WeaponRegistry& registry, foundation::RandomSource& rng,
                               CombatLog& log)
    : registry_(registry),
      rng_(rng),
      log_(log),
      balance_(registry.Balance()),
      clock_(systemSeconds) {
    removedSlot_ = registry_.OnInstanceRemoved().connect(
        [this](const WeaponKey& key) { records_.erase(key); });
}

CraftingEngine::~CraftingEngine() {
    registry_.OnInstanceRemoved().disconnect(removedSlot_);
}

// ---------------------------------------------------------------------------
// Component catalog
// ---------------------------------------------------------------------------

GameResult<void> CraftingEngine::ValidateComponent(const Component& component) {
    auto missing = [&](std::string_view field) {
        return GameResult<void>::err(GameError(
            ErrorCode::MissingRequiredField,
            "component '" + component.id + "' is missing " + std::string(field)));
    };

    if (component.id.empty()) {
        return missing("id");
    }
    if (component.name.empty()) {
        return missing("name");
    }
    if (!component.category) {
        return missing("category");
    }
    if (component.craftingDifficulty < 1 || component.craftingDifficulty > 10) {
        return GameResult<void>::err(GameError(
            ErrorCode::InvalidArgument,
            "component '" + component.id + "' has crafting difficulty "
                + std::to_string(component.craftingDifficulty) + " outside 1-10"));
    }
    return GameResult<void>::ok();
}

GameResult<void> CraftingEngine::RegisterComponent(Component component) {
    if (auto valid = ValidateComponent(component); valid.hasError()) {
        return valid;
    }
    if (components_.count(component.id) > 0) {
        return GameResult<void>::err(GameError(
            ErrorCode::DuplicateComponent, "component '" + component.id + "' already registered"));
    }

    log_.append(LogCategory::Crafting, "Registered component '" + component.id + "'");
    auto id = component.id;
    components_.emplace(std::move(id), std::move(component));
    return GameResult<void>::ok();
}

const Component* CraftingEngine::FindComponent(const foundation::ComponentId& id) const {
    auto it = components_.find(id);
    return it != components_.end() ? &it->second : nullptr;
}

std::vector<const Component*> CraftingEngine::ListComponents(
    std::optional<ComponentCategory> category) const {
    std::vector<const Component*> out;
    for (const auto& [id, component] : components_) {
        if (category && component.category != category) {
            continue;
        }
        out.push_back(&component);
    }
    return out;
}

// ---------------------------------------------------------------------------
// Pure steps
// ---------------------------------------------------------------------------

std::optional<WeaponCategory> CraftingEngine::ResolveCategory(
    const std::vector<const Component*>& parts) {
    std::set<WeaponCategory> candidates(kCategoryPriority.begin(), kCategoryPriority.end());
    for (const auto* part : parts) {
        const bool structural = part->category == ComponentCategory::Frame
                                || part->category == ComponentCategory::Barrel;
        if (part->compatibility.empty() && !structural) {
            continue;
        }
        std::set<WeaponCategory> narrowed;
        std::set_intersection(candidates.begin(), candidates.end(),
                              part->compatibility.begin(), part->compatibility.end(),
                              std::inserter(narrowed, narrowed.begin()));
        candidates = std::move(narrowed);
    }
    for (auto category : kCategoryPriority) {
        if (candidates.count(category) > 0) {
            return category;
        }
    }
    return std::nullopt;
}

int32_t CraftingEngine::CraftingDifficulty(const std::vector<const Component*>& parts) {
    if (parts.empty()) {
        return 1;
    }
    double mean = meanOf(parts, [](const Component& c) {
        return static_cast<double>(c.craftingDifficulty);
    });
    double bonus = parts.size() >= 5 ? 2.0 : (parts.size() >= 3 ? 1.0 : 0.0);
    auto difficulty = static_cast<int32_t>(std::lround(mean + bonus));
    return std::clamp(difficulty, 1, 10);
}

Rarity CraftingEngine::ResolveRarity(const std::vector<const Component*>& parts,
                                     const BalanceConfig& balance) {
    if (parts.empty()) {
        return Rarity::Common;
    }
    double mean = meanOf(parts, [](const Component& c) {
        return static_cast<double>(static_cast<int32_t>(c.rarity));
    });
    double highest = 0.0;
    for (const auto* part : parts) {
        highest = std::max(highest, static_cast<double>(static_cast<int32_t>(part->rarity)));
    }
    auto blended = std::lround(mean * balance.rarityMeanWeight + highest * balance.rarityMaxWeight);
    return rarityAtLeast(static_cast<int32_t>(blended));
}

WeaponStats CraftingEngine::AggregateStats(WeaponCategory category,
                                           const std::vector<const Component*>& parts,
                                           const BalanceConfig& balance) {
    auto stats = crafting_tables::BaseStats(category);
    for (const auto* part : parts) {
        for (const auto& [field, delta] : part->modifiers.deltas) {
            stats.Add(field, delta);
        }
        if (part->modifiers.damageType) {
            stats.damageType = *part->modifiers.damageType;
        }
    }
    stats.accuracy = std::clamp(stats.accuracy, balance.minAccuracy, balance.maxAccuracy);
    stats.durability = std::max(stats.durability, balance.minDurability);
    stats.baseDamage = std::max(stats.baseDamage, balance.minBaseDamage);
    stats.maxCharge = std::max(stats.maxCharge, 0);
    stats.chargeRate = std::max(stats.chargeRate, 0);
    return stats;
}

// ---------------------------------------------------------------------------
// Crafting
// ---------------------------------------------------------------------------

void CraftingEngine::appendBonus(std::vector<EffectDescriptor>& effects,
                                 const std::vector<EffectDescriptor>& pool) {
    if (pool.empty()) {
        return;
    }
    auto pick = pool.size() == 1
        ? std::size_t{0}
        : static_cast<std::size_t>(rng_.uniformInt(0, static_cast<int32_t>(pool.size()) - 1));
    auto bonus = pool[pick];
    bonus.id += "_" + std::to_string(rng_.uniformInt(1000, 9999));
    effects.push_back(std::move(bonus));
}

foundation::TemplateId CraftingEngine::nextWeaponId(WeaponCategory category) {
    foundation::TemplateId id;
    do {
        id = "crafted_" + std::string(toString(category)) + "_" + std::to_string(++craftCounter_);
    } while (registry_.FindTemplate(id) != nullptr);
    return id;
}

GameResult<WeaponTemplate> CraftingEngine::Craft(foundation::PlayerId player,
                                                 const SlotAssignment& slots,
                                                 const std::string& name,
                                                 const std::string& description) {
    using Result = GameResult<WeaponTemplate>;

    for (auto required : {ComponentCategory::Frame, ComponentCategory::Barrel}) {
        auto it = slots.find(required);
        if (it == slots.end() || it->second.empty()) {
            return Result::err(GameError(
                ErrorCode::MissingRequiredComponent,
                "missing required component: " + std::string(toString(required))));
        }
    }

    std::vector<const Component*> parts;
    parts.reserve(slots.size());
    for (const auto& [slot, componentId] : slots) {
        const auto* component = FindComponent(componentId);
        if (component == nullptr || component->category != slot) {
            return Result::err(GameError(
                ErrorCode::UnknownComponent,
                "no " + std::string(toString(slot)) + " component '" + componentId + "'"));
        }
        parts.push_back(component);
    }

    auto category = ResolveCategory(parts);
    if (!category) {
        return Result::err(GameError(ErrorCode::NoCompatibleCategory,
                                     "components share no compatible weapon category"));
    }

    for (const auto* part : parts) {
        if (!part->IsCompatibleWith(*category)) {
            return Result::err(GameError(
                ErrorCode::IncompatibleComponent,
                "component '" + part->id + "' is not compatible with "
                    + std::string(toString(*category)),
                IncompatibleComponentInfo{part->id, *category}));
        }
    }

    WeaponTemplate weapon;
    weapon.id = nextWeaponId(*category);
    weapon.name = name.empty() ? "Crafted " + std::string(toString(*category)) + " weapon" : name;
    weapon.description = description.empty() ? "Assembled from " + std::to_string(parts.size())
                                                   + " components"
                                             : description;
    weapon.category = *category;
    weapon.rarity = ResolveRarity(parts, balance_);
    weapon.stats = AggregateStats(*category, parts, balance_);
    weapon.crafted = true;

    for (const auto* part : parts) {
        if (part->modifiers.newEffect && weapon.FindEffect(part->modifiers.newEffect->id) == nullptr) {
            weapon.effects.push_back(*part->modifiers.newEffect);
        }
    }
    if (weapon.effects.empty()) {
        weapon.effects.push_back(crafting_tables::DefaultEffect(*category));
    }

    switch (*weapon.rarity) {
        case Rarity::Rare:
            if (rng_.chance(balance_.rareMinorBonusChance)) {
                appendBonus(weapon.effects, crafting_tables::MinorBonuses(*category));
            }
            break;
        case Rarity::Epic:
            appendBonus(weapon.effects, crafting_tables::MinorBonuses(*category));
            break;
        case Rarity::Legendary:
            appendBonus(weapon.effects, crafting_tables::MinorBonuses(*category));
            if (rng_.chance(balance_.legendaryMajorBonusChance)) {
                appendBonus(weapon.effects, crafting_tables::MajorBonuses(*category));
            }
            break;
        case Rarity::Artifact:
            appendBonus(weapon.effects, crafting_tables::MinorBonuses(*category));
            appendBonus(weapon.effects, crafting_tables::MajorBonuses(*category));
            break;
        default:
            break;
    }

    auto difficulty = CraftingDifficulty(parts);

    if (auto registered = registry_.RegisterTemplate(weapon); registered.hasError()) {
        return Result::err(registered.error());
    }
    auto key = registry_.Assign(player, weapon.id);
    if (key.hasError()) {
        return Result::err(key.error());
    }

    CraftedWeaponRecord record;
    record.player = player;
    record.weaponId = weapon.id;
    record.components = slots;
    record.craftedAt = clock_();
    records_[key.value()] = std::move(record);

    std::ostringstream line;
    line << "Crafted " << weapon.name << " (" << toString(*category) << ", "
         << toString(*weapon.rarity) << ", difficulty " << difficulty << ", "
         << weapon.effects.size() << " effects)";
    log_.append(LogCategory::Crafting, line.str());

    return Result::ok(std::move(weapon));
}

GameResult<DisassembleResult> CraftingEngine::Disassemble(foundation::PlayerId player,
                                                          const foundation::TemplateId& weaponId) {
    using Result = GameResult<DisassembleResult>;

    WeaponKey key{player, weaponId};
    const auto* instance = registry_.FindInstance(key);
    if (instance == nullptr) {
        return Result::err(GameError(ErrorCode::WeaponNotFound,
                                     "no weapon instance " + toString(key)));
    }
    auto recordIt = records_.find(key);
    if (recordIt == records_.end()) {
        return Result::err(GameError(ErrorCode::NotCrafted,
                                     instance->effective.name + " was not crafted"));
    }

    double ratio = instance->MaxDurability() > 0
        ? static_cast<double>(instance->currentDurability) / instance->MaxDurability()
        : 0.0;
    auto weaponName = instance->effective.name;

    DisassembleResult result;
    result.recoveryChance = balance_.recoveryBaseChance + ratio * balance_.recoveryDurabilityWeight;
    for (const auto& [slot, componentId] : recordIt->second.components) {
        if (rng_.chance(result.recoveryChance)) {
            result.recovered.push_back(componentId);
        } else {
            result.lost.push_back(componentId);
        }
    }

    records_.erase(recordIt);
    if (auto removed = registry_.RemoveInstance(key); removed.hasError()) {
        return Result::err(removed.error());
    }

    log_.append(LogCategory::Crafting,
                "Disassembled " + weaponName + ": recovered "
                    + std::to_string(result.recovered.size()) + "/"
                    + std::to_string(result.recovered.size() + result.lost.size())
                    + " components");
    return Result::ok(std::move(result));
}

const CraftedWeaponRecord* CraftingEngine::FindRecord(const WeaponKey& key) const {
    auto it = records_.find(key);
    return it != records_.end() ? &it->second : nullptr;
}

GameResult<void> CraftingEngine::RestoreRecord(CraftedWeaponRecord record) {
    WeaponKey key{record.player, record.weaponId};
    if (registry_.FindInstance(key) == nullptr) {
        return GameResult<void>::err(GameError(
            ErrorCode::WeaponNotFound, "crafted record for missing instance " + toString(key)));
    }
    log_.append(LogCategory::Crafting, "Restored crafting record for " + toString(key));
    records_[key] = std::move(record);
    return GameResult<void>::ok();
}

}  // namespace cce::combat
