/// @file combat_scenarios_test.cpp
/// @brief End-to-end flows across catalogs, combat, progression, crafting and snapshots.

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

#include "cce/combat/balance_config.hpp"
#include "cce/combat/combat_session.hpp"
#include "cce/combat/crafting_engine.hpp"
#include "cce/combat/progression_engine.hpp"
#include "cce/foundation/config_manager.hpp"
#include "cce/persistence/catalog_loader.hpp"
#include "cce/persistence/state_serializer.hpp"
#include "scripted_random.hpp"

using namespace cce::combat;
using namespace cce::persistence;
using cce::foundation::ConfigManager;
using cce::foundation::ErrorCode;
using cce::foundation::PlayerId;
using cce::foundation::ResourceKind;
using cce::foundation::ResourceShortfall;
using cce::testing::ScriptedRandom;

namespace {

std::filesystem::path repoFile(const char* relative) {
    return std::filesystem::path(CCE_DATA_DIR) / relative;
}

/// Full engine stack wired the way the simulator wires it.
struct World {
    ScriptedRandom rng;
    CombatLog log;
    WeaponRegistry registry{rng, log};
    ProgressionEngine progression{registry, log};
    CraftingEngine crafting{registry, rng, log};

    void loadCatalogs() {
        ASSERT_TRUE(CatalogLoader::loadWeapons(repoFile("data/weapons.yaml"), registry).hasValue());
        ASSERT_TRUE(CatalogLoader::loadComponents(repoFile("data/components.yaml"), crafting).hasValue());
    }
};

Combatant runner(PlayerId id) {
    Combatant c;
    c.id = "runner";
    c.name = "Runner";
    c.isPlayer = true;
    c.playerId = id;
    c.initiative = 20;
    return c;
}

Combatant raider(const std::string& id, int32_t health) {
    Combatant c;
    c.id = id;
    c.name = "Raider";
    c.health = health;
    c.maxHealth = health;
    c.initiative = 1;
    c.baseDamage = 6;
    return c;
}

}  // namespace

class CombatScenariosTest : public ::testing::Test {
protected:
    void SetUp() override {
        world.rng.fallbackUnit = 0.99;
        world.loadCatalogs();
    }

    World world;
    PlayerId player{7};
};

// ═══════════════════════════════════════════════════════════════════════════
// Reference scenarios
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(CombatScenariosTest, DamageEffectAgainstUnarmoredEnemy) {
    EffectDescriptor slash;
    slash.id = "slash";
    slash.name = "Slash";
    slash.payload = DamagePayload{10, 1.0, std::nullopt, 0.0, 1, 0.0};

    WeaponTemplate sabre;
    sabre.id = "sabre";
    sabre.name = "Sabre";
    sabre.description = "Plain sabre";
    sabre.category = WeaponCategory::Melee;
    sabre.rarity = Rarity::Common;
    sabre.stats.baseDamage = 20;
    sabre.effects = {slash};
    ASSERT_TRUE(world.registry.RegisterTemplate(sabre).hasValue());
    ASSERT_TRUE(world.registry.Assign(player, "sabre").hasValue());

    auto hero = runner(player);
    hero.equippedWeapon = "sabre";
    CombatSession session(world.registry, world.progression, world.rng, world.log,
                          hero, {raider("raider", 50)});
    ASSERT_TRUE(session.Start().hasValue());

    auto hit = session.PerformAction("runner", CombatAction::Attack, "raider");

    ASSERT_TRUE(hit.hasValue());
    EXPECT_EQ(hit.value().damage, 30);
    EXPECT_EQ(session.FindParticipant("raider")->health, 20);
    EXPECT_EQ(session.Player().health, 100);
}

TEST_F(CombatScenariosTest, InsufficientChargeLeavesInstanceUntouched) {
    auto key = world.registry.Assign(player, "nova_blaster").value();
    ASSERT_TRUE(world.registry.AddCharge(key, 40).hasValue());
    auto target = raider("raider", 100);
    EffectContext ctx;
    ctx.targets = {&target};

    auto fired = world.registry.Trigger(key, "energy_burst", ctx);

    ASSERT_TRUE(fired.hasError());
    EXPECT_EQ(fired.error().code(), ErrorCode::InsufficientCharge);
    const auto* shortfall = fired.error().context<ResourceShortfall>();
    ASSERT_NE(shortfall, nullptr);
    EXPECT_EQ(shortfall->resource, ResourceKind::Charge);
    EXPECT_EQ(shortfall->available, 40);
    EXPECT_EQ(shortfall->required, 50);
    EXPECT_EQ(world.registry.FindInstance(key)->currentCharge, 40);
    EXPECT_TRUE(world.registry.FindInstance(key)->cooldowns.empty());
    EXPECT_EQ(target.health, 100);
}

TEST_F(CombatScenariosTest, CraftingCategoryResolution) {
    ASSERT_TRUE(CatalogLoader::loadComponentsFromString(R"(
components:
  - {id: hybrid_frame, name: Hybrid Frame, category: frame, compatibility: [melee, projectile]}
  - {id: pulse_frame, name: Pulse Frame, category: frame, compatibility: [energy]}
  - {id: blade_barrel, name: Blade Barrel, category: barrel, compatibility: [melee]}
)", world.crafting).hasValue());

    auto melee = world.crafting.Craft(player,
                                      {{ComponentCategory::Frame, "hybrid_frame"},
                                       {ComponentCategory::Barrel, "blade_barrel"}},
                                      "Hook", "");
    ASSERT_TRUE(melee.hasValue()) << melee.error().message();
    EXPECT_EQ(melee.value().category, WeaponCategory::Melee);

    auto clash = world.crafting.Craft(player,
                                      {{ComponentCategory::Frame, "pulse_frame"},
                                       {ComponentCategory::Barrel, "blade_barrel"}},
                                      "Clash", "");
    ASSERT_TRUE(clash.hasError());
    EXPECT_EQ(clash.error().code(), ErrorCode::NoCompatibleCategory);
}

// ═══════════════════════════════════════════════════════════════════════════
// Campaign flows
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(CombatScenariosTest, BattleLevelsAndEvolvesShippedWeapon) {
    auto key = world.registry.Assign(player, "nova_blaster").value();
    ASSERT_TRUE(world.registry.AddCharge(key, 100).hasValue());

    auto hero = runner(player);
    hero.equippedWeapon = "nova_blaster";
    CombatSession session(world.registry, world.progression, world.rng, world.log,
                          hero, {raider("raider", 200)});
    ASSERT_TRUE(session.Start().hasValue());
    ASSERT_EQ(session.CurrentActor()->id, "runner");

    auto burst = session.PerformAction("runner", CombatAction::Attack, "raider");
    ASSERT_TRUE(burst.hasValue());
    ASSERT_TRUE(burst.value().effect.has_value());
    EXPECT_EQ(burst.value().effect->effectId, "energy_burst");
    // 50 + floor(25 * 1.0) energy damage, no resistance.
    EXPECT_EQ(burst.value().damage, 75);
    EXPECT_EQ(world.registry.FindInstance(key)->currentCharge, 50);
    EXPECT_EQ(world.registry.FindInstance(key)->cooldowns.at("energy_burst"), 4);
    EXPECT_GT(world.registry.FindInstance(key)->progress.experience, 0);

    // Enough kill experience on a rare weapon to reach level 3.
    auto grant = world.progression.GrantExperience(key, ActionKind::Kill, 1600.0);
    ASSERT_TRUE(grant.hasValue());
    EXPECT_EQ(grant.value().level, 3);
    EXPECT_EQ(grant.value().evolutionsGained, 1);

    ASSERT_TRUE(world.progression.ApplyEvolution(key, "improved_capacitors").hasValue());
    EXPECT_EQ(world.registry.FindInstance(key)->MaxCharge(), 150);
    EXPECT_EQ(world.registry.FindTemplate("nova_blaster")->stats.maxCharge, 100);
    EXPECT_EQ(world.registry.AddCharge(key, 500).value(), 150);
}

TEST_F(CombatScenariosTest, CraftedWeaponSurvivesSnapshotAndDisassembles) {
    auto crafted = world.crafting.Craft(player,
                                        {{ComponentCategory::Frame, "lightweight_frame"},
                                         {ComponentCategory::Barrel, "precision_barrel"},
                                         {ComponentCategory::Modifier, "elemental_converter"}},
                                        "Storm Caster", "Converts bolts into elemental fire");
    ASSERT_TRUE(crafted.hasValue()) << crafted.error().message();
    const auto& weapon = crafted.value();
    EXPECT_EQ(weapon.category, WeaponCategory::Energy);
    EXPECT_EQ(weapon.stats.damageType, DamageType::Elemental);
    EXPECT_NE(weapon.FindEffect("elemental_damage"), nullptr);
    EXPECT_TRUE(weapon.crafted);

    auto snapshot = StateSerializer::save(world.registry, &world.crafting);

    World restored;
    restored.loadCatalogs();
    auto loaded = StateSerializer::load(snapshot, restored.registry, &restored.crafting);
    ASSERT_TRUE(loaded.hasValue()) << loaded.error().message();

    WeaponKey key{player, weapon.id};
    ASSERT_NE(restored.registry.FindInstance(key), nullptr);
    ASSERT_NE(restored.crafting.FindRecord(key), nullptr);
    EXPECT_EQ(restored.crafting.FindRecord(key)->components.size(), 3u);

    // Full durability: every part comes back on a zero draw.
    auto parts = restored.crafting.Disassemble(player, weapon.id);
    ASSERT_TRUE(parts.hasValue());
    EXPECT_DOUBLE_EQ(parts.value().recoveryChance, 0.8);
    EXPECT_EQ(parts.value().recovered.size(), 3u);
    EXPECT_TRUE(parts.value().lost.empty());
    EXPECT_EQ(restored.registry.FindInstance(key), nullptr);
    EXPECT_EQ(restored.crafting.FindRecord(key), nullptr);
}

TEST_F(CombatScenariosTest, ShippedBalanceConfigMatchesDefaults) {
    ConfigManager config;
    ASSERT_TRUE(config.load(repoFile("config/combat.yaml")).hasValue());

    auto balance = BalanceConfig::fromConfig(config);
    BalanceConfig defaults;
    EXPECT_EQ(balance.firstLevelThreshold, defaults.firstLevelThreshold);
    EXPECT_DOUBLE_EQ(balance.killFactor, defaults.killFactor);
    EXPECT_DOUBLE_EQ(balance.DampeningFor(Rarity::Epic), 0.6);
    EXPECT_EQ(balance.statusLogTail, defaults.statusLogTail);
    EXPECT_DOUBLE_EQ(balance.rarityMeanWeight, defaults.rarityMeanWeight);
}
