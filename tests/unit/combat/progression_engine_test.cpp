#include <gtest/gtest.h>

#include <utility>
#include <vector>

#include "cce/combat/progression_engine.hpp"
#include "scripted_random.hpp"

using namespace cce::combat;
using cce::foundation::ErrorCode;
using cce::foundation::PlayerId;
using cce::testing::ScriptedRandom;

namespace {

EffectDescriptor recharge() {
    EffectDescriptor e;
    e.id = "recharge";
    e.name = "Recharge";
    UtilityPayload p;
    p.utilityType = UtilityType::ChargeRefund;
    e.payload = p;
    e.rarity = 2;
    return e;
}

EvolutionPath evolution(std::string id, int32_t level, std::vector<std::string> prereqs = {}) {
    EvolutionPath path;
    path.id = id;
    path.name = id;
    path.description = "evolution " + id;
    path.levelRequirement = level;
    path.prerequisites = std::move(prereqs);
    return path;
}

WeaponTemplate coilgun(Rarity rarity) {
    WeaponTemplate t;
    t.id = "coilgun";
    t.name = "Coilgun";
    t.description = "Magnetic rail launcher";
    t.category = WeaponCategory::Tech;
    t.rarity = rarity;
    t.stats.baseDamage = 15;
    t.stats.maxCharge = 100;
    t.effects = {recharge()};

    auto capacitors = evolution("capacitors", 3);
    capacitors.delta.statOverwrites[StatField::MaxCharge] = 150;
    capacitors.delta.statOverwrites[StatField::ChargeRate] = 15;

    auto overcharge = evolution("overcharge", 3, {"capacitors"});
    EffectDescriptor beam;
    beam.id = "overcharge_beam";
    beam.name = "Overcharge Beam";
    beam.payload = DamagePayload{60, 1.0, std::nullopt, 0.0, 1, 0.0};
    overcharge.delta.newEffect = beam;

    auto longbarrel = evolution("long_barrel", 6);
    longbarrel.delta.statOverwrites[StatField::Range] = 30;

    t.evolutions = {capacitors, overcharge, longbarrel};
    return t;
}

}  // namespace

class ProgressionEngineTest : public ::testing::Test {
protected:
    void setUpWeapon(Rarity rarity) {
        ASSERT_TRUE(registry.RegisterTemplate(coilgun(rarity)).hasValue());
        key = registry.Assign(player, "coilgun").value();
    }

    WeaponInstance& instance() { return *registry.FindInstance(key); }

    ScriptedRandom rng;
    CombatLog log;
    WeaponRegistry registry{rng, log};
    ProgressionEngine progression{registry, log};
    PlayerId player{3};
    WeaponKey key;
};

// ═══════════════════════════════════════════════════════════════════════════
// Experience and levels
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(ProgressionEngineTest, ExperienceBelowThresholdKeepsLevel) {
    setUpWeapon(Rarity::Common);
    auto grant = progression.GrantExperience(key, ActionKind::Kill, 100.0);

    ASSERT_TRUE(grant.hasValue());
    EXPECT_EQ(grant.value().experienceGained, 200);
    EXPECT_EQ(grant.value().levelsGained, 0);
    EXPECT_EQ(instance().progress.level, 1);
    EXPECT_EQ(instance().progress.experience, 200);
}

TEST_F(ProgressionEngineTest, OverflowCarriesAcrossSeveralLevels) {
    setUpWeapon(Rarity::Common);
    std::vector<int32_t> levels;
    progression.OnLevelUp().connect([&](const WeaponKey&, int32_t level) { levels.push_back(level); });

    // 1250 * 2.0 = 2500: 1000 to reach level 2, 1500 more to reach level 3.
    auto grant = progression.GrantExperience(key, ActionKind::Kill, 1250.0).value();

    EXPECT_EQ(grant.levelsGained, 2);
    EXPECT_EQ(grant.level, 3);
    EXPECT_EQ(grant.experience, 0);
    EXPECT_EQ(grant.nextLevelThreshold, 2250);
    EXPECT_EQ(grant.evolutionsGained, 1);
    EXPECT_EQ(instance().progress.evolutionsAvailable, 1);
    ASSERT_EQ(levels.size(), 2u);
    EXPECT_EQ(levels[0], 2);
    EXPECT_EQ(levels[1], 3);
}

TEST_F(ProgressionEngineTest, RarityDampensExperience) {
    setUpWeapon(Rarity::Epic);
    auto grant = progression.GrantExperience(key, ActionKind::Kill, 500.0).value();
    EXPECT_EQ(grant.experienceGained, 600);
}

TEST_F(ProgressionEngineTest, NegativeBaseGrantsNothing) {
    setUpWeapon(Rarity::Common);
    auto grant = progression.GrantExperience(key, ActionKind::DamageDealt, -50.0).value();
    EXPECT_EQ(grant.experienceGained, 0);
    EXPECT_EQ(instance().progress.experience, 0);
}

TEST_F(ProgressionEngineTest, UnknownInstance) {
    setUpWeapon(Rarity::Common);
    auto grant = progression.GrantExperience(WeaponKey{PlayerId(99), "coilgun"},
                                             ActionKind::Kill, 10.0);
    ASSERT_TRUE(grant.hasError());
    EXPECT_EQ(grant.error().code(), ErrorCode::WeaponNotFound);
}

TEST_F(ProgressionEngineTest, TriggeredEffectEarnsExperience) {
    setUpWeapon(Rarity::Common);
    ASSERT_TRUE(registry.Trigger(key, "recharge", EffectContext{}).hasValue());
    // rarity 2 * 100 base, * 1.5 effect factor.
    EXPECT_EQ(instance().progress.experience, 300);
}

TEST_F(ProgressionEngineTest, BattleSummaryFoldsCountersAndExperience) {
    setUpWeapon(Rarity::Common);
    BattleSummary summary;
    summary.damageDealt = 1000;
    summary.kills = 1;
    summary.criticalHits = 2;
    summary.effectsTriggered = 1;

    auto grant = progression.GrantBattleSummary(key, summary).value();

    // 100 damage + 200 kill + 50 critical + 150 effect.
    EXPECT_EQ(grant.experienceGained, 500);
    EXPECT_EQ(instance().counters.damageDealt, 1000);
    EXPECT_EQ(instance().counters.kills, 1);
    EXPECT_EQ(instance().counters.criticalHits, 2);
    EXPECT_EQ(instance().counters.specialTriggers, 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// Evolution
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(ProgressionEngineTest, NoSlotsAtLevelOne) {
    setUpWeapon(Rarity::Common);
    auto result = progression.ApplyEvolution(key, "capacitors");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::NoEvolutionSlots);
}

TEST_F(ProgressionEngineTest, AvailabilityFollowsLevelAndPrerequisites) {
    setUpWeapon(Rarity::Common);
    (void)progression.GrantExperience(key, ActionKind::Kill, 1250.0);

    auto available = progression.ListAvailableEvolutions(key).value();
    ASSERT_EQ(available.size(), 1u);
    EXPECT_EQ(available[0].id, "capacitors");

    auto blocked = progression.ApplyEvolution(key, "overcharge");
    ASSERT_TRUE(blocked.hasError());
    EXPECT_EQ(blocked.error().code(), ErrorCode::EvolutionNotAvailable);
    EXPECT_EQ(instance().progress.evolutionsAvailable, 1);
}

TEST_F(ProgressionEngineTest, ApplyEvolutionMutatesOnlyTheInstance) {
    setUpWeapon(Rarity::Common);
    (void)progression.GrantExperience(key, ActionKind::Kill, 1250.0);

    ASSERT_TRUE(progression.ApplyEvolution(key, "capacitors").hasValue());

    EXPECT_EQ(instance().effective.stats.maxCharge, 150);
    EXPECT_EQ(instance().effective.stats.chargeRate, 15);
    EXPECT_EQ(instance().progress.evolutionsAvailable, 0);
    ASSERT_EQ(instance().progress.appliedEvolutions.size(), 1u);
    EXPECT_EQ(registry.FindTemplate("coilgun")->stats.maxCharge, 100);

    auto again = progression.ApplyEvolution(key, "capacitors");
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::EvolutionNotAvailable);
}

TEST_F(ProgressionEngineTest, EvolutionStatusReportsNextMilestone) {
    setUpWeapon(Rarity::Common);
    (void)progression.GrantExperience(key, ActionKind::Kill, 1250.0);
    ASSERT_TRUE(progression.ApplyEvolution(key, "capacitors").hasValue());

    auto status = progression.GetEvolutionStatus(key).value();
    EXPECT_EQ(status.level, 3);
    EXPECT_EQ(status.nextEvolutionLevel, 6);
    EXPECT_EQ(status.evolutionsAvailable, 0);
    ASSERT_EQ(status.appliedEvolutions.size(), 1u);
    ASSERT_EQ(status.availableEvolutions.size(), 1u);
    EXPECT_EQ(status.availableEvolutions[0], "overcharge");
}

TEST_F(ProgressionEngineTest, NewEffectBecomesTriggerable) {
    setUpWeapon(Rarity::Common);
    (void)progression.GrantExperience(key, ActionKind::Kill, 1250.0);
    ASSERT_TRUE(progression.ApplyEvolution(key, "capacitors").hasValue());
    (void)progression.GrantExperience(key, ActionKind::Kill, 6000.0);
    ASSERT_GE(instance().progress.evolutionsAvailable, 1);

    ASSERT_TRUE(progression.ApplyEvolution(key, "overcharge").hasValue());
    EXPECT_NE(instance().effective.FindEffect("overcharge_beam"), nullptr);
    EXPECT_EQ(registry.FindTemplate("coilgun")->FindEffect("overcharge_beam"), nullptr);
}

TEST(ApplyDeltaTest, MergesEffectModifications) {
    auto tmpl = coilgun(Rarity::Rare);
    EffectDescriptor shot;
    shot.id = "shot";
    shot.name = "Shot";
    shot.payload = DamagePayload{};
    tmpl.effects.push_back(shot);

    EvolutionDelta delta;
    delta.damageType = DamageType::Emp;
    EffectModification mod;
    mod.damage = 40;
    mod.cooldown = 2;
    mod.amount = 99;
    delta.effectModifications["shot"] = mod;
    delta.effectModifications["missing"] = mod;

    ProgressionEngine::ApplyDelta(tmpl, delta);

    const auto* merged = tmpl.FindEffect("shot");
    ASSERT_NE(merged, nullptr);
    EXPECT_EQ(merged->AsDamage()->damage, 40);
    EXPECT_EQ(merged->cooldown, 2);
    EXPECT_EQ(merged->name, "Shot");
    EXPECT_EQ(tmpl.stats.damageType, DamageType::Emp);
    EXPECT_EQ(tmpl.effects.size(), 2u);
}

TEST(ApplyDeltaTest, EvolutionShrinkingMaxChargeClampsInstance) {
    WeaponInstance instance;
    instance.effective = coilgun(Rarity::Common);
    instance.currentCharge = 100;
    instance.currentDurability = 100;

    EvolutionDelta delta;
    delta.statOverwrites[StatField::MaxCharge] = 60;
    ProgressionEngine::ApplyDelta(instance.effective, delta);
    instance.ClampResources();

    EXPECT_EQ(instance.currentCharge, 60);
}
