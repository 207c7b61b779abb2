#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

#include "cce/combat/effect_resolver.hpp"
#include "scripted_random.hpp"

using namespace cce::combat;
using cce::testing::ScriptedRandom;

namespace {

Combatant makeTarget(const std::string& id, int32_t health) {
    Combatant c;
    c.id = id;
    c.name = id;
    c.health = health;
    c.maxHealth = health;
    return c;
}

WeaponInstance makeWeapon(int32_t baseDamage) {
    WeaponInstance w;
    w.owner = cce::foundation::PlayerId(1);
    w.templateId = "test_rifle";
    w.effective.id = "test_rifle";
    w.effective.name = "Test Rifle";
    w.effective.stats.baseDamage = baseDamage;
    w.effective.stats.maxCharge = 100;
    w.effective.stats.durability = 100;
    w.currentDurability = 100;
    return w;
}

EffectDescriptor damageEffect(int32_t damage, double multiplier) {
    EffectDescriptor e;
    e.id = "burst";
    e.name = "Burst";
    DamagePayload p;
    p.damage = damage;
    p.multiplier = multiplier;
    e.payload = p;
    return e;
}

EffectDescriptor statusEffect(StatusType type, double chance) {
    EffectDescriptor e;
    e.id = "ignite";
    e.name = "Ignite";
    StatusPayload p;
    p.statusType = type;
    p.statusDuration = 3;
    p.strength = 2;
    p.applicationChance = chance;
    e.payload = p;
    return e;
}

EffectDescriptor utilityEffect(UtilityType type) {
    EffectDescriptor e;
    e.id = "utility";
    e.name = "Utility";
    UtilityPayload p;
    p.utilityType = type;
    e.payload = p;
    return e;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Damage formula
// ═══════════════════════════════════════════════════════════════════════════

TEST(CalculateDamageTest, AddsEffectDamageToScaledBase) {
    EXPECT_EQ(EffectResolver::CalculateDamage(10, 1.0, 20, 0.0, 0.0), 30);
    EXPECT_EQ(EffectResolver::CalculateDamage(40, 1.2, 25, 0.0, 0.0), 70);
}

TEST(CalculateDamageTest, ResistanceReducesAndFloors) {
    // 30 * 0.75 = 22.5
    EXPECT_EQ(EffectResolver::CalculateDamage(10, 1.0, 20, 0.25, 0.0), 22);
}

TEST(CalculateDamageTest, PenetrationOffsetsResistance) {
    EXPECT_EQ(EffectResolver::CalculateDamage(10, 1.0, 20, 0.5, 0.3), 24);
    EXPECT_EQ(EffectResolver::CalculateDamage(10, 1.0, 20, 0.5, 0.9), 30);
}

TEST(CalculateDamageTest, NeverBelowOne) {
    EXPECT_EQ(EffectResolver::CalculateDamage(10, 1.0, 20, 1.0, 0.0), 1);
    EXPECT_EQ(EffectResolver::CalculateDamage(0, 0.0, 0, 0.0, 0.0), 1);
    EXPECT_EQ(EffectResolver::CalculateDamage(10, 1.0, 20, 1.5, 0.0), 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// Target selection
// ═══════════════════════════════════════════════════════════════════════════

TEST(SelectTargetsTest, SingleTargetTakesFirstCandidates) {
    auto a = makeTarget("a", 10);
    auto b = makeTarget("b", 10);
    auto c = makeTarget("c", 10);
    std::vector<Combatant*> candidates = {&a, &b, &c};

    auto selected = EffectResolver::SelectTargets(candidates, 2, 0.0, {});
    ASSERT_EQ(selected.size(), 2u);
    EXPECT_EQ(selected[0]->id, "a");
    EXPECT_EQ(selected[1]->id, "b");
}

TEST(SelectTargetsTest, AreaKeepsPrimaryAndCandidatesInRadius) {
    auto a = makeTarget("a", 10);
    auto b = makeTarget("b", 10);
    auto c = makeTarget("c", 10);
    auto d = makeTarget("d", 10);
    std::vector<Combatant*> candidates = {&a, &b, &c, &d};
    std::map<std::string, double> distances = {{"b", 6.0}, {"c", 5.0}};

    auto selected = EffectResolver::SelectTargets(candidates, 5, 5.0, distances);
    ASSERT_EQ(selected.size(), 2u);
    EXPECT_EQ(selected[0]->id, "a");
    EXPECT_EQ(selected[1]->id, "c");
}

TEST(SelectTargetsTest, AreaRespectsMaxTargets) {
    auto a = makeTarget("a", 10);
    auto b = makeTarget("b", 10);
    auto c = makeTarget("c", 10);
    std::vector<Combatant*> candidates = {&a, &b, &c};
    std::map<std::string, double> distances = {{"b", 1.0}, {"c", 1.0}};

    auto selected = EffectResolver::SelectTargets(candidates, 2, 5.0, distances);
    ASSERT_EQ(selected.size(), 2u);
    EXPECT_EQ(selected[1]->id, "b");
}

TEST(SelectTargetsTest, EmptyOrZeroMaxSelectsNothing) {
    auto a = makeTarget("a", 10);
    EXPECT_TRUE(EffectResolver::SelectTargets({}, 3, 0.0, {}).empty());
    EXPECT_TRUE(EffectResolver::SelectTargets({&a}, 0, 0.0, {}).empty());
}

// ═══════════════════════════════════════════════════════════════════════════
// Damage resolution
// ═══════════════════════════════════════════════════════════════════════════

TEST(ResolveDamageTest, BasicHitAgainstUnresistedTarget) {
    auto weapon = makeWeapon(20);
    auto enemy = makeTarget("enemy", 50);
    EffectContext ctx;
    ctx.targets = {&enemy};

    auto out = EffectResolver::ResolveDamage(damageEffect(10, 1.0), weapon, ctx);

    ASSERT_TRUE(out.success);
    EXPECT_EQ(out.totalDamage, 30);
    EXPECT_EQ(out.targetsAffected, 1);
    EXPECT_EQ(enemy.health, 20);
    ASSERT_EQ(out.targetResults.size(), 1u);
    EXPECT_EQ(out.targetResults[0].healthRemaining, 20);
    EXPECT_FALSE(out.targetResults[0].killed);
    EXPECT_EQ(weapon.counters.damageDealt, 30);
}

TEST(ResolveDamageTest, KillIsCountedOnce) {
    auto weapon = makeWeapon(20);
    auto enemy = makeTarget("enemy", 25);
    EffectContext ctx;
    ctx.targets = {&enemy};

    auto out = EffectResolver::ResolveDamage(damageEffect(10, 1.0), weapon, ctx);
    EXPECT_EQ(enemy.health, 0);
    EXPECT_EQ(out.kills, 1);
    EXPECT_TRUE(out.targetResults[0].killed);
    EXPECT_EQ(weapon.counters.kills, 1);

    auto again = EffectResolver::ResolveDamage(damageEffect(10, 1.0), weapon, ctx);
    EXPECT_EQ(again.kills, 0);
    EXPECT_EQ(weapon.counters.kills, 1);
}

TEST(ResolveDamageTest, UsesWeaponDamageTypeWhenUnset) {
    auto weapon = makeWeapon(20);
    weapon.effective.stats.damageType = DamageType::Energy;
    auto enemy = makeTarget("enemy", 100);
    enemy.resistances[DamageType::Energy] = 0.5;
    EffectContext ctx;
    ctx.targets = {&enemy};

    auto out = EffectResolver::ResolveDamage(damageEffect(10, 1.0), weapon, ctx);
    EXPECT_EQ(out.totalDamage, 15);
}

TEST(ResolveDamageTest, ShieldAbsorbsBeforeHealth) {
    auto weapon = makeWeapon(20);
    auto enemy = makeTarget("enemy", 50);
    enemy.modifiers.push_back(TimedModifier{"s", ModifierKind::Shield, 12.0, 0, 3});
    EffectContext ctx;
    ctx.targets = {&enemy};

    auto out = EffectResolver::ResolveDamage(damageEffect(10, 1.0), weapon, ctx);
    EXPECT_EQ(out.totalDamage, 30);
    EXPECT_EQ(enemy.health, 32);
    EXPECT_FALSE(enemy.HasModifier(ModifierKind::Shield));
}

TEST(ResolveDamageTest, NoTargetsFailsWithoutSideEffects) {
    auto weapon = makeWeapon(20);
    EffectContext ctx;

    auto out = EffectResolver::ResolveDamage(damageEffect(10, 1.0), weapon, ctx);
    EXPECT_FALSE(out.success);
    EXPECT_FALSE(out.message.empty());
    EXPECT_EQ(weapon.counters.damageDealt, 0);
}

TEST(ResolveDamageTest, ZeroMaxTargetsIsRejected) {
    auto weapon = makeWeapon(20);
    auto enemy = makeTarget("enemy", 50);
    auto effect = damageEffect(10, 1.0);
    effect.AsDamage()->maxTargets = 0;
    EffectContext ctx;
    ctx.targets = {&enemy};

    auto out = EffectResolver::ResolveDamage(effect, weapon, ctx);
    EXPECT_FALSE(out.success);
    EXPECT_EQ(enemy.health, 50);
}

// ═══════════════════════════════════════════════════════════════════════════
// Status resolution
// ═══════════════════════════════════════════════════════════════════════════

TEST(ResolveStatusTest, AppliesWhenDrawBelowChance) {
    auto weapon = makeWeapon(20);
    auto enemy = makeTarget("enemy", 50);
    ScriptedRandom rng{0.5};
    EffectContext ctx;
    ctx.time = 4;
    ctx.targets = {&enemy};

    auto out = EffectResolver::ResolveStatus(statusEffect(StatusType::Burning, 0.8), weapon, ctx, rng);

    ASSERT_TRUE(out.success);
    EXPECT_EQ(out.targetsAffected, 1);
    ASSERT_EQ(enemy.statuses.count(StatusType::Burning), 1u);
    const auto& record = enemy.statuses.at(StatusType::Burning);
    EXPECT_EQ(record.strength, 2);
    EXPECT_EQ(record.startTime, 4);
    EXPECT_EQ(record.endTime, 7);
    EXPECT_EQ(record.sourceEffect, "ignite");
}

TEST(ResolveStatusTest, ResistanceLowersChanceToFloor) {
    auto weapon = makeWeapon(20);
    auto enemy = makeTarget("enemy", 50);
    enemy.statusResistances[StatusType::Burning] = 0.9;
    ScriptedRandom rng{0.06};
    EffectContext ctx;
    ctx.targets = {&enemy};

    auto out = EffectResolver::ResolveStatus(statusEffect(StatusType::Burning, 0.5), weapon, ctx, rng);

    ASSERT_EQ(out.targetResults.size(), 1u);
    EXPECT_DOUBLE_EQ(out.targetResults[0].applicationChance, 0.05);
    EXPECT_FALSE(out.targetResults[0].applied);
    EXPECT_TRUE(enemy.statuses.empty());
}

TEST(ResolveStatusTest, SameTypeReplacesExisting) {
    auto weapon = makeWeapon(20);
    auto enemy = makeTarget("enemy", 50);
    ScriptedRandom rng{0.0, 0.0};
    EffectContext ctx;
    ctx.targets = {&enemy};

    auto effect = statusEffect(StatusType::Poisoned, 1.0);
    (void)EffectResolver::ResolveStatus(effect, weapon, ctx, rng);
    effect.AsStatus()->strength = 5;
    ctx.time = 2;
    (void)EffectResolver::ResolveStatus(effect, weapon, ctx, rng);

    ASSERT_EQ(enemy.statuses.size(), 1u);
    EXPECT_EQ(enemy.statuses.at(StatusType::Poisoned).strength, 5);
    EXPECT_EQ(enemy.statuses.at(StatusType::Poisoned).startTime, 2);
}

TEST(ResolveStatusTest, ImmuneTargetIsSkipped) {
    auto weapon = makeWeapon(20);
    auto enemy = makeTarget("enemy", 50);
    enemy.canReceiveStatus = false;
    ScriptedRandom rng;
    EffectContext ctx;
    ctx.targets = {&enemy};

    auto out = EffectResolver::ResolveStatus(statusEffect(StatusType::Stunned, 1.0), weapon, ctx, rng);
    EXPECT_TRUE(out.success);
    EXPECT_TRUE(out.targetResults.empty());
    EXPECT_EQ(rng.unitDraws, 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// Utility resolution
// ═══════════════════════════════════════════════════════════════════════════

TEST(ResolveUtilityTest, ShieldUsesDefaultAmount) {
    auto weapon = makeWeapon(20);
    auto actor = makeTarget("player", 100);
    EffectContext ctx;
    ctx.time = 1;
    ctx.actor = &actor;

    auto out = EffectResolver::ResolveUtility(utilityEffect(UtilityType::Shield), weapon, ctx);
    ASSERT_TRUE(out.success);
    EXPECT_DOUBLE_EQ(actor.ModifierTotal(ModifierKind::Shield), 50.0);
    ASSERT_EQ(actor.modifiers.size(), 1u);
    EXPECT_EQ(actor.modifiers[0].endTime, 4);
}

TEST(ResolveUtilityTest, HealAddsPercentageAndClamps) {
    auto weapon = makeWeapon(20);
    auto actor = makeTarget("player", 100);
    actor.health = 50;
    auto effect = utilityEffect(UtilityType::Heal);
    effect.AsUtility()->percentage = 0.1;
    EffectContext ctx;
    ctx.actor = &actor;

    auto out = EffectResolver::ResolveUtility(effect, weapon, ctx);
    EXPECT_EQ(out.healed, 30);
    EXPECT_EQ(actor.health, 80);

    auto capped = EffectResolver::ResolveUtility(effect, weapon, ctx);
    EXPECT_EQ(capped.healed, 20);
    EXPECT_EQ(actor.health, 100);
}

TEST(ResolveUtilityTest, ChargeRefundClampsToMax) {
    auto weapon = makeWeapon(20);
    weapon.currentCharge = 95;
    EffectContext ctx;

    auto out = EffectResolver::ResolveUtility(utilityEffect(UtilityType::ChargeRefund), weapon, ctx);
    EXPECT_EQ(out.chargeRestored, 5);
    EXPECT_EQ(weapon.currentCharge, 100);
}

TEST(ResolveUtilityTest, ScanRevealsWeakness) {
    auto weapon = makeWeapon(20);
    auto a = makeTarget("a", 10);
    a.resistances = {{DamageType::Physical, 0.3}, {DamageType::Energy, 0.3},
                     {DamageType::Thermal, 0.3}, {DamageType::Chemical, 0.1},
                     {DamageType::Emp, 0.3}};
    auto effect = utilityEffect(UtilityType::Scan);
    effect.AsUtility()->revealWeakness = true;
    EffectContext ctx;
    ctx.targets = {&a};

    auto out = EffectResolver::ResolveUtility(effect, weapon, ctx);
    ASSERT_EQ(out.targetResults.size(), 1u);
    ASSERT_TRUE(out.targetResults[0].weakness.has_value());
    EXPECT_EQ(*out.targetResults[0].weakness, DamageType::Chemical);
    EXPECT_DOUBLE_EQ(out.targetResults[0].weaknessValue, 0.1);
}

TEST(ResolveUtilityTest, ActorlessModifierFails) {
    auto weapon = makeWeapon(20);
    EffectContext ctx;
    auto out = EffectResolver::ResolveUtility(utilityEffect(UtilityType::Stealth), weapon, ctx);
    EXPECT_FALSE(out.success);
}

TEST(ResolveUtilityTest, TeleportNeedsNoTargets) {
    auto weapon = makeWeapon(20);
    EffectContext ctx;
    auto out = EffectResolver::ResolveUtility(utilityEffect(UtilityType::Teleport), weapon, ctx);
    EXPECT_TRUE(out.success);
    EXPECT_NE(out.message.find("5"), std::string::npos);
}

TEST(FindWeaknessTest, UnresistedTargetReportsPhysicalZero) {
    auto target = makeTarget("t", 10);
    auto [type, value] = EffectResolver::FindWeakness(target);
    EXPECT_EQ(type, DamageType::Physical);
    EXPECT_DOUBLE_EQ(value, 0.0);
}

TEST(FindWeaknessTest, FullyResistedTargetKeepsDefault) {
    auto target = makeTarget("t", 10);
    for (auto type : kScannableDamageTypes) {
        target.resistances[type] = 1.0;
    }
    auto [type, value] = EffectResolver::FindWeakness(target);
    EXPECT_EQ(type, DamageType::Physical);
    EXPECT_DOUBLE_EQ(value, 1.0);
}

// ═══════════════════════════════════════════════════════════════════════════
// Combatant bookkeeping
// ═══════════════════════════════════════════════════════════════════════════

TEST(CombatantTest, InitiativeBaseFromAttributes) {
    Combatant c;
    c.initiative = 4;
    EXPECT_EQ(c.InitiativeBase(), 4);
    c.attributes = CombatAttributes{7, 6};
    EXPECT_EQ(c.InitiativeBase(), 13);
}

TEST(CombatantTest, ExpireTimedRemovesReachedEntries) {
    Combatant c;
    c.statuses[StatusType::Burning] = StatusRecord{StatusType::Burning, 1, 0, 3};
    c.statuses[StatusType::Slowed] = StatusRecord{StatusType::Slowed, 1, 0, 5};
    c.modifiers.push_back(TimedModifier{"m", ModifierKind::Stance, 0.1, 0, 3});

    EXPECT_EQ(c.ExpireTimed(3), 2u);
    EXPECT_EQ(c.statuses.count(StatusType::Slowed), 1u);
    EXPECT_TRUE(c.modifiers.empty());
}
