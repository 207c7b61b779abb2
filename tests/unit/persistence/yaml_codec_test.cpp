#include <gtest/gtest.h>

#include <string>

#include <yaml-cpp/yaml.h>

#include "cce/persistence/yaml_codec.hpp"

using namespace cce::combat;
using namespace cce::persistence;
using cce::foundation::ErrorCode;
using cce::foundation::PlayerId;

// ═══════════════════════════════════════════════════════════════════════════
// Effects
// ═══════════════════════════════════════════════════════════════════════════

TEST(YamlCodecTest, DecodeDamageEffectWithDefaults) {
    auto node = YAML::Load(R"(
id: energy_burst
name: Energy Burst
damage: 50
conditions:
  min_charge: 50
cost:
  charge: 50
cooldown: 3
)");
    auto effect = decodeEffect(node);

    ASSERT_TRUE(effect.hasValue()) << effect.error().message();
    const auto& e = effect.value();
    EXPECT_EQ(e.Category(), EffectCategory::Damage);
    ASSERT_NE(e.AsDamage(), nullptr);
    EXPECT_EQ(e.AsDamage()->damage, 50);
    EXPECT_DOUBLE_EQ(e.AsDamage()->multiplier, 1.0);
    EXPECT_FALSE(e.AsDamage()->damageType.has_value());
    EXPECT_EQ(e.AsDamage()->maxTargets, 1);
    EXPECT_EQ(e.conditions.minCharge, 50);
    EXPECT_FALSE(e.conditions.triggerChance.has_value());
    EXPECT_EQ(e.cost.charge, 50);
    EXPECT_EQ(e.cost.durability, 0);
    EXPECT_EQ(e.cooldown, 3);
    EXPECT_EQ(e.duration, 1);
    EXPECT_EQ(e.rarity, 1);
}

TEST(YamlCodecTest, CategoryInferredFromPayloadKeys) {
    auto status = decodeEffect(YAML::Load("{id: s, status_type: elemental_burn, strength: 3}"));
    ASSERT_TRUE(status.hasValue());
    ASSERT_NE(status.value().AsStatus(), nullptr);
    EXPECT_EQ(status.value().AsStatus()->statusType, StatusType::ElementalBurn);
    EXPECT_EQ(status.value().AsStatus()->strength, 3);

    auto utility = decodeEffect(YAML::Load("{id: u, utility_type: shield}"));
    ASSERT_TRUE(utility.hasValue());
    ASSERT_NE(utility.value().AsUtility(), nullptr);
    EXPECT_EQ(utility.value().AsUtility()->utilityType, UtilityType::Shield);
    EXPECT_FALSE(utility.value().AsUtility()->amount.has_value());
    EXPECT_EQ(utility.value().AsUtility()->AmountOrDefault(), 50);
}

TEST(YamlCodecTest, UnknownNamesAreRejected) {
    auto badStatus = decodeEffect(YAML::Load("{id: s, category: status, status_type: frozen}"));
    ASSERT_TRUE(badStatus.hasError());
    EXPECT_EQ(badStatus.error().code(), ErrorCode::SnapshotInvalid);
    EXPECT_NE(badStatus.error().message().find("frozen"), std::string_view::npos);

    auto badCategory = decodeEffect(YAML::Load("{id: s, category: healing}"));
    EXPECT_EQ(badCategory.error().code(), ErrorCode::SnapshotInvalid);
}

TEST(YamlCodecTest, MissingIdIsRejected) {
    auto effect = decodeEffect(YAML::Load("{name: Nameless, damage: 5}"));
    ASSERT_TRUE(effect.hasError());
    EXPECT_EQ(effect.error().code(), ErrorCode::SnapshotInvalid);
}

TEST(YamlCodecTest, WrongScalarTypeIsRejected) {
    auto effect = decodeEffect(YAML::Load("{id: e, damage: lots}"));
    ASSERT_TRUE(effect.hasError());
    EXPECT_EQ(effect.error().code(), ErrorCode::SnapshotInvalid);
}

// ═══════════════════════════════════════════════════════════════════════════
// Stats, templates and components
// ═══════════════════════════════════════════════════════════════════════════

TEST(YamlCodecTest, StatsRejectUnknownField) {
    auto stats = decodeStats(YAML::Load("{base_damage: 10, mana: 5}"));
    ASSERT_TRUE(stats.hasError());
    EXPECT_NE(stats.error().message().find("mana"), std::string_view::npos);
}

TEST(YamlCodecTest, TemplateWithEvolution) {
    auto node = YAML::Load(R"(
id: quantum_blade
name: Quantum Blade
description: Blade
category: melee
rarity: epic
stats: {base_damage: 35, damage_type: physical, max_charge: 0}
effects:
  - {id: phase_strike, damage: 45, armor_penetration: 0.7}
evolutions:
  - id: superposition_edge
    level_requirement: 4
    prerequisites: [sharpened]
    stats: {base_damage: 45}
    effect_modifications:
      phase_strike: {trigger_chance: 0.4, armor_penetration: 0.8}
)");
    auto tmpl = decodeTemplate(node);

    ASSERT_TRUE(tmpl.hasValue()) << tmpl.error().message();
    const auto& t = tmpl.value();
    EXPECT_EQ(t.category, WeaponCategory::Melee);
    EXPECT_EQ(t.rarity, Rarity::Epic);
    EXPECT_EQ(t.stats.baseDamage, 35);
    EXPECT_EQ(t.stats.maxCharge, 0);
    EXPECT_DOUBLE_EQ(t.stats.accuracy, 0.8);
    ASSERT_EQ(t.evolutions.size(), 1u);
    const auto& path = t.evolutions[0];
    EXPECT_EQ(path.levelRequirement, 4);
    ASSERT_EQ(path.prerequisites.size(), 1u);
    EXPECT_DOUBLE_EQ(path.delta.statOverwrites.at(StatField::BaseDamage), 45.0);
    const auto& mod = path.delta.effectModifications.at("phase_strike");
    EXPECT_EQ(mod.triggerChance, 0.4);
    EXPECT_EQ(mod.armorPenetration, 0.8);
    EXPECT_FALSE(mod.damage.has_value());
}

TEST(YamlCodecTest, TemplateWithoutCategoryDecodesForLaterValidation) {
    auto tmpl = decodeTemplate(YAML::Load("{id: bare, stats: {base_damage: 3}}"));
    ASSERT_TRUE(tmpl.hasValue());
    EXPECT_FALSE(tmpl.value().category.has_value());
    EXPECT_FALSE(tmpl.value().rarity.has_value());
}

TEST(YamlCodecTest, ComponentModifiers) {
    auto node = YAML::Load(R"(
id: elemental_converter
name: Elemental Converter
category: modifier
rarity: rare
compatibility: [energy, tech]
difficulty: 6
modifiers:
  base_damage: 3
  damage_type: elemental
  new_effect: {id: elemental_damage, status_type: elemental_burn}
)");
    auto component = decodeComponent(node);

    ASSERT_TRUE(component.hasValue()) << component.error().message();
    const auto& c = component.value();
    EXPECT_EQ(c.category, ComponentCategory::Modifier);
    EXPECT_EQ(c.rarity, Rarity::Rare);
    EXPECT_EQ(c.craftingDifficulty, 6);
    EXPECT_EQ(c.compatibility.size(), 2u);
    EXPECT_TRUE(c.IsCompatibleWith(WeaponCategory::Tech));
    EXPECT_FALSE(c.IsCompatibleWith(WeaponCategory::Melee));
    EXPECT_DOUBLE_EQ(c.modifiers.deltas.at(StatField::BaseDamage), 3.0);
    EXPECT_EQ(c.modifiers.damageType, DamageType::Elemental);
    ASSERT_TRUE(c.modifiers.newEffect.has_value());
    EXPECT_EQ(c.modifiers.newEffect->Category(), EffectCategory::Status);
}

TEST(YamlCodecTest, ComponentUnknownCompatibility) {
    auto component = decodeComponent(YAML::Load("{id: c, category: frame, compatibility: [laser]}"));
    ASSERT_TRUE(component.hasError());
    EXPECT_EQ(component.error().code(), ErrorCode::SnapshotInvalid);
}

// ═══════════════════════════════════════════════════════════════════════════
// Runtime state
// ═══════════════════════════════════════════════════════════════════════════

TEST(YamlCodecTest, InstanceKeepsProgressAndCooldowns) {
    WeaponInstance instance;
    instance.owner = PlayerId(42);
    instance.templateId = "nova_blaster";
    instance.effective.id = "nova_blaster";
    instance.effective.name = "Nova Blaster";
    instance.effective.stats.baseDamage = 25;
    instance.effective.stats.maxCharge = 150;
    instance.currentCharge = 120;
    instance.currentDurability = 80;
    instance.cooldowns["energy_burst"] = 7;
    instance.counters.kills = 3;
    instance.progress.level = 3;
    instance.progress.experience = 400;
    instance.progress.nextLevelThreshold = 2250;
    instance.progress.appliedEvolutions = {"improved_capacitors"};

    auto decoded = decodeInstance(encodeInstance(instance));

    ASSERT_TRUE(decoded.hasValue()) << decoded.error().message();
    const auto& d = decoded.value();
    EXPECT_EQ(d.owner, PlayerId(42));
    EXPECT_EQ(d.currentCharge, 120);
    EXPECT_EQ(d.MaxCharge(), 150);
    EXPECT_EQ(d.cooldowns.at("energy_burst"), 7);
    EXPECT_EQ(d.counters.kills, 3);
    EXPECT_EQ(d.progress.level, 3);
    EXPECT_EQ(d.progress.experience, 400);
    ASSERT_EQ(d.progress.appliedEvolutions.size(), 1u);
}

TEST(YamlCodecTest, InstanceWithChargeAboveMaxIsRejected) {
    WeaponInstance instance;
    instance.owner = PlayerId(1);
    instance.templateId = "w";
    instance.effective.id = "w";
    instance.effective.stats.maxCharge = 100;
    instance.currentDurability = 100;

    auto node = encodeInstance(instance);
    node["current_charge"] = 140;
    auto decoded = decodeInstance(node);
    ASSERT_TRUE(decoded.hasError());
    EXPECT_EQ(decoded.error().code(), ErrorCode::SnapshotInvalid);
}

TEST(YamlCodecTest, InstanceWithExperiencePastThresholdIsRejected) {
    WeaponInstance instance;
    instance.owner = PlayerId(1);
    instance.templateId = "w";
    instance.effective.id = "w";
    instance.currentDurability = 100;

    auto node = encodeInstance(instance);
    node["progress"]["experience"] = 1000;
    EXPECT_TRUE(decodeInstance(node).hasError());
}

TEST(YamlCodecTest, CraftedRecordSlots) {
    auto record = decodeRecord(YAML::Load(R"(
player: 5
weapon_id: crafted_energy_1
components: {frame: balanced_frame, power_source: standard_battery}
crafted_at: 1700000000
)"));
    ASSERT_TRUE(record.hasValue()) << record.error().message();
    EXPECT_EQ(record.value().components.at(ComponentCategory::PowerSource), "standard_battery");
    EXPECT_EQ(record.value().craftedAt, 1700000000);

    auto noSlots = decodeRecord(YAML::Load("{player: 5, weapon_id: w}"));
    EXPECT_TRUE(noSlots.hasError());
}
