#include <gtest/gtest.h>

#include <filesystem>
#include <set>
#include <string>

#include "cce/persistence/catalog_loader.hpp"
#include "cce/persistence/state_serializer.hpp"
#include "scripted_random.hpp"

using namespace cce::combat;
using namespace cce::persistence;
using cce::foundation::ErrorCode;
using cce::foundation::PlayerId;
using cce::testing::ScriptedRandom;

namespace {

Component meleePart(std::string id, ComponentCategory slot) {
    Component c;
    c.id = std::move(id);
    c.name = c.id;
    c.description = "melee part";
    c.category = slot;
    c.compatibility = {WeaponCategory::Melee};
    c.craftingDifficulty = 2;
    return c;
}

/// Registry plus crafting engine sharing one random source and log.
struct Engines {
    ScriptedRandom rng;
    CombatLog log;
    WeaponRegistry registry{rng, log};
    CraftingEngine crafting{registry, rng, log};

    Engines() {
        crafting.SetClock([] { return int64_t{1700000000}; });
    }
};

}  // namespace

class StateSerializerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(CatalogLoader::loadWeapons(
            std::filesystem::path(CCE_DATA_DIR) / "data" / "weapons.yaml", source.registry).hasValue());
        ASSERT_TRUE(source.crafting.RegisterComponent(
            meleePart("steel_frame", ComponentCategory::Frame)).hasValue());
        ASSERT_TRUE(source.crafting.RegisterComponent(
            meleePart("edge_barrel", ComponentCategory::Barrel)).hasValue());

        nova = source.registry.Assign(player, "nova_blaster").value();
        ASSERT_TRUE(source.registry.AddCharge(nova, 100).hasValue());

        enemy.id = "enemy";
        enemy.name = "Enemy";
        EffectContext ctx;
        ctx.time = 2;
        ctx.targets = {&enemy};
        ASSERT_TRUE(source.registry.Trigger(nova, "energy_burst", ctx).hasValue());

        auto crafted = source.crafting.Craft(player, slots(), "Cleaver", "Heavy blade");
        ASSERT_TRUE(crafted.hasValue()) << crafted.error().message();
        craftedId = crafted.value().id;
    }

    static SlotAssignment slots() {
        return {{ComponentCategory::Frame, "steel_frame"},
                {ComponentCategory::Barrel, "edge_barrel"}};
    }

    Engines source;
    Engines target;
    PlayerId player{1};
    WeaponKey nova;
    Combatant enemy;
    std::string craftedId;
};

// ═══════════════════════════════════════════════════════════════════════════
// Round trip
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(StateSerializerTest, RestoresInstancesEffectsAndRecords) {
    auto snapshot = StateSerializer::save(source.registry, &source.crafting);
    auto loaded = StateSerializer::load(snapshot, target.registry, &target.crafting);
    ASSERT_TRUE(loaded.hasValue()) << loaded.error().message();

    EXPECT_EQ(target.registry.Templates().size(), source.registry.Templates().size());
    EXPECT_EQ(target.registry.Instances().size(), 2u);

    const auto* restored = target.registry.FindInstance(nova);
    ASSERT_NE(restored, nullptr);
    EXPECT_EQ(restored->currentCharge, 50);
    EXPECT_EQ(restored->cooldowns.at("energy_burst"), 5);
    EXPECT_EQ(restored->counters.specialTriggers,
              source.registry.FindInstance(nova)->counters.specialTriggers);

    ASSERT_EQ(target.registry.ActiveEffects().size(), 1u);
    EXPECT_EQ(target.registry.ActiveEffects()[0].instanceId,
              source.registry.ActiveEffects()[0].instanceId);
    EXPECT_EQ(target.registry.ActiveSequence(), source.registry.ActiveSequence());

    WeaponKey craftedKey{player, craftedId};
    ASSERT_NE(target.registry.FindInstance(craftedKey), nullptr);
    const auto* record = target.crafting.FindRecord(craftedKey);
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->components.at(ComponentCategory::Frame), "steel_frame");
    EXPECT_EQ(record->craftedAt, 1700000000);
    EXPECT_EQ(target.crafting.CraftCounter(), source.crafting.CraftCounter());
}

TEST_F(StateSerializerTest, RestoredCounterKeepsCraftedIdsUnique) {
    ASSERT_TRUE(StateSerializer::load(StateSerializer::save(source.registry, &source.crafting),
                                      target.registry, &target.crafting).hasValue());

    auto second = target.crafting.Craft(PlayerId(2), slots(), "Cleaver", "Heavy blade");
    ASSERT_TRUE(second.hasValue());
    EXPECT_NE(second.value().id, craftedId);
}

TEST_F(StateSerializerTest, CatalogAlreadyLoadedIsKept) {
    ASSERT_TRUE(CatalogLoader::loadWeapons(
        std::filesystem::path(CCE_DATA_DIR) / "data" / "weapons.yaml", target.registry).hasValue());

    auto loaded = StateSerializer::load(StateSerializer::save(source.registry, &source.crafting),
                                        target.registry, &target.crafting);
    ASSERT_TRUE(loaded.hasValue()) << loaded.error().message();
    EXPECT_NE(target.registry.FindInstance(nova), nullptr);
}

// ═══════════════════════════════════════════════════════════════════════════
// Rejections
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(StateSerializerTest, RejectsUnknownVersion) {
    auto snapshot = StateSerializer::save(source.registry, &source.crafting);
    snapshot["version"] = StateSerializer::kFormatVersion + 1;

    auto loaded = StateSerializer::load(snapshot, target.registry, &target.crafting);
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::SnapshotInvalid);
    EXPECT_TRUE(target.registry.Templates().empty());
}

TEST_F(StateSerializerTest, RejectsNonMapRoot) {
    auto loaded = StateSerializer::load(YAML::Load("[1, 2, 3]"), target.registry);
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::SnapshotInvalid);
}

TEST_F(StateSerializerTest, RefusesToLoadOverExistingInstances) {
    auto snapshot = StateSerializer::save(source.registry, &source.crafting);
    auto loaded = StateSerializer::load(snapshot, source.registry, &source.crafting);
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(StateSerializerTest, CorruptInstanceIsRejected) {
    auto snapshot = StateSerializer::save(source.registry, &source.crafting);
    snapshot["instances"][0]["current_durability"] = -4;

    auto loaded = StateSerializer::load(snapshot, target.registry, &target.crafting);
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::SnapshotInvalid);
}

TEST_F(StateSerializerTest, DuplicateInstanceLeavesEnginesUntouched) {
    auto snapshot = StateSerializer::save(source.registry, &source.crafting);
    auto broken = YAML::Clone(snapshot);
    broken["instances"].push_back(YAML::Clone(broken["instances"][0]));

    auto failed = StateSerializer::load(broken, target.registry, &target.crafting);
    ASSERT_TRUE(failed.hasError());
    EXPECT_EQ(failed.error().code(), ErrorCode::SnapshotInvalid);
    EXPECT_TRUE(target.registry.Instances().empty());
    EXPECT_TRUE(target.registry.Templates().empty());
    EXPECT_TRUE(target.registry.ActiveEffects().empty());
    EXPECT_TRUE(target.crafting.Components().empty());
    EXPECT_TRUE(target.crafting.Records().empty());

    auto retried = StateSerializer::load(snapshot, target.registry, &target.crafting);
    ASSERT_TRUE(retried.hasValue()) << retried.error().message();
    EXPECT_EQ(target.registry.Instances().size(), 2u);
}

TEST_F(StateSerializerTest, UnknownTemplateOrOrphanRecordIsRejected) {
    auto snapshot = StateSerializer::save(source.registry, &source.crafting);

    auto unknown = YAML::Clone(snapshot);
    unknown["instances"][0]["template_id"] = "no_such_weapon";
    auto failed = StateSerializer::load(unknown, target.registry, &target.crafting);
    ASSERT_TRUE(failed.hasError());
    EXPECT_EQ(failed.error().code(), ErrorCode::SnapshotInvalid);
    EXPECT_TRUE(target.registry.Instances().empty());

    auto orphan = YAML::Clone(snapshot);
    orphan["crafted_records"][0]["weapon_id"] = "crafted_melee_99";
    failed = StateSerializer::load(orphan, target.registry, &target.crafting);
    ASSERT_TRUE(failed.hasError());
    EXPECT_EQ(failed.error().code(), ErrorCode::SnapshotInvalid);
    EXPECT_TRUE(target.registry.Instances().empty());
    EXPECT_TRUE(target.crafting.Records().empty());
}

TEST_F(StateSerializerTest, RestoreAppendsToCombatLog) {
    ASSERT_TRUE(StateSerializer::load(StateSerializer::save(source.registry, &source.crafting),
                                      target.registry, &target.crafting).hasValue());

    std::size_t restoredLines = 0;
    for (const auto& entry : target.log.entries()) {
        if (entry.message.rfind("Restored", 0) == 0) {
            ++restoredLines;
        }
    }
    // Two instances, one active effect, one crafting record.
    EXPECT_EQ(restoredLines, 4u);
}

// ═══════════════════════════════════════════════════════════════════════════
// Files
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(StateSerializerTest, FileRoundTrip) {
    auto path = std::filesystem::temp_directory_path() / "cce_state_serializer_test.yaml";
    ASSERT_TRUE(StateSerializer::saveToFile(path, source.registry, &source.crafting).hasValue());

    auto loaded = StateSerializer::loadFromFile(path, target.registry, &target.crafting);
    std::filesystem::remove(path);

    ASSERT_TRUE(loaded.hasValue()) << loaded.error().message();
    EXPECT_EQ(target.registry.Instances().size(), 2u);
}

TEST_F(StateSerializerTest, MissingFile) {
    auto loaded = StateSerializer::loadFromFile(
        std::filesystem::temp_directory_path() / "cce_no_such_snapshot.yaml", target.registry);
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::SnapshotInvalid);
}
