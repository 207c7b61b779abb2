/// @file main.cpp
/// @brief Combat simulator entry point.
///
/// Loads the balance config and the weapon and component catalogs, crafts a
/// weapon for the player, fights a scripted battle against two raiders and
/// writes the resulting engine state to a snapshot file.

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cce/cce.hpp"

namespace {

using cce::combat::BalanceConfig;
using cce::combat::CombatAction;
using cce::combat::CombatLog;
using cce::combat::CombatSession;
using cce::combat::Combatant;
using cce::combat::ComponentCategory;
using cce::combat::CraftingEngine;
using cce::combat::DamageType;
using cce::combat::ProgressionEngine;
using cce::combat::WeaponKey;
using cce::combat::WeaponRegistry;
using cce::foundation::ConfigManager;
using cce::foundation::GameLogger;
using cce::foundation::LogCategory;
using cce::foundation::PlayerId;
using cce::foundation::RandomSource;

constexpr int kMaxActions = 200;

struct SimOptions {
    std::filesystem::path weaponsPath = "data/weapons.yaml";
    std::filesystem::path componentsPath = "data/components.yaml";
    std::filesystem::path snapshotPath = "combat_sim_snapshot.yaml";
    uint64_t seed = RandomSource::kDefaultSeed;
};

/// Value of `--<name> <value>`, or empty when absent.
std::string parseArg(int argc, char* argv[], std::string_view name) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == name) {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

std::string lowered(std::string_view text) {
    std::string out(text);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

/// logging.levels.<category> overrides the default per-category levels.
void applyLogLevels(const ConfigManager& config) {
    auto& logger = GameLogger::instance();
    for (std::size_t i = 0; i < cce::foundation::kLogCategoryCount; ++i) {
        auto category = static_cast<LogCategory>(i);
        auto key = "logging.levels." + lowered(cce::foundation::logCategoryName(category));
        auto name = config.get<std::string>(key);
        if (!name) {
            continue;
        }
        if (auto level = cce::foundation::parseLogLevel(name.value())) {
            logger.setCategoryLevel(category, *level);
        } else {
            std::cerr << "Ignoring unknown log level '" << name.value() << "' for " << key << "\n";
        }
    }
}

SimOptions buildOptions(const ConfigManager& config, int argc, char* argv[]) {
    SimOptions opts;
    opts.weaponsPath = config.getOr<std::string>("sim.weapons", opts.weaponsPath.string());
    opts.componentsPath = config.getOr<std::string>("sim.components", opts.componentsPath.string());
    opts.snapshotPath = config.getOr<std::string>("sim.snapshot", opts.snapshotPath.string());
    opts.seed = config.getOr<uint64_t>("sim.seed", opts.seed);

    if (auto arg = parseArg(argc, argv, "--snapshot"); !arg.empty()) {
        opts.snapshotPath = arg;
    }
    if (auto arg = parseArg(argc, argv, "--seed"); !arg.empty()) {
        opts.seed = std::strtoull(arg.c_str(), nullptr, 10);
    }
    return opts;
}

Combatant makeRaider(const std::string& id, const std::string& name) {
    Combatant raider;
    raider.id = id;
    raider.name = name;
    raider.health = 60;
    raider.maxHealth = 60;
    raider.baseDamage = 8;
    raider.damageType = DamageType::Physical;
    raider.resistances[DamageType::Energy] = 0.1;
    raider.attributes = cce::combat::CombatAttributes{4, 3};
    return raider;
}

void printStatus(const cce::combat::SessionStatus& status) {
    std::cout << "Phase: " << cce::combat::toString(status.phase)
              << ", turn " << status.turn << "\n";
    for (const auto& p : status.participants) {
        std::cout << "  " << p.name << " (" << p.id << "): "
                  << p.health << "/" << p.maxHealth;
        for (auto s : p.statuses) {
            std::cout << " [" << cce::combat::toString(s) << "]";
        }
        std::cout << "\n";
    }
}

/// Player attacks the first living raider; raiders attack the player.
void runBattle(CombatSession& session) {
    for (int step = 0; step < kMaxActions && session.Phase() == cce::combat::CombatPhase::InProgress;
         ++step) {
        const auto* actor = session.CurrentActor();
        if (actor == nullptr) {
            break;
        }

        std::optional<std::string> target;
        if (actor->isPlayer) {
            for (const auto& id : session.InitiativeOrder()) {
                const auto* candidate = session.FindParticipant(id);
                if (candidate != nullptr && !candidate->isPlayer && candidate->IsAlive()) {
                    target = id;
                    break;
                }
            }
        } else {
            target = session.Player().id;
        }

        auto outcome = session.PerformAction(actor->id, CombatAction::Attack, target);
        if (!outcome) {
            std::cerr << "Action failed: " << outcome.error().message() << "\n";
            if (auto passed = session.NextTurn(); !passed) {
                std::cerr << "Cannot pass turn: " << passed.error().message() << "\n";
                break;
            }
            continue;
        }
        std::cout << outcome.value().message << "\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    std::filesystem::path configPath = parseArg(argc, argv, "--config");
    if (configPath.empty()) {
        configPath = "config/combat.yaml";
    }
    if (const char* envPath = std::getenv("CCE_CONFIG_PATH"); envPath != nullptr) {
        configPath = envPath;
    }

    ConfigManager config;
    auto loadResult = config.load(configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }
    applyLogLevels(config);

    auto opts = buildOptions(config, argc, argv);
    auto balance = BalanceConfig::fromConfig(config);

    RandomSource rng(opts.seed);
    CombatLog log;
    WeaponRegistry registry(rng, log, balance);
    ProgressionEngine progression(registry, log);
    CraftingEngine crafting(registry, rng, log);

    auto weapons = cce::persistence::CatalogLoader::loadWeapons(opts.weaponsPath, registry);
    if (!weapons) {
        std::cerr << "Failed to load weapons: " << weapons.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto components = cce::persistence::CatalogLoader::loadComponents(opts.componentsPath, crafting);
    if (!components) {
        std::cerr << "Failed to load components: " << components.error().message() << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "Loaded " << weapons.value() << " weapons and " << components.value()
              << " components (seed " << opts.seed << ")\n";

    const PlayerId playerId(1);
    cce::combat::SlotAssignment slots = {
        {ComponentCategory::Frame, "balanced_frame"},
        {ComponentCategory::Barrel, "precision_barrel"},
        {ComponentCategory::PowerSource, "standard_battery"},
        {ComponentCategory::Focusing, "standard_sights"},
        {ComponentCategory::Handle, "ergonomic_grip"},
    };
    auto crafted = crafting.Craft(playerId, slots, "Street Lance", "Hand-built energy rifle");
    if (!crafted) {
        std::cerr << "Crafting failed: " << crafted.error().message() << "\n";
        return EXIT_FAILURE;
    }
    const auto& weapon = crafted.value();
    std::cout << "Crafted " << weapon.name << " (" << weapon.id << ", "
              << cce::combat::toString(*weapon.rarity) << ", "
              << weapon.effects.size() << " effects)\n";

    // Start with enough charge for the signature effect.
    const WeaponKey key{playerId, weapon.id};
    if (auto charged = registry.AddCharge(key, weapon.stats.maxCharge); !charged) {
        std::cerr << "Cannot charge weapon: " << charged.error().message() << "\n";
        return EXIT_FAILURE;
    }

    Combatant player;
    player.id = "player";
    player.name = "Runner";
    player.isPlayer = true;
    player.playerId = playerId;
    player.health = 120;
    player.maxHealth = 120;
    player.baseDamage = 12;
    player.attributes = cce::combat::CombatAttributes{7, 6};
    player.equippedWeapon = weapon.id;

    CombatSession session(registry, progression, rng, log, player,
                          {makeRaider("raider_1", "Raider"), makeRaider("raider_2", "Raider Boss")});
    session.SetDistance("raider_1", "raider_2", 3.0);

    if (auto started = session.Start(); !started) {
        std::cerr << "Cannot start battle: " << started.error().message() << "\n";
        return EXIT_FAILURE;
    }
    runBattle(session);
    printStatus(session.GetStatus());

    auto evolution = progression.GetEvolutionStatus(key);
    if (evolution) {
        const auto& ev = evolution.value();
        std::cout << weapon.name << ": level " << ev.level << ", " << ev.experience << "/"
                  << ev.nextLevelThreshold << " xp, next evolution at level "
                  << ev.nextEvolutionLevel << "\n";
    }

    auto saved = cce::persistence::StateSerializer::saveToFile(opts.snapshotPath, registry, &crafting);
    if (!saved) {
        std::cerr << "Failed to write snapshot: " << saved.error().message() << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "Snapshot written to " << opts.snapshotPath.string() << "\n";

    if (auto flushed = GameLogger::instance().flush(); !flushed) {
        std::cerr << "Log flush failed: " << flushed.error().message() << "\n";
    }
    return EXIT_SUCCESS;
}
