#pragma once

/// @file state_serializer.hpp
/// @brief Full engine state snapshot to and from YAML.

#include <filesystem>

#include <yaml-cpp/yaml.h>

#include "cce/combat/crafting_engine.hpp"
#include "cce/combat/weapon_registry.hpp"
#include "cce/foundation/game_result.hpp"

namespace cce::persistence {

/// Snapshot of the catalog, instances with their progress, active effects
/// and crafted-weapon records.
///
/// Loading expects engines without instances. Templates and components
/// already registered under the same id (a static catalog loaded first)
/// are kept as they are. A rejected snapshot leaves both engines unchanged.
class StateSerializer {
public:
    static constexpr int kFormatVersion = 1;

    /// @param crafting Optional; components and records are skipped when null.
    static YAML::Node save(const combat::WeaponRegistry& registry,
                           const combat::CraftingEngine* crafting = nullptr);

    static foundation::GameResult<void> load(const YAML::Node& snapshot,
                                             combat::WeaponRegistry& registry,
                                             combat::CraftingEngine* crafting = nullptr);

    static foundation::GameResult<void> saveToFile(const std::filesystem::path& path,
                                                   const combat::WeaponRegistry& registry,
                                                   const combat::CraftingEngine* crafting = nullptr);

    static foundation::GameResult<void> loadFromFile(const std::filesystem::path& path,
                                                     combat::WeaponRegistry& registry,
                                                     combat::CraftingEngine* crafting = nullptr);
};

}  // namespace cce::persistence
