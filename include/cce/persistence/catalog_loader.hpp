#pragma once

/// @file catalog_loader.hpp
/// @brief Loads weapon and component catalogs from YAML into the engines.

#include <cstddef>
#include <filesystem>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "cce/combat/component.hpp"
#include "cce/combat/crafting_engine.hpp"
#include "cce/combat/weapon_registry.hpp"
#include "cce/combat/weapon_template.hpp"
#include "cce/foundation/game_result.hpp"

namespace cce::persistence {

/// Static catalog files:
///
/// @code
///   weapons:                      components:
///     - id: nova_blaster            - id: lightweight_frame
///       category: energy              category: frame
///       stats: {...}                  compatibility: [energy, projectile]
///       effects: [...]                modifiers: {weight: -2}
/// @endcode
///
/// Parse failures are reported as CatalogLoadFailed. Registration stops at
/// the first rejected entry and returns the registry's error; entries
/// registered before it stay registered.
class CatalogLoader {
public:
    static foundation::GameResult<std::vector<combat::WeaponTemplate>> parseWeapons(
        const YAML::Node& root);

    static foundation::GameResult<std::vector<combat::Component>> parseComponents(
        const YAML::Node& root);

    /// @return Number of templates registered.
    static foundation::GameResult<std::size_t> loadWeapons(const std::filesystem::path& path,
                                                           combat::WeaponRegistry& registry);

    static foundation::GameResult<std::size_t> loadWeaponsFromString(std::string_view yaml,
                                                                     combat::WeaponRegistry& registry);

    /// @return Number of components registered.
    static foundation::GameResult<std::size_t> loadComponents(const std::filesystem::path& path,
                                                              combat::CraftingEngine& crafting);

    static foundation::GameResult<std::size_t> loadComponentsFromString(
        std::string_view yaml, combat::CraftingEngine& crafting);
};

}  // namespace cce::persistence
