#pragma once

/// @file yaml_codec.hpp
/// @brief YAML encoding and decoding of catalog entries and runtime state.
///
/// Keys are lower snake case and enum values use their canonical names
/// ("energy", "power_source"). Decoders never throw: yaml-cpp conversion
/// errors and unknown names are reported as ErrorCode::SnapshotInvalid.
/// Required-field checks beyond structure (name, category, rarity, ...)
/// are left to the registering component.

#include <yaml-cpp/yaml.h>

#include "cce/combat/component.hpp"
#include "cce/combat/effect_descriptor.hpp"
#include "cce/combat/weapon_instance.hpp"
#include "cce/combat/weapon_template.hpp"
#include "cce/foundation/game_result.hpp"

namespace cce::persistence {

YAML::Node encodeEffect(const combat::EffectDescriptor& effect);
foundation::GameResult<combat::EffectDescriptor> decodeEffect(const YAML::Node& node);

YAML::Node encodeStats(const combat::WeaponStats& stats);
foundation::GameResult<combat::WeaponStats> decodeStats(const YAML::Node& node);

YAML::Node encodeEvolution(const combat::EvolutionPath& path);
foundation::GameResult<combat::EvolutionPath> decodeEvolution(const YAML::Node& node);

YAML::Node encodeTemplate(const combat::WeaponTemplate& tmpl);
foundation::GameResult<combat::WeaponTemplate> decodeTemplate(const YAML::Node& node);

YAML::Node encodeComponent(const combat::Component& component);
foundation::GameResult<combat::Component> decodeComponent(const YAML::Node& node);

/// Instance with its effective template, cooldowns, counters and progress.
YAML::Node encodeInstance(const combat::WeaponInstance& instance);
foundation::GameResult<combat::WeaponInstance> decodeInstance(const YAML::Node& node);

YAML::Node encodeActiveEffect(const combat::ActiveEffect& effect);
foundation::GameResult<combat::ActiveEffect> decodeActiveEffect(const YAML::Node& node);

YAML::Node encodeRecord(const combat::CraftedWeaponRecord& record);
foundation::GameResult<combat::CraftedWeaponRecord> decodeRecord(const YAML::Node& node);

}  // namespace cce::persistence
