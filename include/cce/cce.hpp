#pragma once

/// @file cce.hpp
/// @brief Umbrella header for the combat engine libraries.

#include "cce/version.hpp"

#include "cce/foundation/config_manager.hpp"
#include "cce/foundation/game_logger.hpp"
#include "cce/foundation/game_result.hpp"
#include "cce/foundation/random_source.hpp"
#include "cce/foundation/signal.hpp"
#include "cce/foundation/types.hpp"

#include "cce/combat/balance_config.hpp"
#include "cce/combat/combat_log.hpp"
#include "cce/combat/combat_session.hpp"
#include "cce/combat/combatant.hpp"
#include "cce/combat/crafting_engine.hpp"
#include "cce/combat/effect_resolver.hpp"
#include "cce/combat/progression_engine.hpp"
#include "cce/combat/weapon_registry.hpp"

#include "cce/persistence/catalog_loader.hpp"
#include "cce/persistence/state_serializer.hpp"
