#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> alias used by every engine component.

#include "cce/core/result.hpp"
#include "cce/foundation/game_error.hpp"

namespace cce::foundation {

/// Result type specialized with GameError.
///
/// Example:
/// @code
///   GameResult<int32_t> spendCharge(WeaponInstance& w, int32_t cost) {
///       if (w.currentCharge < cost) {
///           return GameResult<int32_t>::err(
///               GameError(ErrorCode::InsufficientCharge, "not enough charge"));
///       }
///       w.currentCharge -= cost;
///       return GameResult<int32_t>::ok(w.currentCharge);
///   }
/// @endcode
template <typename T>
using GameResult = cce::Result<T, GameError>;

}  // namespace cce::foundation
