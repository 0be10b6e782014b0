#pragma once

/// @file game_result.hpp
/// @brief GameResult<T> type alias for game-specific error handling.

#include "lbx/core/result.hpp"
#include "lbx/foundation/game_error.hpp"

namespace lbx::foundation {

/// Result type specialized with GameError.
///
/// Every game operation and adapter method that can fail returns
/// GameResult<T> instead of throwing.
///
/// Example:
/// @code
///   GameResult<int64_t> sellPrice(const Item& item) {
///       if (item.baseValue < 0) {
///           return GameResult<int64_t>::err(
///               GameError(ErrorCode::InvalidArgument, "negative base value"));
///       }
///       return GameResult<int64_t>::ok(item.Value());
///   }
/// @endcode
template <typename T>
using GameResult = lbx::Result<T, GameError>;

}  // namespace lbx::foundation
