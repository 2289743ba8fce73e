#pragma once

/// @file combat_result.hpp
/// @brief CombatResult<T> alias for engine error handling.

#include "cre/core/result.hpp"
#include "cre/foundation/combat_error.hpp"

namespace cre::foundation {

/// Result type specialized with CombatError.
///
/// Example:
/// @code
///   CombatResult<int> scaleDamage(int base) {
///       if (base < 0) {
///           return CombatResult<int>::err(
///               CombatError(ErrorCode::InvalidArgument, "negative base damage"));
///       }
///       return CombatResult<int>::ok(base * 2);
///   }
/// @endcode
template <typename T>
using CombatResult = cre::Result<T, CombatError>;

/// Shorthand for building an error result.
template <typename T>
CombatResult<T> makeError(ErrorCode code, std::string message) {
    return CombatResult<T>::err(CombatError(code, std::move(message)));
}

}  // namespace cre::foundation
