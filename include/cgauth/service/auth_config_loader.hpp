#pragma once

/// @file auth_config_loader.hpp
/// @brief Maps ConfigManager keys onto AuthConfig.
///
/// Recognized sections: auth, wallet, second_factor, session, breach_check,
/// password_reset and logging. Absent keys keep their defaults; a key of
/// the wrong type is an error.

#include "cgauth/foundation/auth_result.hpp"
#include "cgauth/foundation/config_manager.hpp"
#include "cgauth/service/auth_types.hpp"

namespace cgauth::service {

[[nodiscard]] foundation::AuthResult<AuthConfig> loadAuthConfig(
    const foundation::ConfigManager& config);

/// Apply `logging.default_level` and `logging.levels.<Category>` to the
/// AuthLogger singleton.
[[nodiscard]] foundation::AuthResult<void> applyLogLevels(
    const foundation::ConfigManager& config);

}  // namespace cgauth::service
