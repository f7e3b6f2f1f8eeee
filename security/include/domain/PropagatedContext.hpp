#pragma once

#include "domain/Role.hpp"

#include <string>
#include <vector>

namespace orion::security::domain {

/**
 * @brief Часть контекста авторизации, передаваемая между сервисами
 *
 * Entitlements и токен намеренно не передаются, чтобы заголовок
 * оставался маленьким.
 */
struct PropagatedContext {
    std::string userId;
    std::string tenantId;
    std::vector<Role> roles;
    std::string correlationId;
};

} // namespace orion::security::domain
