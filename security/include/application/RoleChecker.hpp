#pragma once

#include "domain/AuthorizationContext.hpp"
#include "domain/Role.hpp"

#include <algorithm>
#include <initializer_list>
#include <vector>

namespace orion::security::application {

/**
 * @brief Проверка ролей (RBAC) с учётом иерархии
 *
 * Пример: пользователь с ADMIN проходит hasRole(..., TRADER),
 * так как ADMIN включает TRADER.
 */
class RoleChecker {
public:
    static bool hasRole(const std::vector<domain::Role>& held, domain::Role required) {
        return std::any_of(held.begin(), held.end(),
                           [required](domain::Role role) { return domain::implies(role, required); });
    }

    /// Есть хотя бы одна из требуемых ролей
    static bool hasAnyRole(const std::vector<domain::Role>& held,
                           std::initializer_list<domain::Role> required) {
        return std::any_of(required.begin(), required.end(),
                           [&held](domain::Role role) { return hasRole(held, role); });
    }

    /// Есть все требуемые роли
    static bool hasAllRoles(const std::vector<domain::Role>& held,
                            std::initializer_list<domain::Role> required) {
        return std::all_of(required.begin(), required.end(),
                           [&held](domain::Role role) { return hasRole(held, role); });
    }

    static bool hasRole(const domain::AuthorizationContext& context, domain::Role required) {
        return hasRole(context.roles, required);
    }

    static bool hasAnyRole(const domain::AuthorizationContext& context,
                           std::initializer_list<domain::Role> required) {
        return hasAnyRole(context.roles, required);
    }

    static bool hasAllRoles(const domain::AuthorizationContext& context,
                            std::initializer_list<domain::Role> required) {
        return hasAllRoles(context.roles, required);
    }
};

} // namespace orion::security::application
