#pragma once

#include "domain/Entitlements.hpp"
#include "domain/Identity.hpp"
#include "domain/Role.hpp"
#include "domain/Tenant.hpp"

#include <optional>
#include <string>
#include <vector>

namespace orion::security::domain {

/**
 * @brief Контекст авторизации запроса
 *
 * Собирается один раз на границе сервиса для каждого входящего запроса,
 * только читается до конца запроса и не сохраняется. Перед использованием
 * проверяется AuthorizationContextValidator.
 */
struct AuthorizationContext {
    std::optional<Identity> identity;
    std::optional<Tenant> tenant;
    std::vector<Role> roles;                   ///< Не пустой для валидного контекста
    std::optional<Entitlements> entitlements;
    std::string token;                         ///< Исходный bearer-токен для пересылки
    std::string correlationId;

    AuthorizationContext() = default;

    AuthorizationContext(std::optional<Identity> identity,
                         std::optional<Tenant> tenant,
                         std::vector<Role> roles,
                         std::optional<Entitlements> entitlements,
                         std::string token,
                         std::string correlationId)
        : identity(std::move(identity))
        , tenant(std::move(tenant))
        , roles(std::move(roles))
        , entitlements(std::move(entitlements))
        , token(std::move(token))
        , correlationId(std::move(correlationId))
    {}
};

} // namespace orion::security::domain
