#pragma once

#include "domain/AuthorizationContext.hpp"
#include "domain/ValidationResult.hpp"

namespace orion::security::application {

/**
 * @brief Структурная проверка контекста авторизации
 *
 * Проверки независимы, за один проход собираются все нарушения:
 * - identity есть и userId не пустой
 * - tenant есть и tenantId не пустой
 * - роли не пустые
 * - entitlements есть
 */
class AuthorizationContextValidator {
public:
    static domain::ValidationResult validate(const domain::AuthorizationContext& context);

    /**
     * @brief То же, что validate(), но с исключением
     * @throws domain::InvalidAuthorizationContextException со всеми нарушениями
     */
    static void requireValid(const domain::AuthorizationContext& context);
};

} // namespace orion::security::application
