#pragma once

#include "domain/AuthorizationContext.hpp"

#include <string>

namespace orion::security::application {

/**
 * @brief Изоляция тенантов
 *
 * Вызывается каждой операцией над данными тенанта до обращения к ним.
 * Это проверка, а не фильтр: при несовпадении операция прерывается,
 * результат не сужается молча. Несовпадение пишется в аудит-лог
 * с обоими ID тенантов.
 */
class TenantIsolationEnforcer {
public:
    /**
     * @param context контекст авторизации запроса
     * @param resourceTenantId тенант ресурса
     * @throws domain::TenantMismatchException если тенанты различаются
     * @throws domain::InvalidAuthorizationContextException если в контексте нет тенанта
     */
    static void enforce(const domain::AuthorizationContext& context, const std::string& resourceTenantId);
};

} // namespace orion::security::application
