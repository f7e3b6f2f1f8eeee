#pragma once

#include "domain/exceptions/SecurityException.hpp"

#include <string>

namespace orion::security::domain {

/**
 * @brief Запрос к ресурсу чужого тенанта
 *
 * Операция прерывается целиком, частичный доступ не допускается.
 */
class TenantMismatchException : public SecurityException {
public:
    /**
     * @param expectedTenantId тенант из контекста авторизации
     * @param actualTenantId тенант ресурса
     */
    TenantMismatchException(const std::string& expectedTenantId, const std::string& actualTenantId)
        : SecurityException("Tenant mismatch: context tenant '" + expectedTenantId
                            + "' cannot access resource of tenant '" + actualTenantId + "'")
        , expectedTenantId_(expectedTenantId)
        , actualTenantId_(actualTenantId) {}

    const std::string& expectedTenantId() const { return expectedTenantId_; }
    const std::string& actualTenantId() const { return actualTenantId_; }

private:
    std::string expectedTenantId_;
    std::string actualTenantId_;
};

} // namespace orion::security::domain
