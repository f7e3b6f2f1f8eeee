#pragma once

#include "domain/AuthorizationContext.hpp"
#include "utils/UuidGenerator.hpp"

#include <string>
#include <vector>

namespace orion::security::testkit {

/**
 * @brief Фабрика AuthorizationContext для тестов сервисов
 *
 * Поставляется вместе с библиотекой, чтобы зависимые сервисы
 * могли использовать её в своих тестах.
 */
class TestAuthorizationContextFactory {
public:
    static constexpr const char* DEFAULT_USER_ID = "test-user-001";
    static constexpr const char* DEFAULT_TENANT_ID = "test-tenant-001";

    /// TRADER, entitlements по умолчанию
    static domain::AuthorizationContext create() {
        return create(DEFAULT_USER_ID, DEFAULT_TENANT_ID, {domain::Role::TRADER},
                      domain::Entitlements::defaults());
    }

    static domain::AuthorizationContext createWithRoles(std::vector<domain::Role> roles) {
        return create(DEFAULT_USER_ID, DEFAULT_TENANT_ID, std::move(roles),
                      domain::Entitlements::defaults());
    }

    static domain::AuthorizationContext createForTenant(const std::string& tenantId) {
        return create(DEFAULT_USER_ID, tenantId, {domain::Role::TRADER},
                      domain::Entitlements::defaults());
    }

    static domain::AuthorizationContext create(const std::string& userId,
                                               const std::string& tenantId,
                                               std::vector<domain::Role> roles,
                                               const domain::Entitlements& entitlements) {
        using observability::utils::UuidGenerator;
        return domain::AuthorizationContext(
            domain::Identity(userId, userId + "@orion.local", userId, "Test User"),
            domain::Tenant(tenantId, std::string("Test Tenant"), domain::TenantTier::STANDARD),
            std::move(roles),
            entitlements,
            "mock-jwt-token-" + UuidGenerator::generate(),
            "test-correlation-" + UuidGenerator::generate());
    }
};

} // namespace orion::security::testkit
