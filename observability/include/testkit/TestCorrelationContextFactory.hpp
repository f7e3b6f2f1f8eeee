#pragma once

#include "domain/CorrelationContext.hpp"
#include "utils/UuidGenerator.hpp"

#include <string>

namespace orion::observability::testkit {

/**
 * @brief Фабрика CorrelationContext для тестов сервисов
 *
 * Значения по умолчанию детерминированы, createRandom() генерирует UUID.
 */
class TestCorrelationContextFactory {
public:
    static constexpr const char* DEFAULT_CORRELATION_ID = "test-corr-001";
    static constexpr const char* DEFAULT_TENANT_ID = "tenant-test-001";
    static constexpr const char* DEFAULT_USER_ID = "user-test-001";
    static constexpr const char* DEFAULT_REQUEST_ID = "req-test-001";

    static domain::CorrelationContext createDefault() {
        return create(DEFAULT_CORRELATION_ID, DEFAULT_TENANT_ID, DEFAULT_USER_ID, DEFAULT_REQUEST_ID);
    }

    /// Случайные correlationId и requestId, остальное по умолчанию
    static domain::CorrelationContext createRandom() {
        return create(utils::UuidGenerator::generate(), DEFAULT_TENANT_ID,
                      DEFAULT_USER_ID, utils::UuidGenerator::generate());
    }

    static domain::CorrelationContext forTenant(const std::string& tenantId) {
        return create(DEFAULT_CORRELATION_ID, tenantId, DEFAULT_USER_ID, DEFAULT_REQUEST_ID);
    }

    static domain::CorrelationContext forUser(const std::string& userId) {
        return create(DEFAULT_CORRELATION_ID, DEFAULT_TENANT_ID, userId, DEFAULT_REQUEST_ID);
    }

    static domain::CorrelationContext create(const std::string& correlationId,
                                             const std::string& tenantId,
                                             const std::string& userId,
                                             const std::string& requestId) {
        return domain::CorrelationContext(correlationId, tenantId, userId, requestId);
    }
};

} // namespace orion::observability::testkit
