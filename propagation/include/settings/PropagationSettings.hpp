#pragma once

#include "domain/RpcMetadata.hpp"

#include <cstdlib>
#include <string>

namespace orion::propagation::settings {

/**
 * @brief Имена заголовков для передачи контекста между сервисами
 *
 * Читает из ENV:
 * - ORION_AUTH_CONTEXT_HEADER (default: "x-orion-auth-context")
 * - ORION_CORRELATION_HEADER (default: "x-correlation-id")
 * - ORION_TENANT_HEADER (default: "x-tenant-id")
 * - ORION_REQUEST_ID_HEADER (default: "x-request-id")
 */
class PropagationSettings {
public:
    PropagationSettings() {
        authContextHeader_ = headerFromEnv("ORION_AUTH_CONTEXT_HEADER", "x-orion-auth-context");
        correlationHeader_ = headerFromEnv("ORION_CORRELATION_HEADER", "x-correlation-id");
        tenantHeader_ = headerFromEnv("ORION_TENANT_HEADER", "x-tenant-id");
        requestIdHeader_ = headerFromEnv("ORION_REQUEST_ID_HEADER", "x-request-id");
    }

    std::string getAuthContextHeader() const { return authContextHeader_; }
    std::string getCorrelationHeader() const { return correlationHeader_; }
    std::string getTenantHeader() const { return tenantHeader_; }
    std::string getRequestIdHeader() const { return requestIdHeader_; }

private:
    std::string authContextHeader_;
    std::string correlationHeader_;
    std::string tenantHeader_;
    std::string requestIdHeader_;

    static std::string headerFromEnv(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        if (!value || std::string(value).empty()) {
            return defaultValue;
        }
        return domain::toLowerCase(value);
    }
};

} // namespace orion::propagation::settings
