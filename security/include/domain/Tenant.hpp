#pragma once

#include "domain/TenantTier.hpp"

#include <optional>
#include <string>

namespace orion::security::domain {

/**
 * @brief Организация-владелец данных
 */
struct Tenant {
    std::string tenantId;                   ///< claim 'tenant_id'
    std::optional<std::string> tenantName;
    TenantTier tenantTier = TenantTier::STANDARD;

    Tenant() = default;

    Tenant(std::string tenantId,
           std::optional<std::string> tenantName,
           TenantTier tenantTier)
        : tenantId(std::move(tenantId))
        , tenantName(std::move(tenantName))
        , tenantTier(tenantTier)
    {}
};

} // namespace orion::security::domain
