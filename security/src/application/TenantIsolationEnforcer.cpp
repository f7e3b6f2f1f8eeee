#include "application/TenantIsolationEnforcer.hpp"
#include "domain/exceptions/InvalidAuthorizationContextException.hpp"
#include "domain/exceptions/TenantMismatchException.hpp"
#include "logging/Logger.hpp"

namespace orion::security::application {

using observability::logging::Logger;

void TenantIsolationEnforcer::enforce(const domain::AuthorizationContext& context,
                                      const std::string& resourceTenantId) {
    if (!context.tenant) {
        throw domain::InvalidAuthorizationContextException({"tenant must not be null"});
    }

    const std::string& contextTenantId = context.tenant->tenantId;
    if (contextTenantId != resourceTenantId) {
        Logger::error("TenantIsolationEnforcer", "Cross-tenant access denied", {
            {"contextTenantId", contextTenantId},
            {"resourceTenantId", resourceTenantId},
            {"userId", context.identity ? context.identity->userId : ""}
        });
        throw domain::TenantMismatchException(contextTenantId, resourceTenantId);
    }
}

} // namespace orion::security::application
