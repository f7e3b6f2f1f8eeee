#include "application/AuthorizationContextValidator.hpp"
#include "domain/exceptions/InvalidAuthorizationContextException.hpp"

#include <string>
#include <vector>

namespace orion::security::application {

namespace {

bool isBlank(const std::string& value) {
    return value.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

domain::ValidationResult AuthorizationContextValidator::validate(const domain::AuthorizationContext& context) {
    std::vector<std::string> errors;

    if (!context.identity) {
        errors.push_back("user must not be null");
    } else if (isBlank(context.identity->userId)) {
        errors.push_back("user.userId must not be null or blank");
    }

    if (!context.tenant) {
        errors.push_back("tenant must not be null (tenantId required)");
    } else if (isBlank(context.tenant->tenantId)) {
        errors.push_back("tenant.tenantId must not be null or blank");
    }

    if (context.roles.empty()) {
        errors.push_back("roles must contain at least one role");
    }

    if (!context.entitlements) {
        errors.push_back("entitlements must not be null");
    }

    return errors.empty() ? domain::ValidationResult::ok() : domain::ValidationResult::fail(errors);
}

void AuthorizationContextValidator::requireValid(const domain::AuthorizationContext& context) {
    auto result = validate(context);
    if (!result.valid) {
        throw domain::InvalidAuthorizationContextException(result.errors);
    }
}

} // namespace orion::security::application
