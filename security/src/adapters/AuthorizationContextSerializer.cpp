#include "adapters/AuthorizationContextSerializer.hpp"
#include "domain/exceptions/MissingPropagatedContextException.hpp"
#include "domain/exceptions/SerializationException.hpp"
#include "logging/Logger.hpp"
#include "utils/Base64.hpp"

#include <nlohmann/json.hpp>

namespace orion::security::adapters {

using observability::logging::Logger;

namespace {

bool isBlank(const std::string& value) {
    return value.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string requireString(const nlohmann::json& payload, const char* field) {
    if (!payload.contains(field) || !payload[field].is_string()) {
        throw domain::SerializationException(
            std::string("Propagated authorization context is missing '") + field + "'");
    }
    return payload[field].get<std::string>();
}

} // namespace

std::string AuthorizationContextSerializer::encode(const domain::AuthorizationContext& context) {
    if (!context.identity || !context.tenant) {
        throw domain::SerializationException(
            "Failed to serialize authorization context: identity and tenant are required");
    }

    nlohmann::json payload;
    payload["userId"] = context.identity->userId;
    payload["tenantId"] = context.tenant->tenantId;
    payload["correlationId"] = context.correlationId;
    payload["roles"] = nlohmann::json::array();
    for (auto role : context.roles) {
        payload["roles"].push_back(domain::toString(role));
    }

    return utils::Base64::encode(payload.dump());
}

domain::PropagatedContext AuthorizationContextSerializer::decode(const std::optional<std::string>& encoded,
                                                                 const std::string& headerName) {
    if (!encoded || isBlank(*encoded)) {
        throw domain::MissingPropagatedContextException(headerName);
    }

    nlohmann::json payload;
    try {
        payload = nlohmann::json::parse(utils::Base64::decode(*encoded));
    } catch (const std::invalid_argument& e) {
        throw domain::SerializationException(
            std::string("Failed to deserialize authorization context: ") + e.what());
    } catch (const nlohmann::json::exception& e) {
        throw domain::SerializationException(
            std::string("Failed to deserialize authorization context: ") + e.what());
    }

    if (!payload.is_object()) {
        throw domain::SerializationException("Propagated authorization context must be a JSON object");
    }

    domain::PropagatedContext result;
    result.userId = requireString(payload, "userId");
    result.tenantId = requireString(payload, "tenantId");
    if (payload.contains("correlationId") && payload["correlationId"].is_string()) {
        result.correlationId = payload["correlationId"].get<std::string>();
    }

    if (payload.contains("roles") && payload["roles"].is_array()) {
        for (const auto& item : payload["roles"]) {
            if (!item.is_string()) {
                continue;
            }
            auto name = item.get<std::string>();
            if (auto role = domain::roleFromString(name)) {
                result.roles.push_back(*role);
            } else {
                Logger::warn("AuthorizationContextSerializer", "Ignoring unknown role: " + name);
            }
        }
    }
    return result;
}

} // namespace orion::security::adapters
