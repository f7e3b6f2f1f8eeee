#include "application/ContextPropagator.hpp"
#include "adapters/AuthorizationContextSerializer.hpp"
#include "context/CorrelationContextHolder.hpp"
#include "logging/Logger.hpp"
#include "utils/UuidGenerator.hpp"

#include <stdexcept>

namespace orion::propagation::application {

using observability::context::CorrelationContextHolder;
using observability::domain::CorrelationContext;
using observability::logging::Logger;
using security::adapters::AuthorizationContextSerializer;

namespace {

bool isBlank(const std::string& value) {
    return value.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::optional<std::string> nonBlankHeader(const domain::RpcMetadata& metadata, const std::string& name) {
    auto value = domain::findHeader(metadata, name);
    if (!value || isBlank(*value)) {
        return std::nullopt;
    }
    return value;
}

} // namespace

ContextPropagator::ContextPropagator(std::shared_ptr<settings::PropagationSettings> settings)
    : settings_(std::move(settings))
{
    if (!settings_) {
        throw std::invalid_argument("settings must not be null");
    }
    Logger::info("ContextPropagator", "Created, auth header: " + settings_->getAuthContextHeader());
}

void ContextPropagator::inject(const security::domain::AuthorizationContext& context,
                               domain::RpcMetadata& metadata) const {
    metadata[settings_->getAuthContextHeader()] = AuthorizationContextSerializer::encode(context);
    if (!context.correlationId.empty()) {
        metadata[settings_->getCorrelationHeader()] = context.correlationId;
    }
    metadata[settings_->getTenantHeader()] = context.tenant->tenantId;
}

void ContextPropagator::inject(const CorrelationContext& context, domain::RpcMetadata& metadata) const {
    metadata[settings_->getCorrelationHeader()] = context.correlationId();
    if (context.tenantId()) {
        metadata[settings_->getTenantHeader()] = *context.tenantId();
    }
    if (context.requestId()) {
        metadata[settings_->getRequestIdHeader()] = *context.requestId();
    }
}

bool ContextPropagator::injectCurrent(domain::RpcMetadata& metadata) const {
    auto current = CorrelationContextHolder::get();
    if (!current) {
        return false;
    }
    inject(*current, metadata);
    return true;
}

security::domain::PropagatedContext ContextPropagator::extract(const domain::RpcMetadata& metadata) const {
    const auto& header = settings_->getAuthContextHeader();
    return AuthorizationContextSerializer::decode(domain::findHeader(metadata, header), header);
}

CorrelationContext ContextPropagator::extractCorrelation(const domain::RpcMetadata& metadata) const {
    auto correlationId = nonBlankHeader(metadata, settings_->getCorrelationHeader());
    if (!correlationId) {
        correlationId = observability::utils::UuidGenerator::generate();
    }
    return CorrelationContext(
        *correlationId,
        nonBlankHeader(metadata, settings_->getTenantHeader()),
        std::nullopt,
        nonBlankHeader(metadata, settings_->getRequestIdHeader()));
}

} // namespace orion::propagation::application
