#include "adapters/primary/ErrorStatusMapper.hpp"
#include "domain/NullContextException.hpp"
#include "domain/exceptions/InvalidAuthorizationContextException.hpp"
#include "domain/exceptions/MissingPropagatedContextException.hpp"
#include "domain/exceptions/SerializationException.hpp"
#include "domain/exceptions/TenantMismatchException.hpp"
#include "logging/Logger.hpp"

#include <stdexcept>

namespace orion::propagation::adapters::primary {

using observability::logging::Logger;
namespace sec = security::domain;

namespace {

const char* COMPONENT = "ErrorStatusMapper";

domain::Status internalError(const std::string& detail) {
    Logger::error(COMPONENT, "Internal error: " + detail);
    return {domain::StatusCode::INTERNAL, "Internal server error"};
}

} // namespace

domain::Status ErrorStatusMapper::map(const std::exception& error) {
    if (dynamic_cast<const sec::TenantMismatchException*>(&error)) {
        return {domain::StatusCode::PERMISSION_DENIED, error.what()};
    }
    if (dynamic_cast<const sec::InvalidAuthorizationContextException*>(&error)) {
        Logger::warn(COMPONENT, std::string("Rejected request: ") + error.what());
        return {domain::StatusCode::INVALID_ARGUMENT, error.what()};
    }
    if (dynamic_cast<const sec::MissingPropagatedContextException*>(&error)
        || dynamic_cast<const sec::SerializationException*>(&error)) {
        Logger::warn(COMPONENT, std::string("Unauthenticated call: ") + error.what());
        return {domain::StatusCode::UNAUTHENTICATED, error.what()};
    }
    if (dynamic_cast<const observability::domain::NullContextException*>(&error)) {
        return internalError(error.what());
    }
    if (dynamic_cast<const std::invalid_argument*>(&error)) {
        Logger::warn(COMPONENT, std::string("Bad request: ") + error.what());
        return {domain::StatusCode::INVALID_ARGUMENT, error.what()};
    }
    if (dynamic_cast<const std::logic_error*>(&error)) {
        Logger::warn(COMPONENT, std::string("Failed precondition: ") + error.what());
        return {domain::StatusCode::FAILED_PRECONDITION, error.what()};
    }
    return internalError(error.what());
}

domain::Status ErrorStatusMapper::map(std::exception_ptr error) {
    if (!error) {
        return {domain::StatusCode::OK, ""};
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return map(e);
    } catch (...) {
        return internalError("non-standard exception");
    }
}

} // namespace orion::propagation::adapters::primary
