#pragma once

#include "domain/exceptions/SecurityException.hpp"

#include <string>

namespace orion::security::domain {

/**
 * @brief Во входящем вызове нет заголовка с контекстом авторизации
 *
 * Вызов считается неаутентифицированным.
 */
class MissingPropagatedContextException : public SecurityException {
public:
    explicit MissingPropagatedContextException(const std::string& headerName)
        : SecurityException("Missing propagated authorization context header: " + headerName)
        , headerName_(headerName) {}

    const std::string& headerName() const { return headerName_; }

private:
    std::string headerName_;
};

} // namespace orion::security::domain
