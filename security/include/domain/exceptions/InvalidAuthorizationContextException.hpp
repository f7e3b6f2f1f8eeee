#pragma once

#include "domain/exceptions/SecurityException.hpp"

#include <string>
#include <vector>

namespace orion::security::domain {

/**
 * @brief Контекст авторизации структурно невалиден
 *
 * Содержит полный список нарушений. Запрос отклоняется с понятной
 * клиенту причиной.
 */
class InvalidAuthorizationContextException : public SecurityException {
public:
    explicit InvalidAuthorizationContextException(std::vector<std::string> errors)
        : SecurityException(buildMessage(errors))
        , errors_(std::move(errors)) {}

    const std::vector<std::string>& errors() const { return errors_; }

private:
    std::vector<std::string> errors_;

    static std::string buildMessage(const std::vector<std::string>& errors) {
        std::string message = "Invalid authorization context";
        for (size_t i = 0; i < errors.size(); ++i) {
            message += (i == 0 ? ": " : "; ") + errors[i];
        }
        return message;
    }
};

} // namespace orion::security::domain
