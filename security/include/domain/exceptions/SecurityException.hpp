#pragma once

#include <stdexcept>
#include <string>

namespace orion::security::domain {

/**
 * @brief Базовое исключение подсистемы авторизации
 */
class SecurityException : public std::runtime_error {
public:
    explicit SecurityException(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace orion::security::domain
