#pragma once

#include "domain/exceptions/SecurityException.hpp"

#include <string>

namespace orion::security::domain {

/**
 * @brief Заголовок с контекстом есть, но не декодируется
 */
class SerializationException : public SecurityException {
public:
    explicit SerializationException(const std::string& message)
        : SecurityException(message) {}
};

} // namespace orion::security::domain
