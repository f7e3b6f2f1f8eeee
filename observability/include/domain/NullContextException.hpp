#pragma once

#include <stdexcept>
#include <string>

namespace orion::observability::domain {

/**
 * @brief Попытка установить отсутствующий контекст корреляции
 *
 * Сигнал ошибки программиста, в нормальной работе не возникает.
 */
class NullContextException : public std::invalid_argument {
public:
    explicit NullContextException(const std::string& message = "context must not be null")
        : std::invalid_argument(message) {}
};

} // namespace orion::observability::domain
