#pragma once

#include "domain/StatusCode.hpp"

#include <exception>
#include <utility>

namespace orion::propagation::adapters::primary {

/**
 * @brief Отображение исключений на статус транспорта
 *
 * - TenantMismatchException -> PERMISSION_DENIED
 * - InvalidAuthorizationContextException -> INVALID_ARGUMENT
 * - MissingPropagatedContextException, SerializationException -> UNAUTHENTICATED
 * - std::invalid_argument -> INVALID_ARGUMENT
 * - std::logic_error -> FAILED_PRECONDITION
 * - остальное -> INTERNAL без деталей для клиента
 */
class ErrorStatusMapper {
public:
    static domain::Status map(const std::exception& error);

    /// Для использования в catch (...): неизвестные исключения -> INTERNAL
    static domain::Status map(std::exception_ptr error);

    /**
     * @brief Выполнить обработчик и вернуть статус вместо исключения
     */
    template <typename Handler>
    static domain::Status invoke(Handler&& handler) {
        try {
            std::forward<Handler>(handler)();
            return {domain::StatusCode::OK, ""};
        } catch (...) {
            return map(std::current_exception());
        }
    }
};

} // namespace orion::propagation::adapters::primary
