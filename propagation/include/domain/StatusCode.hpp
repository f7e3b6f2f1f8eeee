#pragma once

#include <string>

namespace orion::propagation::domain {

/**
 * @brief Коды статуса транспорта (подмножество кодов gRPC)
 */
enum class StatusCode {
    OK,
    INVALID_ARGUMENT,
    FAILED_PRECONDITION,
    UNAUTHENTICATED,
    PERMISSION_DENIED,
    INTERNAL
};

inline std::string toString(StatusCode code) {
    switch (code) {
        case StatusCode::OK:                  return "OK";
        case StatusCode::INVALID_ARGUMENT:    return "INVALID_ARGUMENT";
        case StatusCode::FAILED_PRECONDITION: return "FAILED_PRECONDITION";
        case StatusCode::UNAUTHENTICATED:     return "UNAUTHENTICATED";
        case StatusCode::PERMISSION_DENIED:   return "PERMISSION_DENIED";
        case StatusCode::INTERNAL:            return "INTERNAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Статус ответа с описанием для клиента
 */
struct Status {
    StatusCode code = StatusCode::OK;
    std::string description;
};

} // namespace orion::propagation::domain
