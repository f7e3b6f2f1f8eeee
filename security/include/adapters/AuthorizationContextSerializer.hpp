#pragma once

#include "domain/AuthorizationContext.hpp"
#include "domain/PropagatedContext.hpp"

#include <optional>
#include <string>

namespace orion::security::adapters {

/**
 * @brief Сериализация контекста авторизации для метаданных RPC
 *
 * Передаётся минимальное подмножество: userId, tenantId, роли, correlationId.
 * Формат: JSON -> Base64, чтобы значение было ASCII-безопасным.
 *
 * Пример payload до Base64:
 * {"correlationId":"c-1","roles":["ROLE_SALES"],"tenantId":"t-1","userId":"u-1"}
 */
class AuthorizationContextSerializer {
public:
    /// Имя заголовка по умолчанию
    static constexpr const char* HEADER_NAME = "x-orion-auth-context";

    /**
     * @throws domain::SerializationException если в контексте нет identity или tenant
     */
    static std::string encode(const domain::AuthorizationContext& context);

    /**
     * @brief Восстановить переданное подмножество контекста
     *
     * Неизвестные имена ролей пропускаются с предупреждением в логе.
     *
     * @param encoded значение заголовка (nullopt если заголовка нет)
     * @param headerName имя заголовка для диагностики
     * @throws domain::MissingPropagatedContextException если заголовка нет или он пустой
     * @throws domain::SerializationException если значение не Base64 или не JSON нужной формы
     */
    static domain::PropagatedContext decode(const std::optional<std::string>& encoded,
                                            const std::string& headerName = HEADER_NAME);
};

} // namespace orion::security::adapters
